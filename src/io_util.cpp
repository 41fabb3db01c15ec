#include "io_util.h"
#include "error.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

namespace csvprof {

std::ifstream open_input(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IoError(path, "is a directory");
    }

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        int err = errno;
        throw IoError(path, err != 0 ? std::strerror(err) : "could not open file");
    }
    return in;
}

std::string read_sample(const std::string& path, size_t max_bytes) {
    std::ifstream in = open_input(path);

    std::string sample(max_bytes, '\0');
    in.read(&sample[0], static_cast<std::streamsize>(max_bytes));
    if (in.bad()) {
        throw IoError(path, "could not read the data");
    }
    size_t got = static_cast<size_t>(in.gcount());
    bool more = got == max_bytes && in.peek() != std::char_traits<char>::eof();
    sample.resize(got);

    if (more) {
        size_t last = sample.find_last_of("\r\n");
        if (last != std::string::npos) {
            sample.resize(last + 1);
        }
    }
    return sample;
}

} // namespace csvprof
