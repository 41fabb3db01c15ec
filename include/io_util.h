/**
 * @file io_util.h
 * @brief File opening helpers shared by the scanners.
 *
 * Every function here either returns a usable stream or throws IoError;
 * none of them swallow a failure.
 */

#ifndef CSVPROF_IO_UTIL_H
#define CSVPROF_IO_UTIL_H

#include <cstddef>
#include <fstream>
#include <string>

namespace csvprof {

/**
 * @brief Open a file for sequential binary reading.
 *
 * The returned stream closes itself when it goes out of scope.
 *
 * @throws IoError if the file does not exist, is a directory, or cannot be
 *         opened (the message carries the strerror text).
 */
std::ifstream open_input(const std::string& path);

/**
 * @brief Read up to max_bytes from the start of a file.
 *
 * The sample is cut back to the last line terminator when the file is
 * longer than max_bytes, so the last record in the sample is complete
 * unless a single line is longer than the sample.
 *
 * @throws IoError on open or read failure.
 */
std::string read_sample(const std::string& path, size_t max_bytes);

} // namespace csvprof

#endif // CSVPROF_IO_UTIL_H
