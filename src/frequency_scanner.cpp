#include "frequency_scanner.h"

#include "io_util.h"
#include "record_reader.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace csvprof {

namespace {

std::string synthesized_name(size_t field_number) {
    return "field_num_" + std::to_string(field_number);
}

} // namespace

FieldFrequency get_field_freq(std::istream& in, size_t field_number,
                              const ScanOptions& options, ErrorCollector* errors) {
    FieldFrequency result;
    RecordReader reader(in, options.dialect, errors);
    std::vector<std::string> fields;

    if (options.has_header && !reader.next(fields)) {
        return result;
    }

    while (reader.next(fields)) {
        if (field_number >= fields.size()) {
            ++result.short_records;
            if (errors != nullptr) {
                errors->add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR,
                                  reader.records_read(), field_number + 1, reader.bytes_read(),
                                  "record has " + std::to_string(fields.size()) +
                                      " fields, skipped");
                if (errors->should_stop()) {
                    break;
                }
            }
            continue;
        }

        ++result.freq[fields[field_number]];
        ++result.records_scanned;

        if (result.freq.size() >= options.max_freq_size) {
            result.truncated = true;
            if (errors != nullptr) {
                errors->add_error(ErrorCode::FREQ_TRUNCATED, ErrorSeverity::WARNING,
                                  reader.records_read(), field_number + 1, reader.bytes_read(),
                                  "frequency distribution reached " +
                                      std::to_string(options.max_freq_size) +
                                      " distinct values, scan stopped");
            }
            break;
        }
    }
    return result;
}

FieldFrequency get_field_freq(const std::string& path, size_t field_number,
                              const ScanOptions& options, ErrorCollector* errors) {
    std::ifstream in = open_input(path);
    FieldFrequency result = get_field_freq(in, field_number, options, errors);
    if (in.bad()) {
        throw IoError(path, "could not read the data");
    }
    return result;
}

FieldFrequency get_field_freq(const std::string& path, size_t field_number,
                              bool has_header, char delimiter, size_t max_freq_size) {
    return get_field_freq(path, field_number,
                          ScanOptions::for_delimiter(delimiter, has_header, max_freq_size));
}

std::optional<std::string> get_field_name(std::istream& in, size_t field_number,
                                          bool has_header, const Dialect& dialect) {
    // Same first record get_field_freq skips as the header
    RecordReader reader(in, dialect);
    std::vector<std::string> fields;
    if (!reader.next(fields)) {
        return std::nullopt;
    }
    if (!has_header) {
        return synthesized_name(field_number);
    }
    if (field_number >= fields.size()) {
        throw std::out_of_range("header has " + std::to_string(fields.size()) +
                                " fields, no field number " + std::to_string(field_number));
    }
    return fields[field_number];
}

std::optional<std::string> get_field_name(const std::string& path, size_t field_number,
                                          bool has_header, const Dialect& dialect) {
    std::ifstream in = open_input(path);
    std::optional<std::string> name = get_field_name(in, field_number, has_header, dialect);
    if (in.bad()) {
        throw IoError(path, "could not read the data");
    }
    return name;
}

std::optional<std::string> get_field_name(const std::string& path, size_t field_number,
                                          bool has_header, char delimiter) {
    return get_field_name(path, field_number, has_header, Dialect::with_delimiter(delimiter));
}

} // namespace csvprof
