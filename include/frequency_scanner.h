/**
 * @file frequency_scanner.h
 * @brief Bounded value-frequency collection for a single field.
 */

#ifndef CSVPROF_FREQUENCY_SCANNER_H
#define CSVPROF_FREQUENCY_SCANNER_H

#include "dialect.h"
#include "error.h"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

namespace csvprof {

/// Distinct value -> number of records holding it
using FrequencyMap = std::unordered_map<std::string, size_t>;

constexpr size_t MAX_FREQ_SIZE_DEFAULT = 10000;

struct ScanOptions {
    Dialect dialect;
    bool has_header = false;
    size_t max_freq_size = MAX_FREQ_SIZE_DEFAULT;

    static ScanOptions for_delimiter(char delimiter, bool has_header = false,
                                     size_t max_freq_size = MAX_FREQ_SIZE_DEFAULT) {
        ScanOptions options;
        options.dialect = Dialect::with_delimiter(delimiter);
        options.has_header = has_header;
        options.max_freq_size = max_freq_size;
        return options;
    }

    /// Scan options matching an analyzed file
    static ScanOptions from_info(const DialectInfo& info,
                                 size_t max_freq_size = MAX_FREQ_SIZE_DEFAULT) {
        ScanOptions options;
        options.dialect = info.dialect;
        options.has_header = info.has_header;
        options.max_freq_size = max_freq_size;
        return options;
    }
};

/**
 * @brief Frequency distribution of one field.
 *
 * Invariant: the counts in freq sum to records_scanned. When truncated is
 * set the scan stopped early and freq covers only the records before the
 * stop point.
 */
struct FieldFrequency {
    FrequencyMap freq;
    bool truncated = false;
    size_t records_scanned = 0;  ///< Data records counted into freq
    size_t short_records = 0;    ///< Data records without the requested field
};

/**
 * @brief Collect the value frequencies of field_number (0-based).
 *
 * Reads the input once, front to back. The header record is skipped when
 * options.has_header is set. The scan stops as soon as freq holds
 * options.max_freq_size distinct values; the record that reaches the limit
 * is counted.
 *
 * @param errors Optional sink for FREQ_TRUNCATED, INCONSISTENT_FIELD_COUNT
 *               and UNCLOSED_QUOTE diagnostics
 * @throws IoError if the file cannot be opened or read
 */
FieldFrequency get_field_freq(const std::string& path, size_t field_number,
                              const ScanOptions& options,
                              ErrorCollector* errors = nullptr);

/// Same as above on an already open stream, which is left open.
FieldFrequency get_field_freq(std::istream& in, size_t field_number,
                              const ScanOptions& options,
                              ErrorCollector* errors = nullptr);

/// Positional-argument form.
FieldFrequency get_field_freq(const std::string& path, size_t field_number,
                              bool has_header, char delimiter,
                              size_t max_freq_size = MAX_FREQ_SIZE_DEFAULT);

/**
 * @brief Name of field_number (0-based), read from the first record only.
 *
 * The first record is the one get_field_freq skips as the header: leading
 * blank lines are passed over and any line terminator ends it. With a header
 * the name is the field's value in that record. Without a header the name is
 * "field_num_<field_number>".
 *
 * @return std::nullopt for a file with no records
 * @throws std::out_of_range if the header has no such field
 * @throws IoError if the file cannot be opened or read
 */
std::optional<std::string> get_field_name(const std::string& path, size_t field_number,
                                          bool has_header, const Dialect& dialect);

std::optional<std::string> get_field_name(std::istream& in, size_t field_number,
                                          bool has_header, const Dialect& dialect);

std::optional<std::string> get_field_name(const std::string& path, size_t field_number,
                                          bool has_header, char delimiter);

} // namespace csvprof

#endif // CSVPROF_FREQUENCY_SCANNER_H
