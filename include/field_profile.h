/**
 * @file field_profile.h
 * @brief One-call profiling of a field or of every field in a file.
 */

#ifndef CSVPROF_FIELD_PROFILE_H
#define CSVPROF_FIELD_PROFILE_H

#include "dialect.h"
#include "error.h"
#include "field_statistics.h"
#include "frequency_scanner.h"
#include "value_classifier.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace csvprof {

/**
 * @brief Read-only result for one field.
 *
 * min_value, max_value and min_length are empty when the field has no known
 * values.
 */
struct FieldProfile {
    size_t field_number = 0;
    std::string name;
    ValueType type = ValueType::UNKNOWN;
    bool type_inferred = false;      ///< false when the caller declared the type
    FieldCase field_case = FieldCase::UNKNOWN;
    std::optional<std::string> min_value;
    std::optional<std::string> max_value;
    std::optional<size_t> min_length;
    size_t max_length = 0;
    size_t distinct_count = 0;
    size_t unknown_count = 0;
    size_t records_scanned = 0;
    bool truncated = false;
    FrequencyMap freq;
};

class FieldProfiler {
public:
    explicit FieldProfiler(const ValueClassifier& classifier,
                           const StatisticsOptions& options = StatisticsOptions());

    /**
     * @brief Profile field_number (0-based) of a file.
     *
     * @param declared_type Type to use for min/max and case; inferred from
     *                      the frequency map when empty
     * @throws IoError if the file cannot be read
     * @throws std::out_of_range if the header has no such field
     */
    FieldProfile profile_field(const std::string& path, size_t field_number,
                               const ScanOptions& options,
                               std::optional<ValueType> declared_type = std::nullopt,
                               ErrorCollector* errors = nullptr) const;

    /// Profile already collected frequencies; no file access.
    FieldProfile profile_values(const std::string& name, const FieldFrequency& frequency,
                                std::optional<ValueType> declared_type = std::nullopt) const;

    /**
     * @brief Profile every field of a file, one pass per field.
     *
     * Runs detector.analyze() if it has not run yet.
     */
    std::vector<FieldProfile> profile_file(DialectDetector& detector,
                                           size_t max_freq_size = MAX_FREQ_SIZE_DEFAULT,
                                           ErrorCollector* errors = nullptr) const;

private:
    FieldStatistics stats_;
};

} // namespace csvprof

#endif // CSVPROF_FIELD_PROFILE_H
