/**
 * @file field_statistics.h
 * @brief Case, min/max, length and type statistics over one field's values.
 *
 * Every operation accepts either a plain list of values or a FrequencyMap.
 * For a map only the keys are looked at, except by infer_type(), which
 * weights each key by its count. Unknown values (as decided by the
 * classifier) never take part in a statistic.
 */

#ifndef CSVPROF_FIELD_STATISTICS_H
#define CSVPROF_FIELD_STATISTICS_H

#include "frequency_scanner.h"
#include "value_classifier.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvprof {

enum class FieldCase : uint8_t {
  MIXED = 0,
  LOWER = 1,
  UPPER = 2,
  UNKNOWN = 3,
  NOT_APPLICABLE = 4
};

inline const char* field_case_to_string(FieldCase c) {
  switch (c) {
    case FieldCase::MIXED:          return "mixed";
    case FieldCase::LOWER:          return "lower";
    case FieldCase::UPPER:          return "upper";
    case FieldCase::UNKNOWN:        return "unknown";
    case FieldCase::NOT_APPLICABLE: return "n/a";
  }
  return "unknown";
}

struct StatisticsOptions {
  /// Share of known values a type needs to be inferred for the field
  double type_threshold = 0.9;

  static StatisticsOptions defaults() { return StatisticsOptions(); }
};

/**
 * @brief Tally of value classifications, weighted by occurrence.
 */
struct ValueTypeStats {
  size_t total_count = 0;
  size_t unknown_count = 0;
  size_t integer_count = 0;
  size_t float_count = 0;
  size_t timestamp_count = 0;
  size_t string_count = 0;

  void add(ValueType type, size_t n = 1) {
    total_count += n;
    switch (type) {
      case ValueType::UNKNOWN:   unknown_count += n; break;
      case ValueType::INTEGER:   integer_count += n; break;
      case ValueType::FLOAT:     float_count += n; break;
      case ValueType::TIMESTAMP: timestamp_count += n; break;
      case ValueType::STRING:    string_count += n; break;
    }
  }

  ValueType dominant_type(double threshold = 0.9) const {
    size_t known = total_count - unknown_count;
    if (known == 0) return ValueType::UNKNOWN;

    // Priority order: INTEGER > FLOAT > TIMESTAMP > STRING
    if (static_cast<double>(integer_count) / known >= threshold)
      return ValueType::INTEGER;

    // Integers are valid floats
    if (static_cast<double>(float_count + integer_count) / known >= threshold)
      return ValueType::FLOAT;

    if (static_cast<double>(timestamp_count) / known >= threshold)
      return ValueType::TIMESTAMP;

    return ValueType::STRING;
  }
};

/**
 * @brief Statistics engine for one field.
 *
 * Holds a reference to the classifier, which must outlive this object.
 */
class FieldStatistics {
public:
  explicit FieldStatistics(const ValueClassifier& classifier,
                           const StatisticsOptions& options = StatisticsOptions());

  /**
   * @brief Letter case of a string field.
   *
   * Returns NOT_APPLICABLE for any type other than STRING without looking
   * at the values. Numbers and unknown values do not vote.
   */
  FieldCase get_case(ValueType type, const std::vector<std::string>& values) const;
  FieldCase get_case(ValueType type, const FrequencyMap& values) const;

  /**
   * @brief Smallest value under the type's ordering.
   *
   * INTEGER and FLOAT compare numerically and are re-rendered as strings;
   * other types compare bytewise. Values that do not convert to the type
   * are left out.
   *
   * @return std::nullopt when no value is left
   */
  std::optional<std::string> get_min(ValueType type, const std::vector<std::string>& values) const;
  std::optional<std::string> get_min(ValueType type, const FrequencyMap& values) const;

  /// Largest value; see get_min().
  std::optional<std::string> get_max(ValueType type, const std::vector<std::string>& values) const;
  std::optional<std::string> get_max(ValueType type, const FrequencyMap& values) const;

  /// Longest known value in bytes, 0 if there is none.
  size_t get_max_length(const std::vector<std::string>& values) const;
  size_t get_max_length(const FrequencyMap& values) const;

  /// Shortest known value in bytes, std::nullopt if there is none.
  std::optional<size_t> get_min_length(const std::vector<std::string>& values) const;
  std::optional<size_t> get_min_length(const FrequencyMap& values) const;

  /// Type of the field, see ValueTypeStats::dominant_type().
  ValueType infer_type(const std::vector<std::string>& values) const;
  ValueType infer_type(const FrequencyMap& values) const;

  /// Number of unknown values (weighted by count for a map)
  size_t count_unknown(const std::vector<std::string>& values) const;
  size_t count_unknown(const FrequencyMap& values) const;

  const ValueClassifier& classifier() const { return classifier_; }

private:
  const ValueClassifier& classifier_;
  StatisticsOptions options_;

  FieldCase case_of(ValueType type, const std::vector<std::string_view>& values) const;
  std::optional<std::string> extreme(ValueType type, const std::vector<std::string_view>& values,
                                     bool want_max) const;
  std::optional<size_t> length_bound(const std::vector<std::string_view>& values,
                                     bool want_max) const;
};

/// Render a double the way the statistics report it: shortest round-trip
/// form, with ".0" appended to whole numbers.
std::string format_float(double value);

} // namespace csvprof

#endif // CSVPROF_FIELD_STATISTICS_H
