/**
 * @file value_classifier.h
 * @brief Classification of single field values.
 *
 * A value is checked in a fixed order: unknown, integer, float, timestamp,
 * and falls through to string. Statistics code depends on the abstract
 * ValueClassifier only, so an alternate classifier (for instance one with
 * locale-aware number parsing) can be passed in its place.
 */

#ifndef CSVPROF_VALUE_CLASSIFIER_H
#define CSVPROF_VALUE_CLASSIFIER_H

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace csvprof {

enum class ValueType : uint8_t {
  UNKNOWN = 0,
  INTEGER = 1,
  FLOAT = 2,
  TIMESTAMP = 3,
  STRING = 4
};

inline const char* value_type_to_string(ValueType type) {
  switch (type) {
    case ValueType::UNKNOWN:   return "unknown";
    case ValueType::INTEGER:   return "integer";
    case ValueType::FLOAT:     return "float";
    case ValueType::TIMESTAMP: return "timestamp";
    case ValueType::STRING:    return "string";
  }
  return "unknown";
}

/**
 * @brief Parse a value type name ("integer", "float", "string", "timestamp",
 * "unknown").
 * @throws std::invalid_argument for any other name.
 */
ValueType parse_value_type(std::string_view name);

struct ClassifierOptions {
  /// Markers for missing data, compared case-insensitively to the trimmed value
  std::set<std::string> unknown_markers = {"na", "n/a", "unk", "unknown", "none", "null"};
  bool trim_whitespace = true;

  static ClassifierOptions defaults() { return ClassifierOptions(); }
};

/**
 * @brief Interface for per-value type checks.
 *
 * Implementations must be free of observable side effects.
 */
class ValueClassifier {
public:
  virtual ~ValueClassifier() = default;

  virtual bool is_unknown(std::string_view value) const = 0;
  virtual bool is_integer(std::string_view value) const = 0;
  virtual bool is_float(std::string_view value) const = 0;
  virtual bool is_timestamp(std::string_view value) const = 0;

  /// First matching type in the order unknown, integer, float, timestamp, string.
  ValueType classify(std::string_view value) const {
    if (is_unknown(value)) return ValueType::UNKNOWN;
    if (is_integer(value)) return ValueType::INTEGER;
    if (is_float(value)) return ValueType::FLOAT;
    if (is_timestamp(value)) return ValueType::TIMESTAMP;
    return ValueType::STRING;
  }
};

/**
 * @brief Default classifier.
 *
 * Integers are an optional sign and digits that fit in int64_t. Floats are
 * anything fast_float parses completely that is not an integer. Timestamps
 * are the formats below, with calendar validation:
 * - ISO date: YYYY-MM-DD or YYYY/MM/DD
 * - US date: MM/DD/YYYY or MM-DD-YYYY
 * - EU date: DD/MM/YYYY or DD-MM-YYYY
 * - Compact date: YYYYMMDD
 * - ISO datetime: date, 'T' or ' ', HH:MM[:SS[.fff]], optional Z or +HH:MM
 * - Time of day: HH:MM[:SS]
 */
class StandardClassifier : public ValueClassifier {
public:
  explicit StandardClassifier(const ClassifierOptions& options = ClassifierOptions());

  bool is_unknown(std::string_view value) const override;
  bool is_integer(std::string_view value) const override;
  bool is_float(std::string_view value) const override;
  bool is_timestamp(std::string_view value) const override;

  const ClassifierOptions& options() const { return options_; }

private:
  ClassifierOptions options_;

  std::string_view prepare(std::string_view value) const;
};

namespace detail {

std::string_view trim(std::string_view value);
bool is_date(std::string_view value);
bool is_time(std::string_view value);
bool is_datetime(std::string_view value);

} // namespace detail

} // namespace csvprof

#endif // CSVPROF_VALUE_CLASSIFIER_H
