#include "field_statistics.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fast_float/fast_float.h>

namespace csvprof {

namespace {

std::vector<std::string_view> views_of(const std::vector<std::string>& values) {
  return std::vector<std::string_view>(values.begin(), values.end());
}

std::vector<std::string_view> keys_of(const FrequencyMap& values) {
  std::vector<std::string_view> keys;
  keys.reserve(values.size());
  for (const auto& entry : values) {
    keys.emplace_back(entry.first);
  }
  return keys;
}

bool parse_integer(std::string_view value, int64_t& out) {
  std::string_view v = detail::trim(value);
  if (!v.empty() && v[0] == '+') {
    v.remove_prefix(1);
    if (!v.empty() && v[0] == '-') return false;
  }
  if (v.empty()) return false;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  return ec == std::errc() && ptr == v.data() + v.size();
}

bool parse_float(std::string_view value, double& out) {
  std::string_view v = detail::trim(value);
  if (!v.empty() && v[0] == '+') {
    v.remove_prefix(1);
    if (!v.empty() && v[0] == '-') return false;
  }
  if (v.empty()) return false;
  auto [ptr, ec] = fast_float::from_chars(v.data(), v.data() + v.size(), out);
  return ec == std::errc() && ptr == v.data() + v.size() && !std::isnan(out);
}

template <typename T>
void keep_extreme(std::optional<T>& best, const T& candidate, bool want_max) {
  if (!best || (want_max ? *best < candidate : candidate < *best)) {
    best = candidate;
  }
}

} // namespace

std::string format_float(double value) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  std::string out(buf, ec == std::errc() ? ptr : buf);
  if (out.find_first_of(".eEn") == std::string::npos) {
    out += ".0";
  }
  return out;
}

FieldStatistics::FieldStatistics(const ValueClassifier& classifier,
                                 const StatisticsOptions& options)
    : classifier_(classifier), options_(options) {}

FieldCase FieldStatistics::case_of(ValueType type,
                                   const std::vector<std::string_view>& values) const {
  if (type != ValueType::STRING) {
    return FieldCase::NOT_APPLICABLE;
  }

  bool seen_lower = false;
  bool seen_upper = false;
  bool seen_mixed = false;

  for (std::string_view value : values) {
    if (classifier_.is_unknown(value)) continue;
    if (classifier_.is_integer(value) || classifier_.is_float(value)) continue;

    bool has_lower = false;
    bool has_upper = false;
    for (char c : value) {
      if (c >= 'a' && c <= 'z') has_lower = true;
      else if (c >= 'A' && c <= 'Z') has_upper = true;
    }

    if (has_lower && !has_upper) {
      seen_lower = true;
    } else if (has_upper && !has_lower) {
      seen_upper = true;
    } else {
      // both cases, or no letters at all
      seen_mixed = true;
    }
  }

  if (seen_mixed) return FieldCase::MIXED;
  if (seen_lower && !seen_upper) return FieldCase::LOWER;
  if (seen_upper && !seen_lower) return FieldCase::UPPER;
  if (seen_lower && seen_upper) return FieldCase::MIXED;
  return FieldCase::UNKNOWN;
}

std::optional<std::string> FieldStatistics::extreme(ValueType type,
                                                    const std::vector<std::string_view>& values,
                                                    bool want_max) const {
  switch (type) {
    case ValueType::INTEGER: {
      std::optional<int64_t> best;
      for (std::string_view value : values) {
        if (classifier_.is_unknown(value)) continue;
        int64_t n;
        if (parse_integer(value, n)) keep_extreme(best, n, want_max);
      }
      if (!best) return std::nullopt;
      return std::to_string(*best);
    }
    case ValueType::FLOAT: {
      std::optional<double> best;
      for (std::string_view value : values) {
        if (classifier_.is_unknown(value)) continue;
        double d;
        if (parse_float(value, d)) keep_extreme(best, d, want_max);
      }
      if (!best) return std::nullopt;
      return format_float(*best);
    }
    case ValueType::TIMESTAMP:
    case ValueType::STRING:
    case ValueType::UNKNOWN: {
      std::optional<std::string_view> best;
      for (std::string_view value : values) {
        if (classifier_.is_unknown(value)) continue;
        keep_extreme(best, value, want_max);
      }
      if (!best) return std::nullopt;
      return std::string(*best);
    }
  }
  return std::nullopt;
}

std::optional<size_t> FieldStatistics::length_bound(const std::vector<std::string_view>& values,
                                                    bool want_max) const {
  std::optional<size_t> best;
  for (std::string_view value : values) {
    if (classifier_.is_unknown(value)) continue;
    keep_extreme(best, value.size(), want_max);
  }
  return best;
}

FieldCase FieldStatistics::get_case(ValueType type, const std::vector<std::string>& values) const {
  if (type != ValueType::STRING) return FieldCase::NOT_APPLICABLE;
  return case_of(type, views_of(values));
}

FieldCase FieldStatistics::get_case(ValueType type, const FrequencyMap& values) const {
  if (type != ValueType::STRING) return FieldCase::NOT_APPLICABLE;
  return case_of(type, keys_of(values));
}

std::optional<std::string> FieldStatistics::get_min(ValueType type,
                                                    const std::vector<std::string>& values) const {
  return extreme(type, views_of(values), false);
}

std::optional<std::string> FieldStatistics::get_min(ValueType type,
                                                    const FrequencyMap& values) const {
  return extreme(type, keys_of(values), false);
}

std::optional<std::string> FieldStatistics::get_max(ValueType type,
                                                    const std::vector<std::string>& values) const {
  return extreme(type, views_of(values), true);
}

std::optional<std::string> FieldStatistics::get_max(ValueType type,
                                                    const FrequencyMap& values) const {
  return extreme(type, keys_of(values), true);
}

size_t FieldStatistics::get_max_length(const std::vector<std::string>& values) const {
  return length_bound(views_of(values), true).value_or(0);
}

size_t FieldStatistics::get_max_length(const FrequencyMap& values) const {
  return length_bound(keys_of(values), true).value_or(0);
}

std::optional<size_t> FieldStatistics::get_min_length(const std::vector<std::string>& values) const {
  return length_bound(views_of(values), false);
}

std::optional<size_t> FieldStatistics::get_min_length(const FrequencyMap& values) const {
  return length_bound(keys_of(values), false);
}

ValueType FieldStatistics::infer_type(const std::vector<std::string>& values) const {
  ValueTypeStats stats;
  for (const auto& value : values) {
    stats.add(classifier_.classify(value));
  }
  return stats.dominant_type(options_.type_threshold);
}

ValueType FieldStatistics::infer_type(const FrequencyMap& values) const {
  ValueTypeStats stats;
  for (const auto& [value, count] : values) {
    stats.add(classifier_.classify(value), count);
  }
  return stats.dominant_type(options_.type_threshold);
}

size_t FieldStatistics::count_unknown(const std::vector<std::string>& values) const {
  size_t n = 0;
  for (const auto& value : values) {
    if (classifier_.is_unknown(value)) ++n;
  }
  return n;
}

size_t FieldStatistics::count_unknown(const FrequencyMap& values) const {
  size_t n = 0;
  for (const auto& [value, count] : values) {
    if (classifier_.is_unknown(value)) n += count;
  }
  return n;
}

} // namespace csvprof
