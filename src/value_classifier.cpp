#include "value_classifier.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fast_float/fast_float.h>
#include <stdexcept>
#include <string>

namespace csvprof {

ValueType parse_value_type(std::string_view name) {
  if (name == "integer") return ValueType::INTEGER;
  if (name == "float") return ValueType::FLOAT;
  if (name == "string") return ValueType::STRING;
  if (name == "timestamp") return ValueType::TIMESTAMP;
  if (name == "unknown") return ValueType::UNKNOWN;
  throw std::invalid_argument("invalid value type '" + std::string(name) + "'");
}

namespace detail {

namespace {

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool all_digits(std::string_view s, size_t pos, size_t count) {
  if (pos + count > s.size()) return false;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!is_digit(s[i])) return false;
  }
  return true;
}

int number_at(std::string_view s, size_t pos, size_t count) {
  int n = 0;
  for (size_t i = pos; i < pos + count; ++i) n = n * 10 + (s[i] - '0');
  return n;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
  static const int days[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap_year(year)) return 29;
  return days[month];
}

bool is_valid_date(int year, int month, int day) {
  if (year < 1000 || year > 9999) return false;
  if (month < 1 || month > 12) return false;
  if (day < 1 || day > days_in_month(year, month)) return false;
  return true;
}

bool is_date_iso(std::string_view s) {
  if (s.size() != 10) return false;

  char sep = s[4];
  if (sep != '-' && sep != '/') return false;
  if (s[7] != sep) return false;
  if (!all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)) return false;

  return is_valid_date(number_at(s, 0, 4), number_at(s, 5, 2), number_at(s, 8, 2));
}

// DD?MM?YYYY or MM?DD?YYYY; month_first selects which
bool is_date_dmy(std::string_view s, bool month_first) {
  if (s.size() != 10) return false;

  char sep = s[2];
  if (sep != '-' && sep != '/') return false;
  if (s[5] != sep) return false;
  if (!all_digits(s, 0, 2) || !all_digits(s, 3, 2) || !all_digits(s, 6, 4)) return false;

  int first = number_at(s, 0, 2);
  int second = number_at(s, 3, 2);
  int year = number_at(s, 6, 4);
  return month_first ? is_valid_date(year, first, second)
                     : is_valid_date(year, second, first);
}

bool is_date_compact(std::string_view s) {
  if (s.size() != 8 || !all_digits(s, 0, 8)) return false;
  return is_valid_date(number_at(s, 0, 4), number_at(s, 4, 2), number_at(s, 6, 2));
}

// Parses HH:MM[:SS] starting at pos; on success pos points past it
bool parse_clock(std::string_view s, size_t& pos) {
  if (!all_digits(s, pos, 2) || pos + 5 > s.size() || s[pos + 2] != ':' ||
      !all_digits(s, pos + 3, 2)) {
    return false;
  }
  if (number_at(s, pos, 2) > 23 || number_at(s, pos + 3, 2) > 59) return false;
  pos += 5;

  if (pos < s.size() && s[pos] == ':') {
    if (!all_digits(s, pos + 1, 2) || number_at(s, pos + 1, 2) > 59) return false;
    pos += 3;
  }
  return true;
}

} // namespace

std::string_view trim(std::string_view value) {
  size_t start = 0;
  size_t end = value.size();
  while (start < end && is_space(value[start])) ++start;
  while (end > start && is_space(value[end - 1])) --end;
  return value.substr(start, end - start);
}

bool is_date(std::string_view value) {
  if (value.size() < 8) return false;

  if (is_date_iso(value)) return true;
  if (is_date_dmy(value, true)) return true;
  if (is_date_dmy(value, false)) return true;
  if (is_date_compact(value)) return true;

  return false;
}

bool is_time(std::string_view value) {
  size_t pos = 0;
  return parse_clock(value, pos) && pos == value.size();
}

bool is_datetime(std::string_view value) {
  if (value.size() < 16) return false;
  if (!is_date_iso(value.substr(0, 10))) return false;
  if (value[10] != 'T' && value[10] != ' ') return false;

  size_t pos = 11;
  if (!parse_clock(value, pos)) return false;

  // fractional seconds
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    size_t digits = 0;
    while (pos < value.size() && is_digit(value[pos])) {
      ++pos;
      ++digits;
    }
    if (digits == 0) return false;
  }

  if (pos == value.size()) return true;

  if (value[pos] == 'Z') return pos + 1 == value.size();

  if (value[pos] == '+' || value[pos] == '-') {
    ++pos;
    if (!all_digits(value, pos, 2)) return false;
    pos += 2;
    if (pos < value.size() && value[pos] == ':') ++pos;
    if (!all_digits(value, pos, 2)) return false;
    pos += 2;
    return pos == value.size();
  }

  return false;
}

} // namespace detail

StandardClassifier::StandardClassifier(const ClassifierOptions& options) : options_(options) {}

std::string_view StandardClassifier::prepare(std::string_view value) const {
  return options_.trim_whitespace ? detail::trim(value) : value;
}

bool StandardClassifier::is_unknown(std::string_view value) const {
  std::string_view v = detail::trim(value);
  if (v.empty()) return true;

  std::string lowered(v);
  for (auto& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return options_.unknown_markers.count(lowered) > 0;
}

bool StandardClassifier::is_integer(std::string_view value) const {
  std::string_view v = prepare(value);
  if (v.empty()) return false;

  if (v[0] == '+') {
    v.remove_prefix(1);
    // "+-5" is not an integer
    if (v.empty() || v[0] == '-') return false;
  }

  int64_t result = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
  return ec == std::errc() && ptr == v.data() + v.size();
}

bool StandardClassifier::is_float(std::string_view value) const {
  std::string_view v = prepare(value);
  if (v.empty()) return false;
  if (is_integer(v)) return false;

  const char* start = v.data();
  const char* end = v.data() + v.size();
  // Strip leading '+' that fast_float doesn't accept
  if (*start == '+') {
    ++start;
    if (start == end || *start == '-') return false;
  }

  double result;
  auto [ptr, ec] = fast_float::from_chars(start, end, result);
  return ec == std::errc() && ptr == end;
}

bool StandardClassifier::is_timestamp(std::string_view value) const {
  std::string_view v = prepare(value);
  if (v.empty()) return false;

  return detail::is_date(v) || detail::is_datetime(v) || detail::is_time(v);
}

} // namespace csvprof
