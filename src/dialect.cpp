#include "dialect.h"

#include "io_util.h"
#include "record_reader.h"
#include "value_classifier.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace csvprof {

namespace {

std::string describe_char(char c) {
    switch (c) {
        case ',': return "comma";
        case '\t': return "tab";
        case ';': return "semicolon";
        case '|': return "pipe";
        case ':': return "colon";
        case '"': return "double-quote";
        case '\'': return "single-quote";
        case '\0': return "none";
        default: return std::string(1, c);
    }
}

} // namespace

std::string Dialect::to_string() const {
    std::ostringstream ss;
    ss << "delimiter=" << describe_char(delimiter)
       << " quote=" << describe_char(quote_char)
       << " escape=" << (double_quote ? "double" : describe_char(escape_char))
       << " line_ending=" << line_ending_to_string(line_ending);
    return ss.str();
}

const char* line_ending_to_string(Dialect::LineEnding le) {
    switch (le) {
        case Dialect::LineEnding::LF: return "LF";
        case Dialect::LineEnding::CRLF: return "CRLF";
        case Dialect::LineEnding::CR: return "CR";
        case Dialect::LineEnding::MIXED: return "mixed";
        case Dialect::LineEnding::UNKNOWN: return "unknown";
    }
    return "unknown";
}

const char* format_type_to_string(FormatType type) {
    switch (type) {
        case FormatType::CSV: return "csv";
        case FormatType::FIXED_WIDTH: return "fixed_width";
        case FormatType::OTHER: return "other";
    }
    return "other";
}

DialectDetector::DialectDetector(std::string path, const DialectHints& hints,
                                 const DetectionOptions& options)
    : path_(std::move(path)), hints_(hints), options_(options) {}

const DialectInfo& DialectDetector::info() const {
    if (!info_) {
        throw std::logic_error("DialectDetector::analyze() has not been called");
    }
    return *info_;
}

Dialect DialectDetector::base_dialect() const {
    Dialect dialect;
    dialect.quote_char = hints_.quote_char.value_or(options_.quote_char);
    dialect.escape_char = dialect.quote_char;
    if (hints_.delimiter) {
        dialect.delimiter = *hints_.delimiter;
    }
    return dialect;
}

std::vector<char> DialectDetector::candidate_delimiters() const {
    if (hints_.delimiter) {
        return {*hints_.delimiter};
    }
    if (options_.delimiters.empty()) {
        return {base_dialect().delimiter};
    }
    return options_.delimiters;
}

Dialect::LineEnding DialectDetector::detect_line_ending(std::string_view sample) {
    size_t lf = 0, crlf = 0, cr = 0;
    for (size_t i = 0; i < sample.size(); ++i) {
        if (sample[i] == '\r') {
            if (i + 1 < sample.size() && sample[i + 1] == '\n') {
                ++crlf;
                ++i;
            } else {
                ++cr;
            }
        } else if (sample[i] == '\n') {
            ++lf;
        }
    }

    int kinds = (lf > 0) + (crlf > 0) + (cr > 0);
    if (kinds == 0) return Dialect::LineEnding::UNKNOWN;
    if (kinds > 1) return Dialect::LineEnding::MIXED;
    if (crlf > 0) return Dialect::LineEnding::CRLF;
    if (cr > 0) return Dialect::LineEnding::CR;
    return Dialect::LineEnding::LF;
}

DialectCandidate DialectDetector::score_delimiter(char delimiter,
                                                  std::string_view sample) const {
    Dialect dialect = base_dialect();
    dialect.delimiter = delimiter;

    std::istringstream in{std::string(sample)};
    RecordReader reader(in, dialect);

    std::map<size_t, size_t> count_freq;  // fields per record -> records
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    while (records.size() < options_.max_rows && reader.next(fields)) {
        ++count_freq[fields.size()];
        records.push_back(std::move(fields));
    }
    const size_t rows = records.size();

    DialectCandidate candidate;
    candidate.delimiter = delimiter;
    if (rows == 0) {
        return candidate;
    }

    // Modal field count; ties go to the wider reading
    size_t best_rows = 0;
    for (const auto& [columns, n] : count_freq) {
        if (n >= best_rows) {
            best_rows = n;
            candidate.num_columns = columns;
        }
    }
    candidate.consistency = static_cast<double>(best_rows) / static_cast<double>(rows);
    candidate.type_score = compute_type_score(delimiter, records);
    return candidate;
}

double DialectDetector::compute_type_score(
    char delimiter, const std::vector<std::vector<std::string>>& rows) const {
    // A cell is broken when it holds no typed value and still contains
    // another candidate delimiter, e.g. "1,2020-01-01 12" from a ':' split
    std::string others;
    for (char c : options_.delimiters) {
        if (c != delimiter) others += c;
    }

    StandardClassifier classifier;
    size_t cells = 0;
    size_t whole = 0;
    for (const auto& row : rows) {
        for (const auto& cell : row) {
            if (cell.empty()) continue;
            ++cells;
            if (classifier.classify(cell) != ValueType::STRING ||
                cell.find_first_of(others) == std::string::npos) {
                ++whole;
            }
        }
    }
    if (cells == 0) {
        return 1.0;
    }
    return static_cast<double>(whole) / static_cast<double>(cells);
}

std::vector<DialectCandidate> DialectDetector::score_candidates(std::string_view sample) const {
    std::vector<DialectCandidate> candidates;
    for (char delimiter : candidate_delimiters()) {
        candidates.push_back(score_delimiter(delimiter, sample));
    }
    std::stable_sort(candidates.begin(), candidates.end());
    return candidates;
}

bool DialectDetector::detect_header(const std::vector<std::vector<std::string>>& rows) const {
    if (rows.size() < 2) {
        return false;
    }

    StandardClassifier classifier;
    const auto& first = rows.front();
    int header_votes = 0;
    int data_votes = 0;

    for (size_t col = 0; col < first.size(); ++col) {
        std::optional<ValueType> column_type;
        std::optional<size_t> column_length;
        bool mixed_types = false;
        bool mixed_lengths = false;
        size_t seen = 0;

        for (size_t r = 1; r < rows.size(); ++r) {
            if (col >= rows[r].size()) continue;
            const std::string& value = rows[r][col];
            ValueType type = classifier.classify(value);
            if (type == ValueType::UNKNOWN) continue;

            ++seen;
            if (!column_type) {
                column_type = type;
            } else if (*column_type != type) {
                mixed_types = true;
            }
            if (!column_length) {
                column_length = value.size();
            } else if (*column_length != value.size()) {
                mixed_lengths = true;
            }
        }

        if (seen == 0 || mixed_types) continue;

        if (*column_type != ValueType::STRING) {
            if (classifier.classify(first[col]) != *column_type) {
                ++header_votes;
            } else {
                ++data_votes;
            }
        } else if (!mixed_lengths) {
            if (first[col].size() != *column_length) {
                ++header_votes;
            } else {
                ++data_votes;
            }
        }
    }

    return header_votes > data_votes;
}

size_t DialectDetector::count_records(const Dialect& dialect, ErrorCollector* errors) const {
    std::ifstream in = open_input(path_);
    RecordReader reader(in, dialect, errors);

    std::vector<std::string> fields;
    while (reader.next(fields)) {
    }
    if (in.bad()) {
        throw IoError(path_, "could not read the data");
    }
    return reader.records_read();
}

void DialectDetector::analyze(ErrorCollector* errors) {
    if (info_) {
        return;
    }

    DialectInfo info;
    info.dialect = base_dialect();

    std::string sample = read_sample(path_, options_.sample_size);
    if (sample.empty()) {
        info.warnings.push_back("file is empty");
        if (errors != nullptr) {
            errors->add_error(ErrorCode::EMPTY_FILE, ErrorSeverity::WARNING, 0, 0, 0,
                              "file is empty: " + path_);
        }
        info_ = std::move(info);
        return;
    }

    info.dialect.line_ending = detect_line_ending(sample);

    std::vector<DialectCandidate> candidates = score_candidates(sample);
    const DialectCandidate& best = candidates.front();
    info.dialect.delimiter = best.delimiter;
    info.field_count = best.num_columns;
    info.consistency = best.consistency;

    if (candidates.size() > 1 && best.delimited()) {
        const DialectCandidate& runner_up = candidates[1];
        if (runner_up.delimited() && runner_up.score() == best.score() &&
            runner_up.num_columns == best.num_columns) {
            std::string msg = "delimiters '" + std::string(1, best.delimiter) + "' and '" +
                              std::string(1, runner_up.delimiter) + "' fit equally well";
            info.warnings.push_back(msg);
            if (errors != nullptr) {
                errors->add_error(ErrorCode::AMBIGUOUS_SEPARATOR, ErrorSeverity::WARNING,
                                  0, 0, 0, msg);
            }
        }
    }

    // Re-read the sample with the chosen dialect for quoting, header and layout
    std::istringstream in{sample};
    RecordReader reader(in, info.dialect);
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> fields;
    size_t non_empty_fields = 0;
    size_t quoted_fields = 0;
    std::optional<size_t> line_length;
    bool same_length = true;

    while (rows.size() < options_.max_rows && reader.next(fields)) {
        const auto& quoted = reader.quoted();
        for (size_t i = 0; i < fields.size(); ++i) {
            if (fields[i].empty() && !quoted[i]) continue;
            ++non_empty_fields;
            if (quoted[i]) ++quoted_fields;
        }
        if (!line_length) {
            line_length = reader.record_length();
        } else if (*line_length != reader.record_length()) {
            same_length = false;
        }
        rows.push_back(std::move(fields));
    }
    info.rows_analyzed = rows.size();

    if (best.delimited() && best.consistency == 1.0) {
        info.format_type = FormatType::CSV;
    } else if (rows.size() >= 2 && same_length && line_length.value_or(0) > 0) {
        info.format_type = FormatType::FIXED_WIDTH;
    } else {
        info.format_type = FormatType::OTHER;
    }

    if (info.dialect.quote_char != '\0' && non_empty_fields > 0) {
        double ratio = static_cast<double>(quoted_fields) / static_cast<double>(non_empty_fields);
        info.quoting = ratio >= options_.min_quote_ratio;
    }

    info.has_header = hints_.has_header ? *hints_.has_header : detect_header(rows);

    info.record_count = count_records(info.dialect, errors);

    info_ = std::move(info);
}

} // namespace csvprof
