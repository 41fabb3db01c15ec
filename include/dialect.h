/**
 * @file dialect.h
 * @brief Dialect configuration and file structure detection.
 *
 * DialectDetector scans a file once to determine its delimiter, quoting,
 * header presence, line ending, record and field counts and format category.
 * Results are computed by an explicit analyze() call and cached on the
 * instance.
 *
 * @see DialectDetector for detection
 * @see Dialect for dialect configuration
 */

#ifndef CSVPROF_DIALECT_H
#define CSVPROF_DIALECT_H

#include "error.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csvprof {

/**
 * @brief Delimited-file dialect.
 *
 * - delimiter: field separator character (default: comma)
 * - quote_char: character used to quote fields, '\0' for none
 * - escape_char: escapes the next character inside quotes when
 *   double_quote is false
 * - double_quote: whether quotes are escaped by doubling (RFC 4180 style)
 */
struct Dialect {
    char delimiter = ',';
    char quote_char = '"';
    char escape_char = '"';
    bool double_quote = true;  ///< If true, "" escapes to " (RFC 4180)

    /// Line ending style detected (informational)
    enum class LineEnding { LF, CRLF, CR, MIXED, UNKNOWN };
    LineEnding line_ending = LineEnding::UNKNOWN;

    /// Factory for standard CSV (comma-separated, double-quoted)
    static Dialect csv() {
        return Dialect{',', '"', '"', true, LineEnding::UNKNOWN};
    }

    /// Factory for TSV (tab-separated)
    static Dialect tsv() {
        return Dialect{'\t', '"', '"', true, LineEnding::UNKNOWN};
    }

    /// Factory for semicolon-separated (European style)
    static Dialect semicolon() {
        return Dialect{';', '"', '"', true, LineEnding::UNKNOWN};
    }

    /// Factory for pipe-separated
    static Dialect pipe() {
        return Dialect{'|', '"', '"', true, LineEnding::UNKNOWN};
    }

    /// Factory for an arbitrary delimiter with default quoting
    static Dialect with_delimiter(char delimiter) {
        return Dialect{delimiter, '"', '"', true, LineEnding::UNKNOWN};
    }

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter &&
               quote_char == other.quote_char &&
               escape_char == other.escape_char &&
               double_quote == other.double_quote;
    }

    bool operator!=(const Dialect& other) const {
        return !(*this == other);
    }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

const char* line_ending_to_string(Dialect::LineEnding le);

/// Overall file layout
enum class FormatType {
    CSV,          ///< Every record has the same field count, greater than one
    FIXED_WIDTH,  ///< Not delimited, every record has the same byte length
    OTHER         ///< Anything else, including empty files
};

const char* format_type_to_string(FormatType type);

/**
 * @brief Caller-supplied facts that override detection.
 */
struct DialectHints {
    std::optional<char> delimiter;
    std::optional<char> quote_char;
    std::optional<bool> has_header;
};

/**
 * @brief Configuration options for dialect detection.
 */
struct DetectionOptions {
    size_t sample_size = 65536;   ///< Bytes to sample (default 64KB)
    size_t max_rows = 100;        ///< Maximum sampled records

    /// Candidate delimiter characters, in tie-break order
    std::vector<char> delimiters = {',', '|', '\t', ';', ':'};

    /// Quote character assumed unless hinted
    char quote_char = '"';

    /// Share of quoted non-empty fields needed to report quoting
    double min_quote_ratio = 0.5;
};

/**
 * @brief Result of an analysis pass.
 */
struct DialectInfo {
    Dialect dialect;
    FormatType format_type = FormatType::OTHER;
    bool quoting = false;
    bool has_header = false;
    size_t record_count = 0;     ///< All records, header included
    size_t field_count = 0;      ///< Modal field count of the sample
    size_t rows_analyzed = 0;    ///< Records in the sample
    double consistency = 0.0;    ///< Share of sampled records with field_count fields
    std::vector<std::string> warnings;
};

/**
 * @brief Per-delimiter score computed on the sample.
 */
struct DialectCandidate {
    char delimiter = ',';
    size_t num_columns = 0;        ///< Modal field count
    double consistency = 0.0;      ///< Share of records with num_columns fields
    double type_score = 0.0;       ///< Share of non-empty cells that read as whole values [0, 1]

    /// More than one column on the modal record
    bool delimited() const { return num_columns > 1; }

    /// Combined: consistency * type_score
    double score() const { return consistency * type_score; }

    bool operator<(const DialectCandidate& other) const {
        // Splitting into several columns beats any single-column reading
        if (delimited() != other.delimited()) {
            return delimited();
        }
        // Higher combined score is better
        if (score() != other.score()) {
            return score() > other.score();
        }
        // Tie-break: prefer more columns
        return num_columns > other.num_columns;
    }
};

/**
 * @brief File dialect detector.
 *
 * @example
 * @code
 * csvprof::DialectDetector detector("data.csv");
 * detector.analyze();
 * if (detector.format_type() == csvprof::FormatType::CSV) {
 *     std::cout << detector.field_count() << " fields, "
 *               << detector.record_count() << " records\n";
 * }
 * @endcode
 */
class DialectDetector {
public:
    explicit DialectDetector(std::string path,
                             const DialectHints& hints = DialectHints(),
                             const DetectionOptions& options = DetectionOptions());

    /**
     * @brief Scan the file and cache the results.
     *
     * Only the first call touches the file; later calls return at once.
     *
     * @param errors Optional sink for diagnostics of the first call
     * @throws IoError if the file cannot be read
     */
    void analyze(ErrorCollector* errors = nullptr);

    bool analyzed() const { return info_.has_value(); }

    /// @throws std::logic_error before analyze()
    const DialectInfo& info() const;

    const std::string& path() const { return path_; }

    size_t record_count() const { return info().record_count; }
    size_t field_count() const { return info().field_count; }
    FormatType format_type() const { return info().format_type; }
    const Dialect& dialect() const { return info().dialect; }
    char delimiter() const { return info().dialect.delimiter; }
    bool quoting() const { return info().quoting; }
    bool has_header() const { return info().has_header; }

    /// Score candidate delimiters on sample text, best first
    std::vector<DialectCandidate> score_candidates(std::string_view sample) const;

    /// Detect line ending style
    static Dialect::LineEnding detect_line_ending(std::string_view sample);

private:
    std::string path_;
    DialectHints hints_;
    DetectionOptions options_;
    std::optional<DialectInfo> info_;

    Dialect base_dialect() const;

    std::vector<char> candidate_delimiters() const;

    DialectCandidate score_delimiter(char delimiter, std::string_view sample) const;

    double compute_type_score(char delimiter,
                              const std::vector<std::vector<std::string>>& rows) const;

    bool detect_header(const std::vector<std::vector<std::string>>& rows) const;

    size_t count_records(const Dialect& dialect, ErrorCollector* errors) const;
};

} // namespace csvprof

#endif // CSVPROF_DIALECT_H
