#ifndef CSVPROF_ERROR_H
#define CSVPROF_ERROR_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace csvprof {

// Diagnostic codes reported while scanning or profiling a file
enum class ErrorCode {
    NONE = 0,

    // Quote-related
    UNCLOSED_QUOTE,              // Quoted field not closed before EOF

    // Field structure
    INCONSISTENT_FIELD_COUNT,    // Record has fewer fields than requested

    // Frequency scanning
    FREQ_TRUNCATED,              // Frequency map reached max_freq_size

    // Structure
    EMPTY_FILE,                  // File has no records
    AMBIGUOUS_SEPARATOR          // Cannot determine separator reliably
};

// Error severity levels
enum class ErrorSeverity {
    WARNING,    // Non-fatal, result is still usable (e.g. truncated frequencies)
    ERROR,      // Recoverable, record skipped
    FATAL       // Unrecoverable
};

// Detailed error information
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    // Location information
    size_t line;          // Record number (1-indexed), 0 when not applicable
    size_t column;        // Field number (1-indexed), 0 when not applicable
    size_t byte_offset;   // Byte offset in file

    // Context
    std::string message;  // Human-readable error message
    std::string context;  // Snippet of problematic data

    ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col,
               size_t offset, const std::string& msg, const std::string& ctx = "")
        : code(c), severity(s), line(l), column(col),
          byte_offset(offset), message(msg), context(ctx) {}

    // Convert error to string
    std::string to_string() const;
};

// Error handling modes
enum class ErrorMode {
    STRICT,      // Stop on first error
    PERMISSIVE   // Report all, keep going until a fatal error
};

// Error collector - accumulates diagnostics during a scan
class ErrorCollector {
public:
    explicit ErrorCollector(ErrorMode mode = ErrorMode::PERMISSIVE)
        : mode_(mode), has_fatal_(false) {}

    void add_error(const ParseError& error) {
        errors_.push_back(error);
        if (error.severity == ErrorSeverity::FATAL) {
            has_fatal_ = true;
        }
    }

    void add_error(ErrorCode code, ErrorSeverity severity, size_t line,
                   size_t column, size_t offset, const std::string& message,
                   const std::string& context = "") {
        add_error(ParseError(code, severity, line, column, offset, message, context));
    }

    // Check if we should stop scanning
    bool should_stop() const {
        if (mode_ == ErrorMode::STRICT && !errors_.empty()) return true;
        if (has_fatal_) return true;
        return false;
    }

    bool has_errors() const { return !errors_.empty(); }
    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    const std::vector<ParseError>& errors() const { return errors_; }

    std::string summary() const;

    void clear() {
        errors_.clear();
        has_fatal_ = false;
    }

    ErrorMode mode() const { return mode_; }
    void set_mode(ErrorMode mode) { mode_ = mode; }

private:
    ErrorMode mode_;
    std::vector<ParseError> errors_;
    bool has_fatal_;
};

// Exception thrown when a file cannot be opened or read.
// Never recovered inside the library.
class IoError : public std::runtime_error {
public:
    IoError(const std::string& path, const std::string& reason)
        : std::runtime_error("could not read '" + path + "': " + reason),
          path_(path), reason_(reason) {}

    const std::string& path() const { return path_; }
    const std::string& reason() const { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

// Helper functions
const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace csvprof

#endif // CSVPROF_ERROR_H
