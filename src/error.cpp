#include "error.h"
#include <sstream>

namespace csvprof {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::UNCLOSED_QUOTE: return "UNCLOSED_QUOTE";
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return "INCONSISTENT_FIELD_COUNT";
        case ErrorCode::FREQ_TRUNCATED: return "FREQ_TRUNCATED";
        case ErrorCode::EMPTY_FILE: return "EMPTY_FILE";
        case ErrorCode::AMBIGUOUS_SEPARATOR: return "AMBIGUOUS_SEPARATOR";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code);
    if (line > 0) {
        ss << " at record " << line;
        if (column > 0) ss << ", field " << column;
        ss << " (byte " << byte_offset << ")";
    }
    ss << ": " << message;

    if (!context.empty()) {
        ss << "\n  Context: " << context;
    }

    return ss.str();
}

std::string ErrorCollector::summary() const {
    if (errors_.empty()) {
        return "No errors";
    }

    std::ostringstream ss;
    size_t warnings = 0, errors = 0, fatal = 0;

    for (const auto& err : errors_) {
        switch (err.severity) {
            case ErrorSeverity::WARNING: warnings++; break;
            case ErrorSeverity::ERROR: errors++; break;
            case ErrorSeverity::FATAL: fatal++; break;
        }
    }

    ss << "Total diagnostics: " << errors_.size() << " (";
    bool first = true;
    auto part = [&](const char* label, size_t n) {
        if (n == 0) return;
        if (!first) ss << ", ";
        ss << label << ": " << n;
        first = false;
    };
    part("Warnings", warnings);
    part("Errors", errors);
    part("Fatal", fatal);
    ss << ")";

    ss << "\n\nDetails:\n";
    for (const auto& err : errors_) {
        ss << err.to_string() << "\n";
    }

    return ss.str();
}

} // namespace csvprof
