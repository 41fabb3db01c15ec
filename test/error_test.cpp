#include <gtest/gtest.h>
#include <string>

#include "error.h"

using namespace csvprof;

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::NONE), "NONE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::FREQ_TRUNCATED), "FREQ_TRUNCATED");
    EXPECT_STREQ(error_code_to_string(ErrorCode::INCONSISTENT_FIELD_COUNT),
                 "INCONSISTENT_FIELD_COUNT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::UNCLOSED_QUOTE), "UNCLOSED_QUOTE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::EMPTY_FILE), "EMPTY_FILE");
    EXPECT_STREQ(error_code_to_string(ErrorCode::AMBIGUOUS_SEPARATOR), "AMBIGUOUS_SEPARATOR");
}

TEST(ErrorTest, SeverityNames) {
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::WARNING), "WARNING");
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::ERROR), "ERROR");
    EXPECT_STREQ(error_severity_to_string(ErrorSeverity::FATAL), "FATAL");
}

TEST(ErrorTest, ParseErrorToString) {
    ParseError err(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, 3, 2, 17,
                   "record has 1 fields, skipped", "abc");
    std::string s = err.to_string();
    EXPECT_NE(s.find("[ERROR]"), std::string::npos);
    EXPECT_NE(s.find("INCONSISTENT_FIELD_COUNT"), std::string::npos);
    EXPECT_NE(s.find("record 3"), std::string::npos);
    EXPECT_NE(s.find("field 2"), std::string::npos);
    EXPECT_NE(s.find("Context: abc"), std::string::npos);
}

TEST(ErrorTest, ParseErrorWithoutLocation) {
    ParseError err(ErrorCode::EMPTY_FILE, ErrorSeverity::WARNING, 0, 0, 0, "file is empty");
    EXPECT_EQ(err.to_string(), "[WARNING] EMPTY_FILE: file is empty");
}

TEST(ErrorTest, CollectorPermissiveKeepsGoing) {
    ErrorCollector errors;
    EXPECT_FALSE(errors.has_errors());
    EXPECT_EQ(errors.summary(), "No errors");

    errors.add_error(ErrorCode::FREQ_TRUNCATED, ErrorSeverity::WARNING, 5, 1, 40, "truncated");
    EXPECT_TRUE(errors.has_errors());
    EXPECT_FALSE(errors.should_stop());
    EXPECT_EQ(errors.error_count(), 1u);

    std::string summary = errors.summary();
    EXPECT_NE(summary.find("Total diagnostics: 1 (Warnings: 1)"), std::string::npos);
}

TEST(ErrorTest, CollectorStrictStopsOnFirst) {
    ErrorCollector errors(ErrorMode::STRICT);
    errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, 2, 3, 10, "short");
    EXPECT_TRUE(errors.should_stop());
}

TEST(ErrorTest, CollectorPermissiveIgnoresErrors) {
    ErrorCollector errors(ErrorMode::PERMISSIVE);
    errors.add_error(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, 2, 3, 10, "short");
    errors.add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::WARNING, 4, 1, 30, "unclosed");
    EXPECT_FALSE(errors.should_stop());
    EXPECT_EQ(errors.error_count(), 2u);
}

TEST(ErrorTest, CollectorFatalStopsPermissive) {
    ErrorCollector errors(ErrorMode::PERMISSIVE);
    errors.add_error(ErrorCode::UNCLOSED_QUOTE, ErrorSeverity::FATAL, 1, 1, 0, "unclosed");
    EXPECT_TRUE(errors.has_fatal_errors());
    EXPECT_TRUE(errors.should_stop());

    errors.clear();
    EXPECT_FALSE(errors.has_errors());
    EXPECT_FALSE(errors.has_fatal_errors());
}

TEST(ErrorTest, IoErrorMessage) {
    IoError err("/no/such/file.csv", "No such file or directory");
    EXPECT_EQ(err.path(), "/no/such/file.csv");
    EXPECT_EQ(err.reason(), "No such file or directory");
    EXPECT_NE(std::string(err.what()).find("/no/such/file.csv"), std::string::npos);
}
