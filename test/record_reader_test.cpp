#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "record_reader.h"

using namespace csvprof;

class RecordReaderTest : public ::testing::Test {
protected:
    std::vector<std::vector<std::string>> readAll(const std::string& data,
                                                  const Dialect& dialect = Dialect::csv(),
                                                  ErrorCollector* errors = nullptr) {
        std::istringstream in(data);
        RecordReader reader(in, dialect, errors);
        std::vector<std::vector<std::string>> records;
        std::vector<std::string> fields;
        while (reader.next(fields)) {
            records.push_back(fields);
        }
        return records;
    }
};

TEST_F(RecordReaderTest, SimpleRecords) {
    auto records = readAll("a,b,c\n1,2,3\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(records[1], (std::vector<std::string>{"1", "2", "3"}));
}

TEST_F(RecordReaderTest, NoTrailingNewline) {
    auto records = readAll("a,b\n1,2");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], (std::vector<std::string>{"1", "2"}));
}

TEST_F(RecordReaderTest, EmptyInput) {
    EXPECT_TRUE(readAll("").empty());
    EXPECT_TRUE(readAll("\n\n").empty());
}

TEST_F(RecordReaderTest, EmptyFields) {
    auto records = readAll("a,,c\n,,\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(records[1], (std::vector<std::string>{"", "", ""}));
}

TEST_F(RecordReaderTest, BlankLinesSkipped) {
    auto records = readAll("a,b\n\n1,2\n\n");
    ASSERT_EQ(records.size(), 2u);
}

TEST_F(RecordReaderTest, LineEndings) {
    EXPECT_EQ(readAll("a,b\r\n1,2\r\n").size(), 2u);
    EXPECT_EQ(readAll("a,b\r1,2\r").size(), 2u);
    auto records = readAll("a,b\r\n1,2\n3,4\r");
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2], (std::vector<std::string>{"3", "4"}));
}

TEST_F(RecordReaderTest, QuotedFields) {
    std::istringstream in("\"a\",b,\"c,d\"\n");
    RecordReader reader(in, Dialect::csv());
    std::vector<std::string> fields;

    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(fields, (std::vector<std::string>{"a", "b", "c,d"}));
    EXPECT_EQ(reader.quoted(), (std::vector<bool>{true, false, true}));
}

TEST_F(RecordReaderTest, DoubledQuotes) {
    auto records = readAll("\"say \"\"hi\"\"\",x\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0][0], "say \"hi\"");
}

TEST_F(RecordReaderTest, NewlineInsideQuotes) {
    auto records = readAll("\"line1\nline2\",x\n1,2\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0][0], "line1\nline2");
}

TEST_F(RecordReaderTest, EscapeCharacter) {
    Dialect dialect = Dialect::csv();
    dialect.double_quote = false;
    dialect.escape_char = '\\';

    auto records = readAll("\"a\\\"b\",c\n", dialect);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0][0], "a\"b");
    EXPECT_EQ(records[0][1], "c");
}

TEST_F(RecordReaderTest, QuoteInsideUnquotedField) {
    auto records = readAll("ab\"c,d\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0][0], "ab\"c");
}

TEST_F(RecordReaderTest, NoQuoteCharacter) {
    Dialect dialect = Dialect::csv();
    dialect.quote_char = '\0';
    auto records = readAll("\"a,b\"\n", dialect);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (std::vector<std::string>{"\"a", "b\""}));
}

TEST_F(RecordReaderTest, UnclosedQuoteReported) {
    ErrorCollector errors;
    auto records = readAll("a,\"open\n", Dialect::csv(), &errors);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0][1], "open\n");
    ASSERT_EQ(errors.error_count(), 1u);
    EXPECT_EQ(errors.errors()[0].code, ErrorCode::UNCLOSED_QUOTE);
    EXPECT_EQ(errors.errors()[0].severity, ErrorSeverity::WARNING);
}

TEST_F(RecordReaderTest, RecordLengthAndCounters) {
    std::istringstream in("abc|de\n\"x\"|y\r\n");
    RecordReader reader(in, Dialect::pipe());
    std::vector<std::string> fields;

    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(reader.record_length(), 6u);
    EXPECT_EQ(reader.bytes_read(), 7u);

    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ(reader.record_length(), 5u);
    EXPECT_EQ(reader.records_read(), 2u);
    EXPECT_EQ(reader.bytes_read(), 14u);

    EXPECT_FALSE(reader.next(fields));
    EXPECT_TRUE(fields.empty());
}

