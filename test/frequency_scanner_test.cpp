#include <gtest/gtest.h>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>

#include "frequency_scanner.h"
#include "test_helpers.h"

using namespace csvprof;

class FrequencyScannerTest : public ::testing::Test {
protected:
    std::string getTestDataPath(const std::string& category, const std::string& filename) {
        return "test/data/" + category + "/" + filename;
    }

    static size_t total(const FrequencyMap& freq) {
        return std::accumulate(freq.begin(), freq.end(), size_t{0},
                               [](size_t sum, const auto& entry) { return sum + entry.second; });
    }

    TempDir dir{"frequency_scanner_test"};
};

// ============================================================================
// get_field_freq
// ============================================================================

TEST_F(FrequencyScannerTest, CountsSkipHeader) {
    auto result = get_field_freq(getTestDataPath("basic", "roster_header.psv"), 1, true, '|');

    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.records_scanned, 3u);
    EXPECT_EQ(result.freq.size(), 3u);
    EXPECT_EQ(result.freq.count("role"), 0u);
    EXPECT_EQ(result.freq.at("pm"), 1u);
}

TEST_F(FrequencyScannerTest, HeaderCountedWithoutHasHeader) {
    auto result = get_field_freq(getTestDataPath("basic", "roster_header.psv"), 1, false, '|');
    EXPECT_EQ(result.records_scanned, 4u);
    EXPECT_EQ(result.freq.at("role"), 1u);
}

TEST_F(FrequencyScannerTest, CountsSumToRecordsScanned) {
    std::string path = dir.write("roster.psv", make_roster('|', true, 100));
    auto result = get_field_freq(path, 2, false, '|');

    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.records_scanned, 100u);
    EXPECT_EQ(total(result.freq), result.records_scanned);
    // quotes are not part of the value
    for (const auto& entry : result.freq) {
        EXPECT_EQ(entry.first.find('"'), std::string::npos) << entry.first;
    }
}

TEST_F(FrequencyScannerTest, TruncatesAtMaxSize) {
    std::string path = dir.write("roster.psv", make_roster('|', false, 100));
    ErrorCollector errors;
    auto options = ScanOptions::for_delimiter('|', false, 10);
    auto result = get_field_freq(path, 0, options, &errors);

    // field 0 is unique per record, so the tenth record hits the limit
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.freq.size(), 10u);
    EXPECT_EQ(result.records_scanned, 10u);
    EXPECT_EQ(total(result.freq), result.records_scanned);

    ASSERT_EQ(errors.error_count(), 1u);
    EXPECT_EQ(errors.errors()[0].code, ErrorCode::FREQ_TRUNCATED);
    EXPECT_EQ(errors.errors()[0].severity, ErrorSeverity::WARNING);
}

TEST_F(FrequencyScannerTest, NoTruncationBelowMaxSize) {
    std::string path = dir.write("roster.psv", make_roster('|', false, 100));
    // only four distinct names exist
    auto result = get_field_freq(path, 3, false, '|', 5);
    EXPECT_FALSE(result.truncated);
    EXPECT_LE(result.freq.size(), 4u);
    EXPECT_EQ(result.records_scanned, 100u);
}

TEST_F(FrequencyScannerTest, TruncatedExactlyAtLimit) {
    std::string path = dir.write("abc.csv", "a\nb\nc\n");
    auto result = get_field_freq(path, 0, false, ',', 3);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.freq.size(), 3u);
}

TEST_F(FrequencyScannerTest, ShortRecordsSkipped) {
    std::string path = dir.write("short.csv", "a,b,c\n1,2\n4,5,6\n");
    ErrorCollector errors;
    auto result = get_field_freq(path, 2, ScanOptions::for_delimiter(','), &errors);

    EXPECT_EQ(result.records_scanned, 2u);
    EXPECT_EQ(result.short_records, 1u);
    EXPECT_EQ(result.freq.at("c"), 1u);
    EXPECT_EQ(result.freq.at("6"), 1u);

    ASSERT_EQ(errors.error_count(), 1u);
    EXPECT_EQ(errors.errors()[0].code, ErrorCode::INCONSISTENT_FIELD_COUNT);
    EXPECT_EQ(errors.errors()[0].line, 2u);
}

TEST_F(FrequencyScannerTest, StrictModeStopsAtShortRecord) {
    std::string path = dir.write("short.csv", "a,b,c\n1,2\n4,5,6\n");
    ErrorCollector errors(ErrorMode::STRICT);
    auto result = get_field_freq(path, 2, ScanOptions::for_delimiter(','), &errors);

    EXPECT_EQ(result.records_scanned, 1u);
    EXPECT_EQ(result.freq.count("6"), 0u);
}

TEST_F(FrequencyScannerTest, EmptyFile) {
    auto result = get_field_freq(getTestDataPath("basic", "empty.csv"), 0, true, ',');
    EXPECT_TRUE(result.freq.empty());
    EXPECT_EQ(result.records_scanned, 0u);
    EXPECT_FALSE(result.truncated);
}

TEST_F(FrequencyScannerTest, FromStream) {
    std::istringstream in("x;y\n1;a\n2;a\n3;b\n");
    ScanOptions options;
    options.dialect = Dialect::semicolon();
    options.has_header = true;
    auto result = get_field_freq(in, 1, options);

    EXPECT_EQ(result.freq.at("a"), 2u);
    EXPECT_EQ(result.freq.at("b"), 1u);
}

TEST_F(FrequencyScannerTest, MissingFileThrows) {
    EXPECT_THROW(get_field_freq(dir.path("missing.csv"), 0, false, ','), IoError);
}

TEST_F(FrequencyScannerTest, DirectoryThrows) {
    EXPECT_THROW(get_field_freq(dir.root.string(), 0, false, ','), IoError);
}

// ============================================================================
// get_field_name
// ============================================================================

TEST_F(FrequencyScannerTest, NameFromHeader) {
    auto name = get_field_name(getTestDataPath("basic", "roster_header.psv"), 1, true, '|');
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "role");
}

TEST_F(FrequencyScannerTest, NameFromQuotedHeader) {
    std::string path = dir.write("quoted.csv", "\"first name\",\"last, name\"\r\nA,B\r\n");
    EXPECT_EQ(get_field_name(path, 0, true, ','), "first name");
    EXPECT_EQ(get_field_name(path, 1, true, ','), "last, name");
}

TEST_F(FrequencyScannerTest, SynthesizedNameWithoutHeader) {
    auto name = get_field_name(getTestDataPath("basic", "roster_header.psv"), 2, false, '|');
    EXPECT_EQ(name, "field_num_2");
}

TEST_F(FrequencyScannerTest, SynthesizedNameIgnoresFieldCount) {
    EXPECT_EQ(get_field_name(getTestDataPath("basic", "roster_header.psv"), 40, false, '|'),
              "field_num_40");
}

TEST_F(FrequencyScannerTest, NameOfEmptyFile) {
    EXPECT_FALSE(get_field_name(getTestDataPath("basic", "empty.csv"), 0, true, ',').has_value());
    EXPECT_FALSE(get_field_name(getTestDataPath("basic", "empty.csv"), 0, false, ',').has_value());
}

TEST_F(FrequencyScannerTest, NameOutOfRange) {
    EXPECT_THROW(get_field_name(getTestDataPath("basic", "roster_header.psv"), 3, true, '|'),
                 std::out_of_range);
}

TEST_F(FrequencyScannerTest, NameSkipsLeadingBlankLines) {
    std::string path = dir.write("blank_first.csv", "\n\r\nid,name\n1,ab\n2,cd\n");
    EXPECT_EQ(get_field_name(path, 0, true, ','), "id");
    EXPECT_EQ(get_field_name(path, 1, true, ','), "name");

    // the header name lines up with the record get_field_freq skips
    auto result = get_field_freq(path, 1, true, ',');
    EXPECT_EQ(result.freq.count("name"), 0u);
    EXPECT_EQ(result.records_scanned, 2u);
}

TEST_F(FrequencyScannerTest, NameOfBlankOnlyFile) {
    std::string path = dir.write("blank.csv", "\n\n");
    EXPECT_FALSE(get_field_name(path, 0, true, ',').has_value());
}

TEST_F(FrequencyScannerTest, NamePathAndStreamAgree) {
    const std::string contents[] = {"a,b\rc,d\r", "a,b\r\nc,d\r\n", "a,b\nc,d\n",
                                    "\"a\",\"b\rx\"\nc,d\n"};
    int n = 0;
    for (const auto& content : contents) {
        std::string path = dir.write("endings" + std::to_string(n++) + ".csv", content);
        std::istringstream in(content);
        auto from_stream = get_field_name(in, 1, true, Dialect::csv());
        auto from_path = get_field_name(path, 1, true, Dialect::csv());
        ASSERT_TRUE(from_path.has_value());
        EXPECT_EQ(from_path, from_stream);
    }

    std::istringstream cr_only("a,b\rc,d\r");
    EXPECT_EQ(get_field_name(cr_only, 1, true, Dialect::csv()), "b");
}

TEST_F(FrequencyScannerTest, NameFromStream) {
    std::istringstream in("a\tb\tc\n1\t2\t3\n");
    EXPECT_EQ(get_field_name(in, 2, true, Dialect::tsv()), "c");
}
