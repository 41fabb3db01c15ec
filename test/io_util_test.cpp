#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

#include "error.h"
#include "io_util.h"

namespace fs = std::filesystem;

// Test fixture for io_util tests
class IOUtilTest : public ::testing::Test {
protected:
    std::string temp_dir;

    void SetUp() override {
        temp_dir = (fs::temp_directory_path() / ("io_util_test_" + std::to_string(getpid()))).string();
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string createTempFile(const std::string& filename, const std::string& content) {
        std::string path = temp_dir + "/" + filename;
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), content.size());
        file.close();
        return path;
    }
};

// =============================================================================
// open_input TESTS
// =============================================================================

TEST_F(IOUtilTest, OpenInput_ReadsFile) {
    std::string path = createTempFile("a.csv", "x,y\n");
    std::ifstream in = csvprof::open_input(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "x,y");
}

TEST_F(IOUtilTest, OpenInput_MissingFile) {
    std::string path = temp_dir + "/nope.csv";
    try {
        csvprof::open_input(path);
        FAIL() << "Expected IoError";
    } catch (const csvprof::IoError& e) {
        EXPECT_EQ(e.path(), path);
        EXPECT_FALSE(e.reason().empty());
    }
}

TEST_F(IOUtilTest, OpenInput_Directory) {
    try {
        csvprof::open_input(temp_dir);
        FAIL() << "Expected IoError";
    } catch (const csvprof::IoError& e) {
        EXPECT_EQ(e.reason(), "is a directory");
    }
}

// =============================================================================
// read_sample TESTS
// =============================================================================

TEST_F(IOUtilTest, ReadSample_WholeFile) {
    std::string path = createTempFile("lines.csv", "aaaa\nbbbb\ncccc\n");
    EXPECT_EQ(csvprof::read_sample(path, 100), "aaaa\nbbbb\ncccc\n");
}

TEST_F(IOUtilTest, ReadSample_EndsOnLineBoundary) {
    std::string path = createTempFile("lines.csv", "aaaa\nbbbb\ncccc\n");
    EXPECT_EQ(csvprof::read_sample(path, 7), "aaaa\n");
}

TEST_F(IOUtilTest, ReadSample_ExactSize) {
    std::string path = createTempFile("lines.csv", "aaaa\nbb");
    EXPECT_EQ(csvprof::read_sample(path, 7), "aaaa\nbb");
}

TEST_F(IOUtilTest, ReadSample_LongLineKept) {
    std::string path = createTempFile("long.csv", std::string(50, 'x') + "\n");
    EXPECT_EQ(csvprof::read_sample(path, 10), std::string(10, 'x'));
}

TEST_F(IOUtilTest, ReadSample_EmptyFile) {
    std::string path = createTempFile("empty.csv", "");
    EXPECT_EQ(csvprof::read_sample(path, 100), "");
}
