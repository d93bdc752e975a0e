#include <gtest/gtest.h>
#include "excelpipe/archive/ZipReader.hpp"
#include "excelpipe/archive/ZipWriter.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

using namespace excelpipe;
using excelpipe::archive::ZipError;

class ZipArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "test_zip_archive";
        std::filesystem::create_directories(test_dir_);
        test_zip_path_ = test_dir_ + "/test.zip";
        std::filesystem::remove(test_zip_path_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::string test_dir_;
    std::string test_zip_path_;
};

// 测试写入后读回
TEST_F(ZipArchiveTest, WriteAndRead) {
    {
        archive::ZipWriter writer{core::Path(test_zip_path_)};
        ASSERT_TRUE(writer.open());
        EXPECT_EQ(writer.addFile("[Content_Types].xml", "<Types/>"), ZipError::Ok);
        EXPECT_EQ(writer.addFile("xl/worksheets/sheet1.xml", std::string(10000, 'x')), ZipError::Ok);
        ASSERT_TRUE(writer.close());
    }

    archive::ZipReader reader{core::Path(test_zip_path_)};
    ASSERT_TRUE(reader.open());
    EXPECT_TRUE(reader.hasFile("[Content_Types].xml"));
    EXPECT_FALSE(reader.hasFile("xl/workbook.xml"));

    auto files = reader.listFiles();
    EXPECT_EQ(files.size(), 2u);
    EXPECT_NE(std::find(files.begin(), files.end(), "xl/worksheets/sheet1.xml"), files.end());

    std::string content;
    EXPECT_EQ(reader.extractFile("xl/worksheets/sheet1.xml", content), ZipError::Ok);
    EXPECT_EQ(content, std::string(10000, 'x'));
    EXPECT_EQ(reader.extractFile("missing.xml", content), ZipError::FileNotFound);
    reader.close();
}

// 测试未打开时的错误
TEST_F(ZipArchiveTest, NotOpen) {
    archive::ZipWriter writer{core::Path(test_zip_path_)};
    EXPECT_EQ(writer.addFile("a.txt", "a"), ZipError::NotOpen);

    archive::ZipReader reader{core::Path(test_dir_ + "/missing.zip")};
    EXPECT_FALSE(reader.open());
    std::string content;
    EXPECT_EQ(reader.extractFile("a.txt", content), ZipError::NotOpen);
}
