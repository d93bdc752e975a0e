#include <gtest/gtest.h>
#include "excelpipe/utils/AddressParser.hpp"
#include "excelpipe/utils/CommonUtils.hpp"

#include <stdexcept>

using namespace excelpipe::utils;

class AddressParserTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// 测试列号与字母互转
TEST_F(AddressParserTest, ColumnLetters) {
    EXPECT_EQ(CommonUtils::columnToLetter(0), "A");
    EXPECT_EQ(CommonUtils::columnToLetter(25), "Z");
    EXPECT_EQ(CommonUtils::columnToLetter(26), "AA");
    EXPECT_EQ(CommonUtils::columnToLetter(16383), "XFD");

    EXPECT_EQ(CommonUtils::parseReference("A1"), std::make_pair(0, 0));
    EXPECT_EQ(CommonUtils::parseReference("$AA$10"), std::make_pair(9, 26));
    EXPECT_THROW(CommonUtils::parseReference("10A"), std::invalid_argument);
}

// 测试工作表名拆分与引号处理
TEST_F(AddressParserTest, SplitSheetReference) {
    auto plain = AddressParser::splitSheetReference("Sheet1!$A$1:$B$2");
    EXPECT_EQ(plain.first, "Sheet1");
    EXPECT_EQ(plain.second, "$A$1:$B$2");

    auto quoted = AddressParser::splitSheetReference("'My Sheet'!A1");
    EXPECT_EQ(quoted.first, "My Sheet");
    EXPECT_EQ(quoted.second, "A1");

    auto escaped = AddressParser::splitSheetReference("'O''Brien'!C3");
    EXPECT_EQ(escaped.first, "O'Brien");

    auto bare = AddressParser::splitSheetReference("B2:C4");
    EXPECT_TRUE(bare.first.empty());

    EXPECT_THROW(AddressParser::splitSheetReference("'Broken!A1"), std::invalid_argument);
}

// 测试范围解析
TEST_F(AddressParserTest, ParseRange) {
    auto range = AddressParser::parseRange("'Potion Data'!$C$4:$A$2");
    EXPECT_EQ(range.sheet_name, "Potion Data");
    EXPECT_EQ(range.first_row, 1);
    EXPECT_EQ(range.first_col, 0);
    EXPECT_EQ(range.last_row, 3);
    EXPECT_EQ(range.last_col, 2);

    auto single = AddressParser::parseRange("Config!B7");
    EXPECT_EQ(single.first_row, 6);
    EXPECT_EQ(single.last_row, 6);
    EXPECT_EQ(single.first_col, 1);

    EXPECT_FALSE(AddressParser::tryParseRange("Sheet1!A1:B2,C3:D4").has_value());
    EXPECT_FALSE(AddressParser::tryParseRange("#REF!").has_value());
}

// 测试绝对引用生成
TEST_F(AddressParserTest, AbsoluteRange) {
    EXPECT_EQ(AddressParser::toAbsoluteRange("Data", 0, 0, 3, 2), "Data!$A$1:$C$4");
    EXPECT_EQ(AddressParser::toAbsoluteRange("My Sheet", 0, 0, 3, 2), "'My Sheet'!$A$1:$C$4");
    EXPECT_EQ(AddressParser::toAbsoluteRange("Data", 4, 1, 4, 1), "Data!$B$5");
    EXPECT_TRUE(AddressParser::needsQuoting("2024"));
    EXPECT_FALSE(AddressParser::needsQuoting("Sheet_1"));
}
