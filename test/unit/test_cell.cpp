#include <gtest/gtest.h>
#include "excelpipe/core/Cell.hpp"

#include <cstdint>
#include <limits>

using namespace excelpipe::core;

class CellTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// 测试空单元格
TEST_F(CellTest, EmptyCell) {
    Cell cell;
    EXPECT_TRUE(cell.isEmpty());
    EXPECT_TRUE(cell.isBlank());
    EXPECT_EQ(cell.toText(), "");
    EXPECT_FALSE(cell.tryGetValue<int>().has_value());
    EXPECT_FALSE(cell.tryGetValue<std::string>().has_value());
    EXPECT_EQ(cell.getValueOr<int>(7), 7);
}

// 测试数字渲染为文本
TEST_F(CellTest, NumberToText) {
    EXPECT_EQ(Cell(5.0).toText(), "5");
    EXPECT_EQ(Cell(2.5).toText(), "2.5");
    EXPECT_EQ(Cell(0.1).toText(), "0.1");
    EXPECT_EQ(Cell(true).toText(), "TRUE");
    EXPECT_EQ(Cell(false).toText(), "FALSE");
}

// 测试整数转换四舍五入
TEST_F(CellTest, IntegralRounding) {
    EXPECT_EQ(Cell(2.4).tryGetValue<int>().value(), 2);
    EXPECT_EQ(Cell(2.6).tryGetValue<int>().value(), 3);
    EXPECT_EQ(Cell(-1.6).tryGetValue<int>().value(), -2);
    EXPECT_FALSE(Cell(1e20).tryGetValue<int>().has_value());
}

// 测试整数类型的边界值
TEST_F(CellTest, IntegralLimits) {
    EXPECT_EQ(Cell(2147483647.0).tryGetValue<int>().value(), 2147483647);
    EXPECT_FALSE(Cell(2147483648.0).tryGetValue<int>().has_value());
    EXPECT_EQ(Cell(-2147483648.0).tryGetValue<int>().value(), std::numeric_limits<int>::lowest());
    EXPECT_FALSE(Cell(-2147483649.0).tryGetValue<int>().has_value());

    // 2^63 超出 int64_t，2^63 - 1024 是可表示的最大 double
    EXPECT_FALSE(Cell(9223372036854775808.0).tryGetValue<int64_t>().has_value());
    EXPECT_EQ(Cell(9223372036854774784.0).tryGetValue<int64_t>().value(), INT64_C(9223372036854774784));
    EXPECT_EQ(Cell(-9223372036854775808.0).tryGetValue<int64_t>().value(), std::numeric_limits<int64_t>::lowest());
}

// 测试字符串转数字
TEST_F(CellTest, StringToNumber) {
    EXPECT_DOUBLE_EQ(Cell("3.25").tryGetValue<double>().value(), 3.25);
    EXPECT_EQ(Cell(" 42 ").tryGetValue<int>().value(), 42);
    EXPECT_EQ(Cell("+7").tryGetValue<int>().value(), 7);
    EXPECT_FALSE(Cell("abc").tryGetValue<double>().has_value());
    EXPECT_FALSE(Cell("12abc").tryGetValue<int>().has_value());
}

// 测试布尔转换
TEST_F(CellTest, BooleanCoercion) {
    EXPECT_TRUE(Cell("Yes").tryGetValue<bool>().value());
    EXPECT_FALSE(Cell("FALSE").tryGetValue<bool>().value());
    EXPECT_TRUE(Cell(1.0).tryGetValue<bool>().value());
    EXPECT_FALSE(Cell("maybe").tryGetValue<bool>().has_value());
    EXPECT_DOUBLE_EQ(Cell(true).tryGetValue<double>().value(), 1.0);
}

// 测试写入值会清除公式，空字符串清空单元格
TEST_F(CellTest, SetValueClearsFormula) {
    Cell cell(10.0);
    cell.setFormula("SUM(A1:A3)");
    EXPECT_TRUE(cell.hasFormula());

    cell.setValue(std::string("Herb"));
    EXPECT_FALSE(cell.hasFormula());
    EXPECT_TRUE(cell.isString());

    cell.setValue("");
    EXPECT_TRUE(cell.isEmpty());
}

// 测试错误值
TEST_F(CellTest, ErrorValue) {
    Cell cell = Cell::makeError("#N/A");
    EXPECT_TRUE(cell.isError());
    EXPECT_EQ(cell.getType(), CellType::Error);
    EXPECT_FALSE(cell.isBlank());
    EXPECT_EQ(cell.toText(), "#N/A");
    EXPECT_FALSE(cell.tryGetValue<double>().has_value());
}
