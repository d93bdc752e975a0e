#include <gtest/gtest.h>
#include "excelpipe/view/TableView.hpp"
#include "excelpipe/recipe/InventoryItem.hpp"
#include "excelpipe/core/Workbook.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace excelpipe;
using excelpipe::core::CellRange;
using excelpipe::core::ErrorCode;
using excelpipe::core::Severity;
using excelpipe::recipe::Rarity;

class TableViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        workbook = std::make_unique<core::Workbook>();
        sheet = &workbook->addWorksheet("Items");

        // B2:D5：表头 Name | Rarity | Cost，三行数据
        sheet->setValue(1, 1, "Name");
        sheet->setValue(1, 2, "Rarity");
        sheet->setValue(1, 3, "Cost");
        writeRow(2, "Herb", "Common", 5);
        writeRow(3, "Water", "", 1);
        writeRow(4, "Ember", "Mythic", 12);

        core::TableDefinition definition;
        definition.name = "Ingredients";
        definition.ref = CellRange(1, 1, 4, 3);
        definition.column_names = {"Name", "Rarity", "Cost"};
        table = &sheet->addTable(std::move(definition));

        view = std::make_unique<view::TableView>(*sheet, *table, &log);
    }

    void TearDown() override {
        view.reset();
        workbook.reset();
    }

    void writeRow(int row, const std::string& name, const std::string& rarity, int cost) {
        sheet->setValue(row, 1, name);
        sheet->setValue(row, 2, rarity);
        sheet->setValue(row, 3, cost);
    }

    std::unique_ptr<core::Workbook> workbook;
    core::Worksheet* sheet = nullptr;
    core::TableDefinition* table = nullptr;
    core::DiagnosticLog log;
    std::unique_ptr<view::TableView> view;
};

// 测试行列数由表格区域推导
TEST_F(TableViewTest, Counts) {
    EXPECT_EQ(view->name(), "Ingredients");
    EXPECT_EQ(view->rowCount(), 3);
    EXPECT_EQ(view->columnCount(), 3);
    EXPECT_TRUE(view->hasColumn("Cost"));
    EXPECT_FALSE(view->hasColumn("cost"));
    EXPECT_EQ(view->resolveColumn("Cost"), 2);
}

// 测试只有表头的表格
TEST_F(TableViewTest, HeaderOnlyTable) {
    core::TableDefinition definition;
    definition.name = "Empty";
    definition.ref = CellRange(10, 0, 10, 1);
    definition.column_names = {"A", "B"};
    auto& empty = sheet->addTable(std::move(definition));

    view::TableView empty_view(*sheet, empty, &log);
    EXPECT_EQ(empty_view.rowCount(), 0);
    EXPECT_EQ(empty_view.getValue<int>(1, "A"), 0);
    EXPECT_EQ(log.count(ErrorCode::RowOutOfRange), 1u);
}

// 测试类型化读取
TEST_F(TableViewTest, GetTypedValues) {
    EXPECT_EQ(view->getValue<std::string>(1, "Name"), "Herb");
    EXPECT_EQ(view->getValue<int>(1, "Cost"), 5);
    EXPECT_DOUBLE_EQ(view->getValue<double>(3, "Cost"), 12.0);
    EXPECT_EQ(view->getValue<std::string>(3, "Cost"), "12");
    EXPECT_EQ(view->getValue<std::string>(2, "Rarity"), "");
    EXPECT_TRUE(log.empty());
}

// 测试行号越界
TEST_F(TableViewTest, RowOutOfRange) {
    EXPECT_EQ(view->getValue<int>(0, "Cost"), 0);
    EXPECT_EQ(view->getValue<std::string>(4, "Name"), "");

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.entries()[1].code, ErrorCode::RowOutOfRange);
    EXPECT_EQ(log.entries()[1].severity, Severity::Error);
    EXPECT_EQ(log.entries()[1].message, "Tried to access row 4 of table 'Ingredients'. Valid rows are 1 - 3.");
}

// 测试找不到列时的诊断
TEST_F(TableViewTest, ColumnNotFound) {
    EXPECT_EQ(view->getValue<int>(1, "cost"), 0);

    ASSERT_EQ(log.size(), 1u);
    const auto& diagnostic = log.entries()[0];
    EXPECT_EQ(diagnostic.code, ErrorCode::ColumnNotFound);
    EXPECT_EQ(diagnostic.source, "Ingredients");
    EXPECT_EQ(diagnostic.column, "cost");
    EXPECT_NE(diagnostic.message.find("'Name' 'Rarity' 'Cost'"), std::string::npos);
    EXPECT_NE(diagnostic.message.find("(Check capitalization and whitespace)"), std::string::npos);
}

// 测试 tryGetValue 只返回诊断不记录
TEST_F(TableViewTest, TryGetValueDoesNotReport) {
    auto missing = view->tryGetValue<int>(1, "Weight");
    EXPECT_FALSE(missing.found());
    ASSERT_EQ(missing.diagnostics.size(), 1u);
    EXPECT_EQ(missing.diagnostics[0].code, ErrorCode::ColumnNotFound);

    auto blank = view->tryGetValue<std::string>(2, "Rarity");
    EXPECT_FALSE(blank.found());
    EXPECT_FALSE(blank.hasDiagnostics());

    EXPECT_TRUE(log.empty());
}

// 测试无法转换的文本
TEST_F(TableViewTest, CoercionFailureWarns) {
    sheet->setValue(4, 3, "lots");
    EXPECT_EQ(view->getValue<int>(3, "Cost"), 0);

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].code, ErrorCode::InvalidCellValue);
    EXPECT_EQ(log.entries()[0].severity, Severity::Warning);
}

// 测试枚举读取：有效、空白、未知
TEST_F(TableViewTest, GetEnum) {
    Rarity rarity = Rarity::Epic;
    EXPECT_TRUE(view->getEnum(1, "Rarity", rarity));
    EXPECT_EQ(rarity, Rarity::Common);

    rarity = Rarity::Epic;
    EXPECT_FALSE(view->getEnum(2, "Rarity", rarity));
    EXPECT_EQ(rarity, Rarity::Unset);
    EXPECT_TRUE(log.empty());

    EXPECT_FALSE(view->getEnum(3, "Rarity", rarity));
    EXPECT_EQ(rarity, Rarity::Unset);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].code, ErrorCode::EnumLabelNotFound);
    EXPECT_EQ(log.entries()[0].message, "Unknown Rarity value 'Mythic' in table Ingredients, row 3, column Rarity.");
}

// 测试枚举标签大小写敏感、首尾空白被裁剪
TEST_F(TableViewTest, EnumLabelCaseAndWhitespace) {
    sheet->setValue(2, 2, "  Rare ");
    sheet->setValue(3, 2, "rare");

    Rarity rarity = Rarity::Unset;
    EXPECT_TRUE(view->getEnum(1, "Rarity", rarity));
    EXPECT_EQ(rarity, Rarity::Rare);
    EXPECT_FALSE(view->getEnum(2, "Rarity", rarity));
    EXPECT_EQ(log.count(ErrorCode::EnumLabelNotFound), 1u);
}

// 测试写入后读回
TEST_F(TableViewTest, SetValueRoundTrip) {
    EXPECT_TRUE(view->setValue(2, "Cost", 8));
    EXPECT_EQ(view->getValue<int>(2, "Cost"), 8);

    EXPECT_TRUE(view->setValue(2, "Name", std::string("Spring Water")));
    EXPECT_EQ(view->getValue<std::string>(2, "Name"), "Spring Water");

    EXPECT_FALSE(view->setValue(9, "Cost", 1));
    EXPECT_EQ(log.count(ErrorCode::RowOutOfRange), 1u);
}

// 测试整列读取
TEST_F(TableViewTest, GetColumnValues) {
    auto costs = view->getColumnValues<int>("Cost");
    ASSERT_TRUE(costs.has_value());
    EXPECT_EQ(*costs, (std::vector<int>{5, 1, 12}));

    EXPECT_FALSE(view->getColumnValues<int>("Weight").has_value());
    EXPECT_EQ(log.count(ErrorCode::ColumnNotFound), 1u);
}

// 测试按位置读取列组
TEST_F(TableViewTest, GetColumnBlock) {
    auto block = view->getColumnBlock<std::string>("Name", 2);
    ASSERT_TRUE(block.has_value());
    ASSERT_EQ(block->size(), 3u);
    EXPECT_EQ((*block)[0], (std::vector<std::string>{"Herb", "Common"}));
    EXPECT_EQ((*block)[1], (std::vector<std::string>{"Water", ""}));
}

// 测试写整列时扩展行数
TEST_F(TableViewTest, SetColumnGrowsRows) {
    std::vector<std::string> names{"Herb", "Water", "Ember", "Moss", "Salt"};
    ASSERT_TRUE(view->setColumn("Name", names));

    EXPECT_EQ(view->rowCount(), 5);
    EXPECT_EQ(table->ref.last_row, 6);
    auto read = view->getColumnValues<std::string>("Name");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, names);
}

// 测试扩展行数后未写入的列仍与原数据行对齐
TEST_F(TableViewTest, GrowthKeepsOtherColumnsAligned) {
    std::vector<std::string> names{"Herb", "Water", "Ember", "Moss", "Salt"};
    ASSERT_TRUE(view->setColumn("Name", names));
    ASSERT_EQ(view->rowCount(), 5);

    EXPECT_EQ(view->getValue<int>(1, "Cost"), 5);
    EXPECT_EQ(view->getValue<int>(2, "Cost"), 1);
    EXPECT_EQ(view->getValue<int>(3, "Cost"), 12);
    EXPECT_EQ(view->getValue<std::string>(1, "Rarity"), "Common");
    EXPECT_EQ(view->getValue<std::string>(3, "Rarity"), "Mythic");

    // 新增的行是空行
    EXPECT_FALSE(view->tryGetValue<int>(4, "Cost").found());
    EXPECT_FALSE(view->tryGetValue<int>(5, "Cost").found());
    EXPECT_TRUE(sheet->getCell(6, 3).isBlank());
}

// 测试汇总行在扩展后仍位于最后
TEST_F(TableViewTest, GrowthKeepsTotalsRowLast) {
    sheet->setValue(5, 1, "Total");
    sheet->setValue(5, 3, 18);
    table->ref.last_row = 5;
    table->totals_row_count = 1;
    view = std::make_unique<view::TableView>(*sheet, *table, &log);
    ASSERT_EQ(view->rowCount(), 3);

    std::vector<int> costs{5, 1, 12, 7};
    ASSERT_TRUE(view->setColumn("Cost", costs));
    EXPECT_EQ(view->rowCount(), 4);
    EXPECT_EQ(table->ref.last_row, 6);
    EXPECT_EQ(view->getValue<std::string>(3, "Name"), "Ember");
    EXPECT_EQ(sheet->getCell(6, 1).getStringValue(), "Total");
    EXPECT_EQ(sheet->getCell(6, 3).getNumberValue(), 18.0);
}

// 测试不存在的列：追加或失败
TEST_F(TableViewTest, SetColumnAppendIfAbsent) {
    std::vector<int> weights{3, 4, 5};
    EXPECT_FALSE(view->setColumn("Weight", weights));
    EXPECT_EQ(view->columnCount(), 3);
    EXPECT_EQ(log.count(ErrorCode::ColumnNotFound), 1u);

    ASSERT_TRUE(view->setColumn("Weight", weights, true));
    EXPECT_EQ(view->columnCount(), 4);
    EXPECT_TRUE(view->hasColumn("Weight"));
    EXPECT_EQ(sheet->getCell(1, 4).getStringValue(), "Weight");
    EXPECT_EQ(table->column_names.back(), "Weight");
    EXPECT_EQ(view->getValue<int>(3, "Weight"), 5);
}

// 测试列组写入：起始列无法解析时不扩展表格
TEST_F(TableViewTest, SetColumnBlockResolvesBeforeGrowth) {
    std::vector<std::vector<int>> values{{1, 2}, {3, 4}, {5, 6}, {7, 8}};
    EXPECT_FALSE(view->setColumnBlock("Missing", values));
    EXPECT_EQ(view->rowCount(), 3);

    ASSERT_TRUE(view->setColumnBlock("Rarity", values));
    EXPECT_EQ(view->rowCount(), 4);
    EXPECT_EQ(view->getValue<int>(4, "Rarity"), 7);
    EXPECT_EQ(view->getValue<int>(4, "Cost"), 8);
    EXPECT_EQ(view->getValue<std::string>(1, "Name"), "Herb");
    EXPECT_EQ(view->getValue<std::string>(3, "Name"), "Ember");
}

// 测试列组越过工作表最后一列时报告错误且不扩展表格
TEST_F(TableViewTest, SetColumnBlockPastLastSheetColumn) {
    std::vector<std::vector<int>> values{{1, 2}, {3, 4}, {5, 6}, {7, 8}};
    values.push_back(std::vector<int>(16384, 9));

    EXPECT_FALSE(view->setColumnBlock("Name", values));
    EXPECT_EQ(log.count(ErrorCode::InvalidArgument), 1u);
    EXPECT_EQ(view->rowCount(), 3);
    EXPECT_EQ(view->getValue<int>(1, "Cost"), 5);
    EXPECT_TRUE(sheet->getCell(2, 4).isBlank());
}

// 测试行编号
TEST_F(TableViewTest, NumberRows) {
    ASSERT_TRUE(view->numberRows("Cost"));
    EXPECT_EQ(view->getColumnValues<int>("Cost").value(), (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(view->numberRows("#"));
}
