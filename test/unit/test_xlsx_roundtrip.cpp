#include <gtest/gtest.h>
#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/view/WorkbookIndex.hpp"

#include <filesystem>
#include <memory>
#include <string>

using namespace excelpipe;
using excelpipe::core::CellRange;

class XLSXRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "test_xlsx_roundtrip";
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ + "/roundtrip.xlsx";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::unique_ptr<core::Workbook> saveAndReopen(const core::Workbook& workbook) {
        auto saved = workbook.save(core::Path(path_));
        EXPECT_TRUE(saved) << saved.error().message;
        auto reopened = core::Workbook::open(core::Path(path_));
        EXPECT_TRUE(reopened) << reopened.error().message;
        return reopened ? std::move(reopened).value() : nullptr;
    }

    std::string test_dir_;
    std::string path_;
};

// 测试单元格值、公式与空白保留
TEST_F(XLSXRoundTripTest, CellValues) {
    core::Workbook workbook;
    auto& sheet = workbook.addWorksheet("Data Sheet");
    sheet.setValue(0, 0, "  padded text ");
    sheet.setValue(0, 1, 3.25);
    sheet.setValue(0, 2, false);
    sheet.setValue(1, 0, 1);
    sheet.setValue(1, 1, 2);

    core::Cell total;
    total.setValue(3);
    total.setFormula("SUM(A2:B2)");
    sheet.setCell(1, 2, total);

    auto reopened = saveAndReopen(workbook);
    ASSERT_NE(reopened, nullptr);

    const auto* loaded = reopened->getWorksheet("Data Sheet");
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->getCell(0, 0).getStringValue(), "  padded text ");
    EXPECT_DOUBLE_EQ(loaded->getCell(0, 1).getNumberValue(), 3.25);
    EXPECT_EQ(loaded->getCell(0, 2).getType(), core::CellType::Boolean);
    EXPECT_FALSE(loaded->getCell(0, 2).getBooleanValue());
    EXPECT_EQ(loaded->getCell(1, 2).getFormula(), "SUM(A2:B2)");
    EXPECT_DOUBLE_EQ(loaded->getCell(1, 2).getNumberValue(), 3.0);
    EXPECT_EQ(loaded->getCellCount(), sheet.getCellCount());
}

// 测试表格与命名区域经过保存后仍可通过索引访问
TEST_F(XLSXRoundTripTest, TablesAndNamedRanges) {
    core::Workbook workbook;
    auto& items = workbook.addWorksheet("Items");
    items.setValue(0, 0, "Name");
    items.setValue(0, 1, "Cost");
    items.setValue(1, 0, "Herb");
    items.setValue(1, 1, 5);
    items.setValue(2, 0, "Water");
    items.setValue(2, 1, 1);

    core::TableDefinition definition;
    definition.name = "Ingredients";
    definition.ref = CellRange(0, 0, 2, 1);
    definition.column_names = {"Name", "Cost"};
    items.addTable(std::move(definition));

    items.setValue(5, 3, 0.15);
    workbook.addNamedRange("TaxRate", "Items", CellRange(5, 3, 5, 3));
    workbook.addDefinedName("Rate", "0.15");

    auto reopened = saveAndReopen(workbook);
    ASSERT_NE(reopened, nullptr);
    ASSERT_EQ(reopened->namedRanges().size(), 1u);
    EXPECT_EQ(reopened->namedRanges()[0].name, "TaxRate");
    EXPECT_EQ(reopened->namedRanges()[0].qualified_address, "Items!$D$6");
    ASSERT_EQ(reopened->otherDefinedNames().size(), 1u);
    EXPECT_EQ(reopened->otherDefinedNames()[0].formula, "0.15");

    view::WorkbookIndex index(std::move(reopened));
    auto* table = index.findTable("Ingredients");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->rowCount(), 2);
    EXPECT_EQ(table->getValue<std::string>(2, "Name"), "Water");
    EXPECT_EQ(table->getValue<int>(1, "Cost"), 5);

    auto* range = index.findRange("TaxRate");
    ASSERT_NE(range, nullptr);
    EXPECT_DOUBLE_EQ(range->getValue<double>(), 0.15);
    EXPECT_TRUE(index.diagnostics().empty());
}

// 测试扩展后的表格写出新的区域与列名
TEST_F(XLSXRoundTripTest, GrownTablePersists) {
    auto workbook = std::make_unique<core::Workbook>();
    auto& sheet = workbook->addWorksheet("Items");
    sheet.setValue(0, 0, "Name");
    sheet.setValue(1, 0, "Herb");

    core::TableDefinition definition;
    definition.name = "Ingredients";
    definition.ref = CellRange(0, 0, 1, 0);
    definition.column_names = {"Name"};
    sheet.addTable(std::move(definition));

    view::WorkbookIndex index(std::move(workbook));
    auto* table = index.findTable("Ingredients");
    ASSERT_NE(table, nullptr);
    ASSERT_TRUE(table->setColumn("Name", std::vector<std::string>{"Herb", "Water", "Ember"}));
    ASSERT_TRUE(table->setColumn("Cost", std::vector<int>{5, 1, 12}, true));
    ASSERT_TRUE(index.save(core::Path(path_)));

    auto loaded = view::WorkbookIndex::load(core::Path(path_));
    ASSERT_TRUE(loaded);
    auto* reloaded = loaded.value()->findTable("Ingredients");
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(reloaded->definition().ref, CellRange(0, 0, 3, 1));
    EXPECT_EQ(reloaded->definition().column_names, (std::vector<std::string>{"Name", "Cost"}));
    EXPECT_EQ(reloaded->getValue<int>(3, "Cost"), 12);
}
