#include <gtest/gtest.h>
#include "excelpipe/view/WorkbookIndex.hpp"
#include "excelpipe/core/Exception.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace excelpipe;
using excelpipe::core::CellRange;
using excelpipe::core::ErrorCode;

namespace {

core::TableDefinition makeTable(const std::string& name, const CellRange& ref, std::vector<std::string> columns) {
    core::TableDefinition definition;
    definition.name = name;
    definition.ref = ref;
    definition.column_names = std::move(columns);
    return definition;
}

} // namespace

class WorkbookIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto workbook = std::make_unique<core::Workbook>();
        auto& items = workbook->addWorksheet("Items");
        items.setValue(0, 0, "Name");
        items.setValue(1, 0, "Herb");
        items.addTable(makeTable("Ingredients", CellRange(0, 0, 1, 0), {"Name"}));

        auto& recipes = workbook->addWorksheet("Recipes");
        recipes.setValue(0, 0, "Potion");
        recipes.addTable(makeTable("Recipes", CellRange(0, 0, 0, 0), {"Potion"}));
        recipes.setValue(5, 5, 42);
        workbook->addNamedRange("Answer", "Recipes", CellRange(5, 5, 5, 5));

        index = std::make_unique<view::WorkbookIndex>(std::move(workbook));
    }

    std::unique_ptr<view::WorkbookIndex> index;
};

// 测试按名称查找
TEST_F(WorkbookIndexTest, FindByName) {
    EXPECT_EQ(index->tableCount(), 2u);
    EXPECT_EQ(index->rangeCount(), 1u);
    EXPECT_EQ(index->tableNames(), (std::vector<std::string>{"Ingredients", "Recipes"}));
    EXPECT_EQ(index->rangeNames(), (std::vector<std::string>{"Answer"}));

    auto* table = index->findTable("Ingredients");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->sheetName(), "Items");
    EXPECT_EQ(table->getValue<std::string>(1, "Name"), "Herb");

    auto* range = index->findRange("Answer");
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(range->getValue<int>(), 42);
}

// 测试名称区分大小写，找不到时不产生诊断
TEST_F(WorkbookIndexTest, LookupIsExact) {
    EXPECT_EQ(index->findTable("ingredients"), nullptr);
    EXPECT_EQ(index->findTable("Answer"), nullptr);
    EXPECT_EQ(index->findRange("Recipes"), nullptr);
    EXPECT_TRUE(index->diagnostics().empty());
}

// 测试视图诊断汇总到索引的收集器
TEST_F(WorkbookIndexTest, ViewsShareDiagnostics) {
    auto* table = index->findTable("Recipes");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->rowCount(), 0);
    EXPECT_EQ(table->getValue<std::string>(1, "Potion"), "");
    EXPECT_EQ(index->diagnostics().count(ErrorCode::RowOutOfRange), 1u);
}

// 测试重名表格保留第一个
TEST_F(WorkbookIndexTest, DuplicateNamesKeepFirst) {
    auto* recipes = index->workbook().getWorksheet("Recipes");
    ASSERT_NE(recipes, nullptr);
    recipes->addTable(makeTable("Ingredients", CellRange(10, 0, 12, 1), {"A", "B"}));
    recipes->addNamedRange("Answer", CellRange(20, 0, 20, 0));

    index->refresh();
    EXPECT_EQ(index->tableCount(), 2u);
    EXPECT_EQ(index->rangeCount(), 1u);
    EXPECT_EQ(index->findTable("Ingredients")->sheetName(), "Items");
    EXPECT_EQ(index->diagnostics().count(ErrorCode::DuplicateName), 2u);
}

// 测试结构修改后刷新视图
TEST_F(WorkbookIndexTest, RefreshPicksUpNewTables) {
    auto& extra = index->workbook().addWorksheet("Extra");
    extra.setValue(0, 0, "Id");
    extra.setValue(1, 0, 7);
    extra.addTable(makeTable("Extras", CellRange(0, 0, 1, 0), {"Id"}));

    EXPECT_EQ(index->findTable("Extras"), nullptr);
    index->refresh();
    ASSERT_NE(index->findTable("Extras"), nullptr);
    EXPECT_EQ(index->findTable("Extras")->getValue<int>(1, "Id"), 7);
}

// 测试构造参数校验
TEST(WorkbookIndexConstructionTest, RequiresWorkbook) {
    EXPECT_THROW(view::WorkbookIndex index(nullptr), core::ParameterException);
}

// 测试文件不存在
TEST(WorkbookIndexConstructionTest, LoadMissingFile) {
    auto loaded = view::WorkbookIndex::load(core::Path("does_not_exist.xlsx"));
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::FileNotFound);
}
