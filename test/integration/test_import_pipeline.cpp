// ExcelPipe 集成测试：工作簿写出 -> 读取 -> 导入物品与配方 -> 导出配方索引

#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/importer/PotionImporter.hpp"
#include "excelpipe/recipe/ItemRegistry.hpp"
#include "excelpipe/recipe/RecipeCollection.hpp"
#include "excelpipe/view/WorkbookIndex.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace excelpipe {
namespace importer {

namespace {

using Row = std::vector<std::string>;

/**
 * @brief 在新工作表的 A1 处建立表格，数据全部按文本写入
 */
void addTable(core::Workbook& workbook, const std::string& name, const Row& headers, const std::vector<Row>& rows) {
    auto& sheet = workbook.addWorksheet(name);
    for (size_t col = 0; col < headers.size(); ++col) {
        sheet.setValue(0, static_cast<int>(col), headers[col]);
    }
    for (size_t row = 0; row < rows.size(); ++row) {
        for (size_t col = 0; col < rows[row].size(); ++col) {
            sheet.setValue(static_cast<int>(row) + 1, static_cast<int>(col), rows[row][col]);
        }
    }

    core::TableDefinition definition;
    definition.name = name;
    definition.ref = core::CellRange(0, 0, static_cast<int>(rows.size()), static_cast<int>(headers.size()) - 1);
    definition.column_names = headers;
    sheet.addTable(std::move(definition));
}

} // namespace

// 导入流水线集成测试套件
class ImportPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = "test_import_pipeline";
        std::filesystem::create_directories(test_dir_);
        workbook_path_ = test_dir_ + "/PotionCrafting.xlsx";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    /**
     * @brief 写出一个与 PotionCrafting.xlsx 布局相同的工作簿
     */
    void writeWorkbook(const std::vector<Row>& recipes, bool with_potions = true, bool with_export = false) {
        core::Workbook workbook;
        addTable(workbook, "Ingredients", {"Name", "Rarity", "Cost", "Uses"}, {
            {"Herb", "Common", "5", "3"},
            {"Water", "", "1", "10"},
            {"Ember", "Rare", "12", "1"},
            {"", "", "", ""},
        });
        if (with_potions) {
            addTable(workbook, "Potions", {"Name", "Rarity", "Cost", "Max Profit"}, {
                {"Potion A", "Uncommon", "20", "30"},
                {"Potion B", "Epic", "50", "80"},
            });
        }
        addTable(workbook, "Recipes", {"Potion", "Item 1", "Item 2", "Item 3"}, recipes);
        if (with_export) {
            addTable(workbook, "Export", {"Potion"}, {});
        }

        auto saved = workbook.save(core::Path(workbook_path_));
        ASSERT_TRUE(saved) << saved.error().message;
    }

    std::unique_ptr<view::WorkbookIndex> loadIndex() {
        auto loaded = view::WorkbookIndex::load(core::Path(workbook_path_));
        EXPECT_TRUE(loaded) << loaded.error().message;
        return loaded ? std::move(loaded).value() : nullptr;
    }

    std::string test_dir_;
    std::string workbook_path_;
    recipe::ItemRegistry items_;
    recipe::RecipeCollection recipes_;
};

// 测试单条配方的端到端导入
TEST_F(ImportPipelineTest, SingleRecipe) {
    writeWorkbook({{"Potion A", "Herb", "Water", ""}});
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    PotionImporter importer(items_, recipes_);
    auto report = importer.run(*index);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.item_tables_read, 2u);
    ASSERT_EQ(recipes_.size(), 1u);
    EXPECT_EQ(recipes_.recipes()[0].label(), "(Herb + Water) => Potion A");
    EXPECT_EQ(recipes_.findProduct({items_.resolve("Water"), items_.resolve("Herb")}), items_.resolve("Potion A"));
}

// 测试物品字段导入
TEST_F(ImportPipelineTest, ImportsItems) {
    writeWorkbook({{"Potion A", "Herb", "Water", ""}});
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    PotionImporter importer(items_, recipes_);
    auto report = importer.run(*index);

    EXPECT_EQ(report.items_created, 5u);
    EXPECT_EQ(report.items_updated, 0u);
    EXPECT_EQ(report.rows_skipped, 1u);
    EXPECT_EQ(items_.size(), 5u);

    const auto* herb = items_.resolve("Herb");
    ASSERT_NE(herb, nullptr);
    EXPECT_EQ(herb->category, "Ingredients");
    EXPECT_EQ(herb->display_name, "Herb");
    EXPECT_EQ(herb->rarity, recipe::Rarity::Common);
    EXPECT_EQ(herb->cost, 5);
    EXPECT_EQ(herb->uses, 3);

    const auto* water = items_.resolve("Water");
    ASSERT_NE(water, nullptr);
    EXPECT_EQ(water->rarity, recipe::Rarity::Unset);

    const auto* potion = items_.resolve("Potion A");
    ASSERT_NE(potion, nullptr);
    EXPECT_EQ(potion->category, "Potions");
    EXPECT_EQ(potion->rarity, recipe::Rarity::Uncommon);
    EXPECT_EQ(potion->max_profit, 30);

    // 再次导入只更新已有物品
    auto again = importer.run(*index);
    EXPECT_EQ(again.items_created, 0u);
    EXPECT_EQ(again.items_updated, 5u);
    EXPECT_EQ(items_.size(), 5u);
}

// 测试重复与无效的配方行
TEST_F(ImportPipelineTest, DuplicateAndRejectedRows) {
    writeWorkbook({
        {"Potion A", "Herb", "Water", ""},
        {"Potion A", "Water", "Herb", ""},
        {"Potion B", "Ember", "", ""},
        {"Potion Z", "Herb", "", ""},
        {"Potion B", "", "", ""},
    });
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    PotionImporter importer(items_, recipes_);
    auto report = importer.run(*index);

    EXPECT_EQ(report.recipe_rows, 5u);
    EXPECT_EQ(report.recipes_added, 2u);
    EXPECT_EQ(report.recipe_rows_rejected, 2u);
    EXPECT_EQ(report.duplicate_recipes, 1u);
    EXPECT_EQ(report.warnings, 1u);
    EXPECT_EQ(report.errors, 0u);
    EXPECT_EQ(recipes_.size(), 2u);
    EXPECT_EQ(index->diagnostics().count(core::ErrorCode::DuplicateRecipe), 1u);

    // 重新导入前清空集合，记录数不变
    auto again = importer.run(*index);
    EXPECT_EQ(again.recipes_added, 2u);
    EXPECT_EQ(recipes_.size(), 2u);
}

// 测试导出配方索引并保存
TEST_F(ImportPipelineTest, ExportAndSave) {
    writeWorkbook({
        {"Potion A", "Herb", "Water", ""},
        {"Potion B", "Ember", "", ""},
    }, true, true);
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    ImportOptions options;
    options.export_table = "Export";
    options.save_path = test_dir_ + "/Exported.xlsx";
    PotionImporter importer(items_, recipes_, options);
    auto report = importer.run(*index);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.exported_rows, 2u);
    EXPECT_TRUE(report.saved);

    auto* exported = index->findTable("Export");
    ASSERT_NE(exported, nullptr);
    EXPECT_EQ(exported->rowCount(), 2);
    EXPECT_EQ(exported->columns().names(), (std::vector<std::string>{"Potion", "Item 1", "Item 2", "Item 3", "#"}));
    EXPECT_EQ(exported->getValue<std::string>(1, "Potion"), "Potion A");
    EXPECT_EQ(exported->getValue<std::string>(1, "Item 2"), "Water");
    EXPECT_EQ(exported->getValue<std::string>(2, "Item 1"), "Ember");
    EXPECT_EQ(exported->getValue<std::string>(2, "Item 2"), "");
    EXPECT_EQ(exported->getValue<int>(2, "#"), 2);

    auto reloaded = view::WorkbookIndex::load(core::Path(options.save_path));
    ASSERT_TRUE(reloaded);
    auto* persisted = reloaded.value()->findTable("Export");
    ASSERT_NE(persisted, nullptr);
    EXPECT_EQ(persisted->rowCount(), 2);
    EXPECT_EQ(persisted->getValue<std::string>(2, "Potion"), "Potion B");
}

// 测试物品名和配方名带首尾空白时仍能对上
TEST_F(ImportPipelineTest, NamesWithSurroundingWhitespace) {
    {
        core::Workbook workbook;
        addTable(workbook, "Ingredients", {"Name", "Rarity", "Cost"}, {
            {"Herb ", "Common", "5"},
            {" Water", "", "1"},
        });
        addTable(workbook, "Potions", {"Name", "Rarity", "Cost"}, {
            {"Potion A ", "Uncommon", "20"},
        });
        addTable(workbook, "Recipes", {"Potion", "Item 1", "Item 2", "Item 3"}, {
            {"Potion A ", "Herb ", " Water", ""},
        });
        auto saved = workbook.save(core::Path(workbook_path_));
        ASSERT_TRUE(saved) << saved.error().message;
    }
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    PotionImporter importer(items_, recipes_);
    auto report = importer.run(*index);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.items_created, 3u);
    ASSERT_NE(items_.resolve("Herb"), nullptr);
    ASSERT_NE(items_.resolve("Water"), nullptr);

    EXPECT_EQ(report.recipes_added, 1u);
    EXPECT_EQ(report.recipe_rows_rejected, 0u);
    ASSERT_EQ(recipes_.size(), 1u);
    EXPECT_EQ(recipes_.recipes()[0].ingredients.size(), 2u);
    EXPECT_EQ(recipes_.recipes()[0].label(), "(Herb + Water) => Potion A");
}

// 测试缺少表格时报告错误并继续
TEST_F(ImportPipelineTest, MissingTable) {
    writeWorkbook({{"Potion A", "Herb", "Water", ""}}, false);
    auto index = loadIndex();
    ASSERT_NE(index, nullptr);

    PotionImporter importer(items_, recipes_);
    auto report = importer.run(*index);

    EXPECT_FALSE(report.succeeded());
    EXPECT_EQ(report.item_tables_read, 1u);
    EXPECT_EQ(report.errors, 1u);
    ASSERT_EQ(index->diagnostics().count(core::ErrorCode::TableNotFound), 1u);
    EXPECT_EQ(index->diagnostics().entries().front().message,
              "Could not find table 'Potions' in PotionCrafting.xlsx");

    // 产物不存在，配方行被跳过
    EXPECT_EQ(report.recipe_rows_rejected, 1u);
    EXPECT_TRUE(recipes_.empty());
}

}} // namespace excelpipe::importer
