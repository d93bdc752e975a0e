#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace excelpipe {
namespace importer {

/**
 * @brief 药水导入配置，默认值对应 PotionCrafting.xlsx 的表格布局
 */
struct ImportOptions {
    // 工作簿
    std::string workbook_path = "PotionCrafting.xlsx";

    // 物品表：每张表的名称同时作为物品分类
    std::vector<std::string> item_tables = {"Ingredients", "Potions"};
    std::string name_column = "Name";
    std::string rarity_column = "Rarity";
    std::string cost_column = "Cost";
    std::string uses_column = "Uses";              // 可选列
    std::string max_profit_column = "Max Profit";  // 可选列

    // 配方表
    std::string recipe_table = "Recipes";
    std::string product_column = "Potion";
    std::vector<std::string> ingredient_columns = {"Item 1", "Item 2", "Item 3"};

    // 导出配方索引的表格，为空时不导出
    std::string export_table;
    std::string export_number_column = "#";

    // 导入后另存的路径，为空时不保存
    std::string save_path;
};

/**
 * @brief 一次导入的统计
 */
struct ImportReport {
    size_t item_tables_read = 0;
    size_t items_created = 0;
    size_t items_updated = 0;
    size_t rows_skipped = 0;         // 名称为空的物品行
    size_t recipe_rows = 0;
    size_t recipes_added = 0;
    size_t recipe_rows_rejected = 0; // tryAdd 返回 false 的行
    size_t duplicate_recipes = 0;
    size_t exported_rows = 0;
    bool saved = false;
    size_t errors = 0;               // 本次导入产生的 Error 级诊断
    size_t warnings = 0;

    bool succeeded() const { return errors == 0; }
};

}} // namespace excelpipe::importer
