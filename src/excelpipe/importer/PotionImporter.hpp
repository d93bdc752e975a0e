#pragma once

#include "excelpipe/importer/ImportOptions.hpp"
#include "excelpipe/recipe/ItemRegistry.hpp"
#include "excelpipe/recipe/RecipeCollection.hpp"
#include "excelpipe/view/WorkbookIndex.hpp"

#include <string>

namespace excelpipe {
namespace importer {

/**
 * @brief 药水数据导入流程
 *
 * 依次导入物品表、配方表，可选地把配方索引写回工作簿并另存。
 * 缺少某张表只报告 TableNotFound 错误，其余步骤照常执行。
 */
class PotionImporter {
public:
    PotionImporter(recipe::ItemRegistry& items, recipe::RecipeCollection& recipes,
                   ImportOptions options = ImportOptions());

    /**
     * @brief 执行完整导入
     */
    ImportReport run(view::WorkbookIndex& index);

    /**
     * @brief 导入一张物品表
     * @return 表格是否存在
     */
    bool importItems(view::WorkbookIndex& index, const std::string& table_name, ImportReport& report);

    /**
     * @brief 清空配方集合后逐行导入配方表
     */
    bool importRecipes(view::WorkbookIndex& index, ImportReport& report);

    /**
     * @brief 把配方集合写入导出表：产物列、原料列和编号列，缺少的列自动追加
     */
    bool exportRecipes(view::WorkbookIndex& index, ImportReport& report);

    const ImportOptions& options() const { return options_; }

private:
    view::TableView* requireTable(view::WorkbookIndex& index, const std::string& table_name) const;

    recipe::ItemRegistry& items_;
    recipe::RecipeCollection& recipes_;
    ImportOptions options_;
};

}} // namespace excelpipe::importer
