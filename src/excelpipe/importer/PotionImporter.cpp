#include "excelpipe/importer/PotionImporter.hpp"
#include "excelpipe/utils/CommonUtils.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace excelpipe {
namespace importer {

PotionImporter::PotionImporter(recipe::ItemRegistry& items, recipe::RecipeCollection& recipes,
                               ImportOptions options)
    : items_(items)
    , recipes_(recipes)
    , options_(std::move(options)) {
}

ImportReport PotionImporter::run(view::WorkbookIndex& index) {
    ImportReport report;
    auto& diagnostics = index.diagnostics();
    const size_t errors_before = diagnostics.count(core::Severity::Error);
    const size_t warnings_before = diagnostics.count(core::Severity::Warning);
    const size_t duplicates_before = diagnostics.count(core::ErrorCode::DuplicateRecipe);

    recipes_.setDiagnostics(&diagnostics);

    for (const auto& table_name : options_.item_tables) {
        if (importItems(index, table_name, report)) {
            ++report.item_tables_read;
        }
    }

    importRecipes(index, report);

    if (!options_.export_table.empty()) {
        exportRecipes(index, report);
        // 导出可能插入了行列，重新建立视图
        index.refresh();
    }

    if (!options_.save_path.empty()) {
        auto result = index.save(core::Path(options_.save_path));
        if (result) {
            report.saved = true;
        } else {
            core::emitDiagnostic(&diagnostics, core::Diagnostic(
                core::Severity::Error, result.error().code,
                fmt::format("Could not save workbook to {}: {}", options_.save_path, result.error().message)),
                core::LogModule::Import);
        }
    }

    report.duplicate_recipes = diagnostics.count(core::ErrorCode::DuplicateRecipe) - duplicates_before;
    report.errors = diagnostics.count(core::Severity::Error) - errors_before;
    report.warnings = diagnostics.count(core::Severity::Warning) - warnings_before;

    IMPORT_INFO("Import Complete.");
    IMPORT_INFO("{} items created, {} updated, {} recipes, {} duplicates, {} errors",
                report.items_created, report.items_updated, report.recipes_added,
                report.duplicate_recipes, report.errors);
    return report;
}

bool PotionImporter::importItems(view::WorkbookIndex& index, const std::string& table_name, ImportReport& report) {
    auto* table = requireTable(index, table_name);
    if (!table) {
        return false;
    }

    const int rows = table->rowCount();
    for (int row = 1; row <= rows; ++row) {
        const std::string name = utils::CommonUtils::trim(table->getValue<std::string>(row, options_.name_column));
        if (name.empty()) {
            ++report.rows_skipped;
            continue;
        }

        const bool existed = items_.find(name) != nullptr;
        auto& item = items_.findOrCreate(name, table_name);
        if (existed) {
            ++report.items_updated;
        } else {
            ++report.items_created;
        }

        if (utils::CommonUtils::isBlank(item.display_name)) {
            item.display_name = name;
        }

        recipe::Rarity rarity = recipe::Rarity::Unset;
        if (table->getEnum(row, options_.rarity_column, rarity)) {
            item.rarity = rarity;
        }

        item.cost = table->getValue<int>(row, options_.cost_column);

        if (table->hasColumn(options_.uses_column)) {
            item.uses = table->getValue<int>(row, options_.uses_column);
        }
        if (table->hasColumn(options_.max_profit_column)) {
            item.max_profit = table->getValue<int>(row, options_.max_profit_column);
        }

        item.dirty = true;
        IMPORT_DEBUG("Imported {} '{}'", table_name, name);
    }

    IMPORT_INFO("Imported table '{}': {} rows", table_name, rows);
    return true;
}

bool PotionImporter::importRecipes(view::WorkbookIndex& index, ImportReport& report) {
    auto* table = requireTable(index, options_.recipe_table);
    if (!table) {
        return false;
    }

    recipes_.clear();

    const int rows = table->rowCount();
    for (int row = 1; row <= rows; ++row) {
        const std::string product = table->getValue<std::string>(row, options_.product_column);
        std::vector<std::string> ingredients;
        ingredients.reserve(options_.ingredient_columns.size());
        for (const auto& column : options_.ingredient_columns) {
            ingredients.push_back(table->getValue<std::string>(row, column));
        }

        ++report.recipe_rows;
        if (!recipes_.tryAdd(items_, product, ingredients)) {
            ++report.recipe_rows_rejected;
        }
    }

    report.recipes_added = recipes_.size();
    IMPORT_INFO("Imported {} recipes from {} rows of table '{}'", recipes_.size(), rows, options_.recipe_table);
    return true;
}

bool PotionImporter::exportRecipes(view::WorkbookIndex& index, ImportReport& report) {
    auto* table = requireTable(index, options_.export_table);
    if (!table) {
        return false;
    }

    // 导出表原有的多余行清空，不收缩表格
    const size_t rows = std::max(recipes_.size(), static_cast<size_t>(table->rowCount()));
    std::vector<std::string> products(rows);
    std::vector<std::vector<std::string>> ingredients(options_.ingredient_columns.size(),
                                                      std::vector<std::string>(rows));
    for (size_t i = 0; i < recipes_.size(); ++i) {
        const auto& recipe = recipes_.recipes()[i];
        products[i] = recipe.product->name;
        for (size_t slot = 0; slot < recipe.ingredients.size() && slot < ingredients.size(); ++slot) {
            ingredients[slot][i] = recipe.ingredients[slot]->name;
        }
    }

    if (!table->setColumn(options_.product_column, products, true)) {
        return false;
    }
    for (size_t slot = 0; slot < options_.ingredient_columns.size(); ++slot) {
        if (!table->setColumn(options_.ingredient_columns[slot], ingredients[slot], true)) {
            return false;
        }
    }
    if (!table->hasColumn(options_.export_number_column) && !table->appendColumn(options_.export_number_column)) {
        return false;
    }
    table->numberRows(options_.export_number_column);

    report.exported_rows = recipes_.size();
    IMPORT_INFO("Exported {} recipes to table '{}'", recipes_.size(), options_.export_table);
    return true;
}

view::TableView* PotionImporter::requireTable(view::WorkbookIndex& index, const std::string& table_name) const {
    auto* table = index.findTable(table_name);
    if (!table) {
        core::emitDiagnostic(&index.diagnostics(), core::Diagnostic(
            core::Severity::Error, core::ErrorCode::TableNotFound,
            fmt::format("Could not find table '{}' in {}", table_name, options_.workbook_path),
            table_name),
            core::LogModule::Import);
    }
    return table;
}

}} // namespace excelpipe::importer
