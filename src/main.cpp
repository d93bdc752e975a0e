/**
 * @file main.cpp
 * @brief excelpipe_cli：从 .xlsx 工作簿导入物品与配方
 *
 * 用法：excelpipe_cli <workbook.xlsx> [--out <path>] [--export-table <name>]
 *                     [--log-level <level>] [--log-file <path>]
 */

#include "excelpipe/ExcelPipe.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <iostream>
#include <string>

namespace {

struct CliOptions {
    excelpipe::importer::ImportOptions import;
    std::string log_level = "info";
    std::string log_file = "logs/excelpipe.log";
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <workbook.xlsx> [--out <path>] [--export-table <name>]"
                 " [--log-level <level>] [--log-file <path>]" << std::endl;
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    bool have_workbook = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--out") {
            if (!next(options.import.save_path)) return false;
        } else if (arg == "--export-table") {
            if (!next(options.import.export_table)) return false;
        } else if (arg == "--log-level") {
            if (!next(options.log_level)) return false;
        } else if (arg == "--log-file") {
            if (!next(options.log_file)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << std::endl;
            return false;
        } else if (!have_workbook) {
            options.import.workbook_path = arg;
            have_workbook = true;
        } else {
            std::cerr << "Unexpected argument " << arg << std::endl;
            return false;
        }
    }
    return have_workbook;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    using excelpipe::utils::Logger;
    if (!excelpipe::initialize(options.log_file, Logger::parseLevel(options.log_level), true)) {
        return 1;
    }

    int exit_code = 0;
    try {
        auto loaded = excelpipe::view::WorkbookIndex::load(excelpipe::core::Path(options.import.workbook_path));
        if (!loaded) {
            std::cerr << "Cannot open " << options.import.workbook_path << ": "
                      << loaded.error().message << " (" << excelpipe::core::toString(loaded.error().code) << ")"
                      << std::endl;
            excelpipe::cleanup();
            return 1;
        }
        auto& index = *loaded.value();

        excelpipe::recipe::ItemRegistry items;
        excelpipe::recipe::RecipeCollection recipes;
        excelpipe::importer::PotionImporter importer(items, recipes, options.import);
        auto report = importer.run(index);

        std::cout << "Items: " << report.items_created << " created, " << report.items_updated << " updated, "
                  << report.rows_skipped << " blank rows skipped" << std::endl;
        std::cout << "Recipes: " << report.recipes_added << " from " << report.recipe_rows << " rows, "
                  << report.duplicate_recipes << " duplicates" << std::endl;
        for (const auto& recipe : recipes.recipes()) {
            std::cout << "  " << recipe.label() << std::endl;
        }
        if (!options.import.export_table.empty()) {
            std::cout << "Exported " << report.exported_rows << " rows to " << options.import.export_table << std::endl;
        }
        if (report.saved) {
            std::cout << "Saved " << options.import.save_path << std::endl;
        }
        std::cout << "Diagnostics: " << report.errors << " errors, " << report.warnings << " warnings" << std::endl;

        if (!report.succeeded()) {
            exit_code = 1;
        }
    } catch (const excelpipe::core::ExcelPipeException& e) {
        EXCELPIPE_LOG_ERROR("Import aborted: {}", e.what());
        std::cerr << "Import aborted: " << e.what() << std::endl;
        exit_code = 1;
    }

    excelpipe::cleanup();
    return exit_code;
}
