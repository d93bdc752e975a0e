#pragma once

// ExcelPipe - 基于表格的游戏数据导入库

#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/core/Workbook.hpp"
#include "excelpipe/importer/PotionImporter.hpp"
#include "excelpipe/recipe/RecipeCollection.hpp"
#include "excelpipe/utils/Logger.hpp"
#include "excelpipe/view/WorkbookIndex.hpp"

#include <string>

// 版本信息
#define EXCELPIPE_VERSION_MAJOR 1
#define EXCELPIPE_VERSION_MINOR 0
#define EXCELPIPE_VERSION_PATCH 0
#define EXCELPIPE_VERSION_STRING "1.0.0"

namespace excelpipe {

inline std::string getVersion() {
    return EXCELPIPE_VERSION_STRING;
}

/**
 * @brief 初始化日志系统
 * @param log_file_path 日志文件路径
 * @param level 日志级别
 * @param enable_console 是否同时输出到控制台
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "logs/excelpipe.log",
                utils::Logger::Level level = utils::Logger::Level::INFO,
                bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

} // namespace excelpipe
