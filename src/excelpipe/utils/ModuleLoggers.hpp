#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 * 第一个参数必须是字符串字面量
 */

// 核心存储 (core)
#define CORE_DEBUG(...)    EXCELPIPE_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     EXCELPIPE_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     EXCELPIPE_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    EXCELPIPE_LOG_ERROR("[ERR][core] " __VA_ARGS__)
#define CORE_CRITICAL(...) EXCELPIPE_LOG_CRITICAL("[CRT][core] " __VA_ARGS__)

// 表格视图 (view)
#define VIEW_DEBUG(...)    EXCELPIPE_LOG_DEBUG("[DBG][view] " __VA_ARGS__)
#define VIEW_INFO(...)     EXCELPIPE_LOG_INFO("[INF][view] " __VA_ARGS__)
#define VIEW_WARN(...)     EXCELPIPE_LOG_WARN("[WRN][view] " __VA_ARGS__)
#define VIEW_ERROR(...)    EXCELPIPE_LOG_ERROR("[ERR][view] " __VA_ARGS__)

// 配方索引 (recipe)
#define RECIPE_DEBUG(...)  EXCELPIPE_LOG_DEBUG("[DBG][rcpe] " __VA_ARGS__)
#define RECIPE_INFO(...)   EXCELPIPE_LOG_INFO("[INF][rcpe] " __VA_ARGS__)
#define RECIPE_WARN(...)   EXCELPIPE_LOG_WARN("[WRN][rcpe] " __VA_ARGS__)
#define RECIPE_ERROR(...)  EXCELPIPE_LOG_ERROR("[ERR][rcpe] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  EXCELPIPE_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   EXCELPIPE_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   EXCELPIPE_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  EXCELPIPE_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// 写出模块 (writer)
#define WRITER_DEBUG(...)  EXCELPIPE_LOG_DEBUG("[DBG][writ] " __VA_ARGS__)
#define WRITER_INFO(...)   EXCELPIPE_LOG_INFO("[INF][writ] " __VA_ARGS__)
#define WRITER_WARN(...)   EXCELPIPE_LOG_WARN("[WRN][writ] " __VA_ARGS__)
#define WRITER_ERROR(...)  EXCELPIPE_LOG_ERROR("[ERR][writ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     EXCELPIPE_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      EXCELPIPE_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     EXCELPIPE_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) EXCELPIPE_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  EXCELPIPE_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  EXCELPIPE_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) EXCELPIPE_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 导入流程 (import)
#define IMPORT_DEBUG(...)  EXCELPIPE_LOG_DEBUG("[DBG][impt] " __VA_ARGS__)
#define IMPORT_INFO(...)   EXCELPIPE_LOG_INFO("[INF][impt] " __VA_ARGS__)
#define IMPORT_WARN(...)   EXCELPIPE_LOG_WARN("[WRN][impt] " __VA_ARGS__)
#define IMPORT_ERROR(...)  EXCELPIPE_LOG_ERROR("[ERR][impt] " __VA_ARGS__)
