#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace excelpipe {
namespace core {

/**
 * @brief ExcelPipe统一错误码
 *
 * 存储/IO 层通过 Result 返回错误码；
 * 视图层和配方索引把数据形状问题转成 Diagnostic，不抛异常。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,

    // Excel结构错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    CorruptedSharedStrings = 46,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlInvalidFormat = 62,
    XmlMissingElement = 63,

    // 视图访问 (100-119)
    ColumnNotFound = 100,
    TableNotFound = 101,
    RangeNotFound = 102,
    EnumLabelNotFound = 103,
    RowOutOfRange = 104,
    InvalidCellValue = 105,
    StructuralGrowthFailed = 106,
    DuplicateName = 107,

    // 配方索引 (120-139)
    DuplicateRecipe = 120,
    NoIngredients = 121,
    ProductNotFound = 122,
    TooManyIngredients = 123
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 把 Error 转成对应的异常抛出（定义在 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace excelpipe::core
