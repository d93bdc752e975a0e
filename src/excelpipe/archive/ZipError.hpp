#pragma once

namespace excelpipe {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 文件太大
    FileNotFound,         // 文件未找到
    InvalidParameter,     // 无效参数
    InternalError         // 内部错误
};

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

inline const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "ok";
        case ZipError::NotOpen:          return "archive not open";
        case ZipError::IoFail:           return "I/O failure";
        case ZipError::BadFormat:        return "bad ZIP format";
        case ZipError::TooLarge:         return "entry too large";
        case ZipError::FileNotFound:     return "entry not found";
        case ZipError::InvalidParameter: return "invalid parameter";
        default:                         return "internal error";
    }
}

}} // namespace excelpipe::archive
