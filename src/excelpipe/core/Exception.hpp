/**
 * @file Exception.hpp
 * @brief ExcelPipe异常类定义
 *
 * 只在进程边界（命令行）和编程错误（非法参数）时使用；
 * 表格数据问题一律走 Diagnostic。
 */

#ifndef EXCELPIPE_EXCEPTION_HPP
#define EXCELPIPE_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace excelpipe {
namespace core {

/**
 * @brief ExcelPipe基础异常类
 */
class ExcelPipeException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ExcelPipeException(const std::string& message,
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr,
                       int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（错误码 + 位置 + 上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public ExcelPipeException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public ExcelPipeException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public ExcelPipeException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

}} // namespace excelpipe::core

#define EXCELPIPE_THROW_PARAM(message, parameter) \
    throw ::excelpipe::core::ParameterException((message), (parameter), __FILE__, __LINE__)

#define EXCELPIPE_THROW_IF(condition, message, parameter) \
    do { if (condition) { EXCELPIPE_THROW_PARAM(message, parameter); } } while(0)

#endif // EXCELPIPE_EXCEPTION_HPP
