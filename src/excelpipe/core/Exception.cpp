/**
 * @file Exception.cpp
 * @brief ExcelPipe异常类实现
 */

#include "excelpipe/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace excelpipe {
namespace core {

ExcelPipeException::ExcelPipeException(const std::string& message,
                                       ErrorCode code,
                                       const char* file,
                                       int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string ExcelPipeException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(error_code_) << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void ExcelPipeException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : ExcelPipeException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : ExcelPipeException(parameter_name.empty() ? message
                                                : fmt::format("{} (parameter: {})", message, parameter_name),
                         ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : ExcelPipeException(operation.empty() ? message
                                           : fmt::format("{} (operation: {})", message, operation),
                         code, file, line)
    , operation_(operation) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError: {
            FileException ex(error.message, error.context, error.code);
            throw ex;
        }
        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());
        default: {
            OperationException ex(error.message, "", error.code);
            if (!error.context.empty()) {
                ex.addContext(error.context);
            }
            throw ex;
        }
    }
}

}} // namespace excelpipe::core
