#pragma once

#include "excelpipe/core/ErrorCode.hpp"

#include <optional>
#include <string>
#include <vector>
#include <utility>

namespace excelpipe {
namespace core {

/**
 * @brief 诊断级别
 */
enum class Severity : uint8_t {
    Info = 0,
    Warning = 1,
    Error = 2
};

const char* toString(Severity severity) noexcept;

/**
 * @brief 一条结构化诊断
 *
 * 定位信息：表/区域名 + 数据行（1 起，0 表示不针对某一行）+ 列名。
 */
struct Diagnostic {
    Severity severity = Severity::Error;
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    std::string source;
    int row = 0;
    std::string column;

    Diagnostic() = default;
    Diagnostic(Severity sev, ErrorCode c, std::string msg,
               std::string src = {}, int r = 0, std::string col = {})
        : severity(sev), code(c), message(std::move(msg))
        , source(std::move(src)), row(r), column(std::move(col)) {}

    /**
     * @brief 带定位信息的单行描述
     */
    std::string describe() const;
};

/**
 * @brief 诊断收集器
 *
 * 由 WorkbookIndex 创建并分发给它的所有视图，配方索引也可以挂上同一个实例。
 * 写日志由 emitDiagnostic() 负责，report() 只负责记录。
 */
class DiagnosticLog {
public:
    void report(Diagnostic diagnostic);
    void report(const std::vector<Diagnostic>& diagnostics);

    const std::vector<Diagnostic>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    size_t count(Severity severity) const;
    size_t count(ErrorCode code) const;
    bool hasErrors() const { return count(Severity::Error) > 0; }

    void clear() { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
};

/**
 * @brief 产生诊断的模块，决定日志里的模块标签
 */
enum class LogModule : uint8_t {
    Core,
    View,
    Recipe,
    Import
};

/**
 * @brief 模块标签，与 ModuleLoggers.hpp 中各模块宏的标签相同
 */
const char* moduleTag(LogModule module) noexcept;

/**
 * @brief 按模块标签写日志，并在 log 非空时记录到收集器
 */
void emitDiagnostic(DiagnosticLog* log, Diagnostic diagnostic, LogModule module = LogModule::View);

/**
 * @brief 读取结果：可选值 + 诊断列表
 *
 * value 为空时表示“不存在”（空单元格、找不到列、越界等），
 * diagnostics 为空则说明这是合法的缺省，而不是失败。
 */
template<typename T>
struct ReadResult {
    std::optional<T> value;
    std::vector<Diagnostic> diagnostics;

    bool found() const { return value.has_value(); }
    bool hasDiagnostics() const { return !diagnostics.empty(); }

    T valueOr(T fallback) const {
        return value ? *value : fallback;
    }

    static ReadResult of(T v) {
        ReadResult r;
        r.value = std::move(v);
        return r;
    }

    static ReadResult absent() {
        return ReadResult{};
    }

    static ReadResult failed(Diagnostic d) {
        ReadResult r;
        r.diagnostics.push_back(std::move(d));
        return r;
    }
};

}} // namespace excelpipe::core
