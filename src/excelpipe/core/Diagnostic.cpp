#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace excelpipe {
namespace core {

const char* toString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
        default:                return "unknown";
    }
}

std::string Diagnostic::describe() const {
    std::string location;
    if (!source.empty()) {
        location += fmt::format(" table/range '{}'", source);
    }
    if (row > 0) {
        location += fmt::format(" row {}", row);
    }
    if (!column.empty()) {
        location += fmt::format(" column '{}'", column);
    }
    if (location.empty()) {
        return fmt::format("[{}] {}", toString(code), message);
    }
    return fmt::format("[{}]{}: {}", toString(code), location, message);
}

void DiagnosticLog::report(Diagnostic diagnostic) {
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::report(const std::vector<Diagnostic>& diagnostics) {
    entries_.insert(entries_.end(), diagnostics.begin(), diagnostics.end());
}

size_t DiagnosticLog::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [severity](const Diagnostic& d) { return d.severity == severity; }));
}

size_t DiagnosticLog::count(ErrorCode code) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [code](const Diagnostic& d) { return d.code == code; }));
}

const char* moduleTag(LogModule module) noexcept {
    switch (module) {
        case LogModule::Core:   return "core";
        case LogModule::View:   return "view";
        case LogModule::Recipe: return "rcpe";
        case LogModule::Import: return "impt";
        default:                return "unkn";
    }
}

void emitDiagnostic(DiagnosticLog* log, Diagnostic diagnostic, LogModule module) {
    switch (diagnostic.severity) {
        case Severity::Error:
            EXCELPIPE_LOG_ERROR("[ERR][{}] {}", moduleTag(module), diagnostic.describe());
            break;
        case Severity::Warning:
            EXCELPIPE_LOG_WARN("[WRN][{}] {}", moduleTag(module), diagnostic.describe());
            break;
        default:
            EXCELPIPE_LOG_INFO("[INF][{}] {}", moduleTag(module), diagnostic.describe());
            break;
    }
    if (log) {
        log->report(std::move(diagnostic));
    }
}

}} // namespace excelpipe::core
