#include "excelpipe/view/WorkbookIndex.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

namespace excelpipe {
namespace view {

WorkbookIndex::WorkbookIndex(std::unique_ptr<core::Workbook> workbook)
    : workbook_(std::move(workbook)) {
    EXCELPIPE_THROW_IF(!workbook_, "WorkbookIndex requires a workbook", "workbook");
    refresh();
}

core::Result<std::unique_ptr<WorkbookIndex>> WorkbookIndex::load(const core::Path& path) {
    auto workbook = core::Workbook::open(path);
    if (!workbook) {
        return workbook.error();
    }
    return std::make_unique<WorkbookIndex>(std::move(workbook).value());
}

void WorkbookIndex::refresh() {
    tables_.clear();
    ranges_.clear();
    table_lookup_.clear();
    range_lookup_.clear();
    table_names_.clear();
    range_names_.clear();

    for (const auto& sheet : workbook_->worksheets()) {
        for (const auto& table : sheet->tables()) {
            if (table_lookup_.count(table->name) > 0) {
                core::emitDiagnostic(&diagnostics_, core::Diagnostic(
                    core::Severity::Warning, core::ErrorCode::DuplicateName,
                    fmt::format("Duplicate table name '{}' on sheet '{}'. Only the first table will be used.",
                                table->name, sheet->getName()),
                    table->name));
                continue;
            }
            tables_.push_back(std::make_unique<TableView>(*sheet, *table, &diagnostics_));
            table_lookup_.emplace(table->name, tables_.back().get());
            table_names_.push_back(table->name);
        }

        for (const auto& range : sheet->namedRanges()) {
            if (range_lookup_.count(range->name) > 0) {
                core::emitDiagnostic(&diagnostics_, core::Diagnostic(
                    core::Severity::Warning, core::ErrorCode::DuplicateName,
                    fmt::format("Duplicate range name '{}' on sheet '{}'. Only the first range will be used.",
                                range->name, sheet->getName()),
                    range->name));
                continue;
            }
            ranges_.push_back(std::make_unique<RangeView>(*sheet, *range, &diagnostics_));
            range_lookup_.emplace(range->name, ranges_.back().get());
            range_names_.push_back(range->name);
        }
    }

    VIEW_INFO("Indexed {} tables and {} named ranges", tables_.size(), ranges_.size());
}

TableView* WorkbookIndex::findTable(const std::string& name) {
    auto it = table_lookup_.find(name);
    return it != table_lookup_.end() ? it->second : nullptr;
}

RangeView* WorkbookIndex::findRange(const std::string& name) {
    auto it = range_lookup_.find(name);
    return it != range_lookup_.end() ? it->second : nullptr;
}

core::VoidResult WorkbookIndex::save(const core::Path& path) const {
    auto result = workbook_->save(path);
    if (!result) {
        VIEW_ERROR("Failed to save workbook to {}: {}", path.string(), result.error().message);
        return result;
    }
    VIEW_INFO("Saved workbook to {}", path.string());
    return result;
}

}} // namespace excelpipe::view
