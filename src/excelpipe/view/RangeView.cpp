#include "excelpipe/view/RangeView.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

namespace excelpipe {
namespace view {

RangeView::RangeView(core::Worksheet& sheet, core::NamedRange& range, core::DiagnosticLog* log)
    : sheet_(&sheet)
    , range_(&range)
    , log_(log)
    , cells_(sheet) {
}

void RangeView::numberRows() {
    const int rows = rowCount();
    for (int row = 1; row <= rows; ++row) {
        cells_.setTyped(sheetRow(row), sheetColumn(1), row);
    }
}

void RangeView::numberColumns() {
    const int columns = columnCount();
    for (int column = 1; column <= columns; ++column) {
        cells_.setTyped(sheetRow(1), sheetColumn(column), column);
    }
}

bool RangeView::expandToFit(int rows, int columns) {
    // 先插行再插列，列数在行插入完成后重新计算
    if (rows > rowCount()) {
        const int missing = rows - rowCount();
        auto result = sheet_->insertRows(range_->range.first_row + 1, missing);
        if (!result) {
            report(core::Diagnostic(core::Severity::Error, core::ErrorCode::StructuralGrowthFailed,
                                    fmt::format("Cannot grow range '{}' by {} rows: {}",
                                                name(), missing, result.error().message),
                                    name()));
            return false;
        }
    }

    if (columns > columnCount()) {
        const int missing = columns - columnCount();
        auto result = sheet_->insertColumns(range_->range.first_col + 1, missing);
        if (!result) {
            report(core::Diagnostic(core::Severity::Error, core::ErrorCode::StructuralGrowthFailed,
                                    fmt::format("Cannot grow range '{}' by {} columns: {}",
                                                name(), missing, result.error().message),
                                    name()));
            return false;
        }
    }

    VIEW_DEBUG("Range '{}' now spans {}", name(), range_->range.toReference());
    return true;
}

core::Diagnostic RangeView::outOfRange(int row, int column) const {
    return core::Diagnostic(core::Severity::Error, core::ErrorCode::RowOutOfRange,
                            fmt::format("Tried to access row {}, column {} of range '{}'. "
                                        "Valid rows are 1 - {}, valid columns are 1 - {}.",
                                        row, column, name(), rowCount(), columnCount()),
                            name(), row, std::to_string(column));
}

core::Diagnostic RangeView::invalidValue(int row, int column, const std::string& text) const {
    return core::Diagnostic(core::Severity::Warning, core::ErrorCode::InvalidCellValue,
                            fmt::format("Cannot convert '{}' in range '{}', row {}, column {}.",
                                        text, name(), row, column),
                            name(), row, std::to_string(column));
}

void RangeView::report(core::Diagnostic diagnostic) const {
    core::emitDiagnostic(log_, std::move(diagnostic));
}

void RangeView::report(const std::vector<core::Diagnostic>& diagnostics) const {
    for (const auto& diagnostic : diagnostics) {
        core::emitDiagnostic(log_, diagnostic);
    }
}

}} // namespace excelpipe::view
