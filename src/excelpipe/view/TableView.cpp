#include "excelpipe/view/TableView.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

namespace excelpipe {
namespace view {

namespace {

/**
 * @brief 表头文本；无表头或表头单元格为空时使用表格定义里的列名
 */
std::vector<std::string> collectHeaders(const core::Worksheet& sheet, const core::TableDefinition& table) {
    std::vector<std::string> headers;
    const int columns = table.ref.columns();
    headers.reserve(static_cast<size_t>(columns));
    for (int offset = 0; offset < columns; ++offset) {
        std::string header;
        if (table.header_row_count > 0) {
            header = sheet.getCell(table.ref.first_row, table.ref.first_col + offset).toText();
        }
        if (utils::CommonUtils::isBlank(header) && static_cast<size_t>(offset) < table.column_names.size()) {
            header = table.column_names[static_cast<size_t>(offset)];
        }
        headers.push_back(std::move(header));
    }
    return headers;
}

} // namespace

TableView::TableView(core::Worksheet& sheet, core::TableDefinition& table, core::DiagnosticLog* log)
    : sheet_(&sheet)
    , table_(&table)
    , log_(log)
    , cells_(sheet)
    , columns_(collectHeaders(sheet, table)) {
    VIEW_DEBUG("Indexed table '{}' on sheet '{}': {} rows, {} columns",
               table.name, sheet.getName(), rowCount(), columns_.size());
}

bool TableView::appendColumn(const std::string& column) {
    const int at = table_->ref.last_col + 1;
    auto result = sheet_->insertColumns(at, 1);
    if (!result) {
        report(core::Diagnostic(core::Severity::Error, core::ErrorCode::StructuralGrowthFailed,
                                fmt::format("Cannot append column '{}' to table {}: {}",
                                            column, name(), result.error().message),
                                name(), 0, column));
        return false;
    }

    // insertColumns 已在表格定义末尾登记了占位列名，这里换成真正的名称
    if (!table_->column_names.empty()) {
        table_->column_names.back() = column;
    }
    if (table_->header_row_count > 0) {
        cells_.setTyped(table_->ref.first_row, at, column);
    }
    columns_.append(column);
    VIEW_DEBUG("Appended column '{}' to table '{}'", column, name());
    return true;
}

bool TableView::numberRows(const std::string& column) {
    auto position = columns_.resolve(column);
    if (!position) {
        report(columnNotFound(column, 0));
        return false;
    }
    const int rows = rowCount();
    for (int row = 1; row <= rows; ++row) {
        cells_.setTyped(sheetRow(row), sheetColumn(*position), row);
    }
    return true;
}

bool TableView::ensureRows(int rows) {
    const int missing = rows - rowCount();
    if (missing <= 0) {
        return true;
    }

    // 插在最后一个数据行之后（汇总行之前），已有数据行的位置不变
    const int at = table_->ref.last_row - table_->totals_row_count + 1;
    auto result = sheet_->insertRows(at, missing);
    if (!result) {
        report(core::Diagnostic(core::Severity::Error, core::ErrorCode::StructuralGrowthFailed,
                                fmt::format("Cannot grow table {} by {} rows: {}",
                                            name(), missing, result.error().message),
                                name()));
        return false;
    }
    VIEW_DEBUG("Grew table '{}' by {} rows, now {} rows", name(), missing, rowCount());
    return true;
}

core::Diagnostic TableView::columnNotFound(const std::string& column, int row) const {
    return core::Diagnostic(core::Severity::Error, core::ErrorCode::ColumnNotFound,
                            columns_.describeMissing(column, name()), name(), row, column);
}

core::Diagnostic TableView::rowOutOfRange(int row, const std::string& column) const {
    return core::Diagnostic(core::Severity::Error, core::ErrorCode::RowOutOfRange,
                            fmt::format("Tried to access row {} of table '{}'. Valid rows are 1 - {}.",
                                        row, name(), rowCount()),
                            name(), row, column);
}

core::Diagnostic TableView::invalidValue(int row, const std::string& column, const std::string& text) const {
    return core::Diagnostic(core::Severity::Warning, core::ErrorCode::InvalidCellValue,
                            fmt::format("Cannot convert '{}' in table {}, row {}, column {}.",
                                        text, name(), row, column),
                            name(), row, column);
}

void TableView::report(core::Diagnostic diagnostic) const {
    core::emitDiagnostic(log_, std::move(diagnostic));
}

void TableView::report(const std::vector<core::Diagnostic>& diagnostics) const {
    for (const auto& diagnostic : diagnostics) {
        core::emitDiagnostic(log_, diagnostic);
    }
}

}} // namespace excelpipe::view
