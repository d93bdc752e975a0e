#pragma once

#include "excelpipe/core/CellRange.hpp"
#include "excelpipe/core/Constants.hpp"
#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/core/Worksheet.hpp"
#include "excelpipe/view/CellAccessor.hpp"
#include "excelpipe/view/ColumnIndex.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace excelpipe {
namespace view {

/**
 * @brief 表格视图：按列名和数据行号访问一个表格
 *
 * 数据行号从 1 开始（不含表头与汇总行）。视图只保存指向工作表和表格定义的指针，
 * 行数、列数每次都从表格定义推导，扩展行后立即生效。
 *
 * 读取分两套接口：
 * - tryXxx() 返回 ReadResult，诊断放在结果里，不写日志；
 * - 普通接口把诊断写日志并记入 DiagnosticLog，然后返回类型的缺省值。
 *
 * 列索引在构造时根据表头建立一次，之后只在追加列时更新。
 * 其他视图对同一工作表插入行列后，本视图需要通过 WorkbookIndex::refresh() 重新获取。
 */
class TableView {
public:
    TableView(core::Worksheet& sheet, core::TableDefinition& table, core::DiagnosticLog* log = nullptr);

    const std::string& name() const { return table_->name; }
    const std::string& sheetName() const { return sheet_->getName(); }
    const core::TableDefinition& definition() const { return *table_; }
    const ColumnIndex& columns() const { return columns_; }

    int rowCount() const { return table_->dataRowCount(); }
    int columnCount() const { return table_->ref.columns(); }

    bool hasColumn(const std::string& column) const { return columns_.resolve(column).has_value(); }

    /**
     * @brief 列偏移（基于0），找不到时返回 std::nullopt 且不产生诊断
     */
    std::optional<int> resolveColumn(const std::string& column) const { return columns_.resolve(column); }

    void setDiagnostics(core::DiagnosticLog* log) { log_ = log; }

    // ========== 单元格读写 ==========

    template<typename T>
    core::ReadResult<T> tryGetValue(int row, const std::string& column) const;

    /**
     * @brief 读取第 row 行 column 列的值
     *
     * 行号越界、找不到列、无法转换时报告诊断并返回 T{}。
     */
    template<typename T>
    T getValue(int row, const std::string& column) const {
        auto result = tryGetValue<T>(row, column);
        report(result.diagnostics);
        return result.valueOr(T{});
    }

    template<typename E>
    core::ReadResult<E> tryGetEnum(int row, const std::string& column) const;

    /**
     * @brief 读取枚举标签
     *
     * 空白单元格返回 false 且不产生诊断；无法识别的标签报告一条诊断。
     * 返回 false 时 out 被置为 E{}。
     */
    template<typename E>
    bool getEnum(int row, const std::string& column, E& out) const {
        auto result = tryGetEnum<E>(row, column);
        report(result.diagnostics);
        out = result.valueOr(E{});
        return result.found();
    }

    template<typename T>
    bool setValue(int row, const std::string& column, const T& value);

    // ========== 整列读写 ==========

    /**
     * @brief 读取一整列（rowCount 个值），找不到列时返回 std::nullopt
     */
    template<typename T>
    std::optional<std::vector<T>> getColumnValues(const std::string& column) const;

    /**
     * @brief 从 start_column 开始读取 width 个相邻列
     *
     * 只检查起始列名，后面的列按位置读取，可以用于只有首列有表头的列组。
     */
    template<typename T>
    std::optional<std::vector<std::vector<T>>> getColumnBlock(const std::string& start_column, int width) const;

    /**
     * @brief 从 start_column 开始覆盖写入一块数据，行数不足时先扩展表格
     *
     * 起始列和块宽度在扩展之前检查：找不到列，或者最宽的一行会越过工作表最后一列时，
     * 报告诊断并返回 false，不修改任何内容。
     */
    template<typename T>
    bool setColumnBlock(const std::string& start_column, const std::vector<std::vector<T>>& values);

    /**
     * @brief 覆盖写入一整列，行数不足时先扩展表格
     * @param append_if_absent 列不存在时是否追加新列
     */
    template<typename T>
    bool setColumn(const std::string& column, const std::vector<T>& values, bool append_if_absent = false);

    /**
     * @brief 在表格最后一列之后插入一列并写入表头
     *
     * 调用方负责先确认该列不存在。
     */
    bool appendColumn(const std::string& column);

    /**
     * @brief 在指定列写入 1..rowCount
     */
    bool numberRows(const std::string& column);

private:
    int sheetRow(int row) const { return table_->ref.first_row + table_->header_row_count + row - 1; }
    int sheetColumn(int position) const { return table_->ref.first_col + position; }

    bool rowInRange(int row) const { return row >= 1 && row <= rowCount(); }

    core::Diagnostic columnNotFound(const std::string& column, int row) const;
    core::Diagnostic rowOutOfRange(int row, const std::string& column) const;
    core::Diagnostic invalidValue(int row, const std::string& column, const std::string& text) const;

    /**
     * @brief 确保至少有 rows 个数据行
     *
     * 新行插在最后一个数据行之后，原有数据行不移动，汇总行随之下移。
     */
    bool ensureRows(int rows);

    void report(core::Diagnostic diagnostic) const;
    void report(const std::vector<core::Diagnostic>& diagnostics) const;

    core::Worksheet* sheet_;
    core::TableDefinition* table_;
    core::DiagnosticLog* log_;
    CellAccessor cells_;
    ColumnIndex columns_;
};

// ========== 模板实现 ==========

template<typename T>
core::ReadResult<T> TableView::tryGetValue(int row, const std::string& column) const {
    if (!rowInRange(row)) {
        return core::ReadResult<T>::failed(rowOutOfRange(row, column));
    }
    auto position = columns_.resolve(column);
    if (!position) {
        return core::ReadResult<T>::failed(columnNotFound(column, row));
    }

    const int sheet_row = sheetRow(row);
    const int sheet_col = sheetColumn(*position);
    if (auto value = cells_.getTyped<T>(sheet_row, sheet_col)) {
        return core::ReadResult<T>::of(std::move(*value));
    }
    if (cells_.isBlank(sheet_row, sheet_col)) {
        return core::ReadResult<T>::absent();
    }
    return core::ReadResult<T>::failed(invalidValue(row, column, cells_.cell(sheet_row, sheet_col).toText()));
}

template<typename E>
core::ReadResult<E> TableView::tryGetEnum(int row, const std::string& column) const {
    if (!rowInRange(row)) {
        return core::ReadResult<E>::failed(rowOutOfRange(row, column));
    }
    auto position = columns_.resolve(column);
    if (!position) {
        return core::ReadResult<E>::failed(columnNotFound(column, row));
    }

    auto lookup = cells_.getEnumLabel<E>(sheetRow(row), sheetColumn(*position));
    if (lookup.found) {
        return core::ReadResult<E>::of(lookup.value);
    }
    if (lookup.blank) {
        return core::ReadResult<E>::absent();
    }
    return core::ReadResult<E>::failed(core::Diagnostic(
        core::Severity::Error, core::ErrorCode::EnumLabelNotFound,
        fmt::format("Unknown {} value '{}' in table {}, row {}, column {}.",
                    EnumLabels<E>::typeName(), lookup.text, name(), row, column),
        name(), row, column));
}

template<typename T>
bool TableView::setValue(int row, const std::string& column, const T& value) {
    if (!rowInRange(row)) {
        report(rowOutOfRange(row, column));
        return false;
    }
    auto position = columns_.resolve(column);
    if (!position) {
        report(columnNotFound(column, row));
        return false;
    }
    cells_.setTyped(sheetRow(row), sheetColumn(*position), value);
    return true;
}

template<typename T>
std::optional<std::vector<T>> TableView::getColumnValues(const std::string& column) const {
    auto position = columns_.resolve(column);
    if (!position) {
        report(columnNotFound(column, 0));
        return std::nullopt;
    }

    const int rows = rowCount();
    std::vector<T> values;
    values.reserve(static_cast<size_t>(rows));
    for (int row = 1; row <= rows; ++row) {
        values.push_back(cells_.getTyped<T>(sheetRow(row), sheetColumn(*position)).value_or(T{}));
    }
    return values;
}

template<typename T>
std::optional<std::vector<std::vector<T>>> TableView::getColumnBlock(const std::string& start_column, int width) const {
    auto position = columns_.resolve(start_column);
    if (!position) {
        report(columnNotFound(start_column, 0));
        return std::nullopt;
    }
    if (width < 0) {
        width = 0;
    }

    const int rows = rowCount();
    std::vector<std::vector<T>> values(static_cast<size_t>(rows));
    for (int row = 1; row <= rows; ++row) {
        auto& line = values[static_cast<size_t>(row - 1)];
        line.reserve(static_cast<size_t>(width));
        for (int offset = 0; offset < width; ++offset) {
            line.push_back(cells_.getTyped<T>(sheetRow(row), sheetColumn(*position + offset)).value_or(T{}));
        }
    }
    return values;
}

template<typename T>
bool TableView::setColumnBlock(const std::string& start_column, const std::vector<std::vector<T>>& values) {
    auto position = columns_.resolve(start_column);
    if (!position) {
        report(columnNotFound(start_column, 0));
        return false;
    }

    size_t width = 0;
    for (const auto& row : values) {
        width = std::max(width, row.size());
    }
    if (width > 0 &&
        static_cast<size_t>(sheetColumn(*position)) + width > static_cast<size_t>(core::Constants::kMaxColumns)) {
        report(core::Diagnostic(core::Severity::Error, core::ErrorCode::InvalidArgument,
                                fmt::format("Cannot write {} columns starting at column '{}' of table {}: "
                                            "the block runs past the last sheet column.",
                                            width, start_column, name()),
                                name(), 0, start_column));
        return false;
    }

    if (!ensureRows(static_cast<int>(values.size()))) {
        return false;
    }

    for (size_t row = 0; row < values.size(); ++row) {
        for (size_t offset = 0; offset < values[row].size(); ++offset) {
            cells_.setTyped(sheetRow(static_cast<int>(row) + 1),
                            sheetColumn(*position + static_cast<int>(offset)), values[row][offset]);
        }
    }
    return true;
}

template<typename T>
bool TableView::setColumn(const std::string& column, const std::vector<T>& values, bool append_if_absent) {
    auto position = columns_.resolve(column);
    if (!position) {
        if (!append_if_absent) {
            report(columnNotFound(column, 0));
            return false;
        }
        if (!appendColumn(column)) {
            return false;
        }
        position = columns_.resolve(column);
        if (!position) {
            return false;
        }
    }
    if (!ensureRows(static_cast<int>(values.size()))) {
        return false;
    }

    for (size_t row = 0; row < values.size(); ++row) {
        cells_.setTyped(sheetRow(static_cast<int>(row) + 1), sheetColumn(*position), values[row]);
    }
    return true;
}

}} // namespace excelpipe::view
