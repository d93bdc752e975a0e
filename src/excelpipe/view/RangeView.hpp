#pragma once

#include "excelpipe/core/CellRange.hpp"
#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/core/Worksheet.hpp"
#include "excelpipe/view/CellAccessor.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

namespace excelpipe {
namespace view {

/**
 * @brief 命名区域视图：按相对锚点的行列偏移访问，行列都从 1 开始
 *
 * 没有列名。读写都做边界检查，越界时报告 RowOutOfRange 诊断。
 * 扩展时行插在锚点行之后、列插在锚点列之后，先行后列。
 */
class RangeView {
public:
    RangeView(core::Worksheet& sheet, core::NamedRange& range, core::DiagnosticLog* log = nullptr);

    const std::string& name() const { return range_->name; }
    const std::string& sheetName() const { return sheet_->getName(); }
    const core::CellRange& region() const { return range_->range; }

    int rowCount() const { return range_->range.rows(); }
    int columnCount() const { return range_->range.columns(); }

    void setDiagnostics(core::DiagnosticLog* log) { log_ = log; }

    template<typename T>
    core::ReadResult<T> tryGetValue(int row = 1, int column = 1) const;

    template<typename T>
    T getValue(int row = 1, int column = 1) const {
        auto result = tryGetValue<T>(row, column);
        report(result.diagnostics);
        return result.valueOr(T{});
    }

    template<typename E>
    core::ReadResult<E> tryGetEnum(int row = 1, int column = 1) const;

    template<typename E>
    bool getEnum(E& out, int row = 1, int column = 1) const {
        auto result = tryGetEnum<E>(row, column);
        report(result.diagnostics);
        out = result.valueOr(E{});
        return result.found();
    }

    template<typename T>
    bool setValue(const T& value, int row = 1, int column = 1);

    /**
     * @brief 整个区域的值，按 [行][列] 排列
     */
    template<typename T>
    std::vector<std::vector<T>> getValues() const;

    /**
     * @brief 用二维数据覆盖区域，数据更大时先扩展区域
     *
     * 各行长度必须一致，否则报告 InvalidArgument 诊断且不做任何修改。
     */
    template<typename T>
    bool setValues(const std::vector<std::vector<T>>& values);

    /**
     * @brief 第一列写入 1..rowCount
     */
    void numberRows();

    /**
     * @brief 第一行写入 1..columnCount
     */
    void numberColumns();

    /**
     * @brief 扩展区域到至少 rows 行 columns 列，不写入数据
     */
    bool expandToFit(int rows, int columns);

private:
    int sheetRow(int row) const { return range_->range.first_row + row - 1; }
    int sheetColumn(int column) const { return range_->range.first_col + column - 1; }

    bool inRange(int row, int column) const {
        return row >= 1 && row <= rowCount() && column >= 1 && column <= columnCount();
    }

    core::Diagnostic outOfRange(int row, int column) const;
    core::Diagnostic invalidValue(int row, int column, const std::string& text) const;

    void report(core::Diagnostic diagnostic) const;
    void report(const std::vector<core::Diagnostic>& diagnostics) const;

    core::Worksheet* sheet_;
    core::NamedRange* range_;
    core::DiagnosticLog* log_;
    CellAccessor cells_;
};

// ========== 模板实现 ==========

template<typename T>
core::ReadResult<T> RangeView::tryGetValue(int row, int column) const {
    if (!inRange(row, column)) {
        return core::ReadResult<T>::failed(outOfRange(row, column));
    }
    if (auto value = cells_.getTyped<T>(sheetRow(row), sheetColumn(column))) {
        return core::ReadResult<T>::of(std::move(*value));
    }
    if (cells_.isBlank(sheetRow(row), sheetColumn(column))) {
        return core::ReadResult<T>::absent();
    }
    return core::ReadResult<T>::failed(
        invalidValue(row, column, cells_.cell(sheetRow(row), sheetColumn(column)).toText()));
}

template<typename E>
core::ReadResult<E> RangeView::tryGetEnum(int row, int column) const {
    if (!inRange(row, column)) {
        return core::ReadResult<E>::failed(outOfRange(row, column));
    }
    auto lookup = cells_.getEnumLabel<E>(sheetRow(row), sheetColumn(column));
    if (lookup.found) {
        return core::ReadResult<E>::of(lookup.value);
    }
    if (lookup.blank) {
        return core::ReadResult<E>::absent();
    }
    return core::ReadResult<E>::failed(core::Diagnostic(
        core::Severity::Error, core::ErrorCode::EnumLabelNotFound,
        fmt::format("Unknown {} value '{}' in range '{}', row {}, column {}.",
                    EnumLabels<E>::typeName(), lookup.text, name(), row, column),
        name(), row, std::to_string(column)));
}

template<typename T>
bool RangeView::setValue(const T& value, int row, int column) {
    if (!inRange(row, column)) {
        report(outOfRange(row, column));
        return false;
    }
    cells_.setTyped(sheetRow(row), sheetColumn(column), value);
    return true;
}

template<typename T>
std::vector<std::vector<T>> RangeView::getValues() const {
    const int rows = rowCount();
    const int columns = columnCount();
    std::vector<std::vector<T>> values(static_cast<size_t>(rows));
    for (int row = 1; row <= rows; ++row) {
        auto& line = values[static_cast<size_t>(row - 1)];
        line.reserve(static_cast<size_t>(columns));
        for (int column = 1; column <= columns; ++column) {
            line.push_back(cells_.getTyped<T>(sheetRow(row), sheetColumn(column)).value_or(T{}));
        }
    }
    return values;
}

template<typename T>
bool RangeView::setValues(const std::vector<std::vector<T>>& values) {
    if (values.empty()) {
        return true;
    }
    const size_t width = values.front().size();
    for (size_t row = 1; row < values.size(); ++row) {
        if (values[row].size() != width) {
            report(core::Diagnostic(core::Severity::Error, core::ErrorCode::InvalidArgument,
                                    fmt::format("Cannot write to range '{}': row {} has {} values, expected {}.",
                                                name(), row + 1, values[row].size(), width),
                                    name(), static_cast<int>(row) + 1));
            return false;
        }
    }

    if (!expandToFit(static_cast<int>(values.size()), static_cast<int>(width))) {
        return false;
    }

    for (size_t row = 0; row < values.size(); ++row) {
        for (size_t column = 0; column < width; ++column) {
            cells_.setTyped(sheetRow(static_cast<int>(row) + 1), sheetColumn(static_cast<int>(column) + 1),
                            values[row][column]);
        }
    }
    return true;
}

}} // namespace excelpipe::view
