#pragma once

#include "excelpipe/core/Cell.hpp"
#include "excelpipe/core/CellRange.hpp"
#include "excelpipe/core/Expected.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace excelpipe {
namespace core {

/**
 * @brief 工作表：稀疏单元格网格 + 表格定义 + 命名区域
 *
 * 行列索引基于0。插入行/列是整表操作：插入点及之后的单元格整体平移，
 * 同时平移或扩展落在插入点上的表格和命名区域。
 * 表格与命名区域以 unique_ptr 持有，插入后指针保持有效。
 */
class Worksheet {
public:
    using CellMap = std::map<std::pair<int, int>, Cell>;

    Worksheet(const std::string& name, int sheet_id);

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }
    int getSheetId() const { return sheet_id_; }

    // ========== 单元格访问 ==========

    /**
     * @brief 读取单元格，不存在时返回空单元格
     */
    const Cell& getCell(int row, int col) const;

    /**
     * @brief 写入单元格；空值会删除该位置
     * @throws ParameterException 坐标超出工作表范围
     */
    void setCell(int row, int col, const Cell& cell);

    template<typename T>
    void setValue(int row, int col, const T& value) {
        Cell cell;
        cell.setValue(value);
        setCell(row, col, cell);
    }

    void clearCell(int row, int col);
    bool hasCellAt(int row, int col) const;
    size_t getCellCount() const { return cells_.size(); }
    const CellMap& cells() const { return cells_; }

    /**
     * @brief 已使用区域（包含表格与命名区域），空表返回 nullopt
     */
    std::optional<CellRange> getUsedRange() const;

    // ========== 结构编辑 ==========

    /**
     * @brief 在 row 处插入 count 行
     *
     * 区域起始行 >= row 时整体下移；first_row < row <= last_row + 1 时扩展。
     */
    VoidResult insertRows(int row, int count);

    /**
     * @brief 在 col 处插入 count 列，规则同 insertRows
     *
     * 表格被扩展时在对应位置登记占位列名 ColumnN。
     */
    VoidResult insertColumns(int col, int count);

    // ========== 表格 ==========

    TableDefinition& addTable(TableDefinition definition);
    TableDefinition* findTable(const std::string& name);
    const TableDefinition* findTable(const std::string& name) const;
    const std::vector<std::unique_ptr<TableDefinition>>& tables() const { return tables_; }

    // ========== 命名区域 ==========

    NamedRange& addNamedRange(const std::string& name, const CellRange& range);
    NamedRange* findNamedRange(const std::string& name);
    const NamedRange* findNamedRange(const std::string& name) const;
    const std::vector<std::unique_ptr<NamedRange>>& namedRanges() const { return named_ranges_; }

private:
    static std::string uniqueColumnName(const std::vector<std::string>& existing, size_t start_index);

    std::string name_;
    int sheet_id_;
    CellMap cells_;
    std::vector<std::unique_ptr<TableDefinition>> tables_;
    std::vector<std::unique_ptr<NamedRange>> named_ranges_;
};

}} // namespace excelpipe::core
