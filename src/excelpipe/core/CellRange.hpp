#pragma once

#include "excelpipe/utils/CommonUtils.hpp"
#include <string>
#include <vector>

namespace excelpipe {
namespace core {

/**
 * @brief 矩形区域，行列基于0且包含两端
 */
struct CellRange {
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;

    CellRange() = default;
    CellRange(int fr, int fc, int lr, int lc)
        : first_row(fr), first_col(fc), last_row(lr), last_col(lc) {}

    int rows() const { return last_row - first_row + 1; }
    int columns() const { return last_col - first_col + 1; }

    bool contains(int row, int col) const {
        return row >= first_row && row <= last_row && col >= first_col && col <= last_col;
    }

    /**
     * @brief A1 形式的引用（不含工作表名）
     */
    std::string toReference() const {
        return utils::CommonUtils::rangeReference(first_row, first_col, last_row, last_col);
    }

    bool operator==(const CellRange& other) const {
        return first_row == other.first_row && first_col == other.first_col &&
               last_row == other.last_row && last_col == other.last_col;
    }
    bool operator!=(const CellRange& other) const { return !(*this == other); }
};

/**
 * @brief 工作表上的表格（ListObject）定义
 *
 * 数据行数 = 区域行数 - 表头行 - 汇总行，始终由区域推导，不单独保存。
 */
struct TableDefinition {
    int id = 0;
    std::string name;
    std::string display_name;
    CellRange ref;
    int header_row_count = 1;   // 0 或 1
    int totals_row_count = 0;   // 0 或 1
    std::vector<std::string> column_names;

    int dataRowCount() const {
        int count = ref.rows() - header_row_count - totals_row_count;
        return count < 0 ? 0 : count;
    }
};

/**
 * @brief 工作簿级命名区域，由其目标工作表持有
 */
struct NamedRange {
    std::string name;
    CellRange range;
};

}} // namespace excelpipe::core
