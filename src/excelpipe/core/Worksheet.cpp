#include "excelpipe/core/Worksheet.hpp"
#include "excelpipe/core/Constants.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <tuple>

namespace excelpipe {
namespace core {

namespace {

const Cell kEmptyCell;

/**
 * @brief 按插入规则调整一维区间 [first, last]
 * @return true 表示区间被扩展（插入点落在区间内部或紧随其后）
 */
bool adjustSpan(int& first, int& last, int at, int count) {
    if (at <= first) {
        first += count;
        last += count;
        return false;
    }
    if (at <= last + 1) {
        last += count;
        return true;
    }
    return false;
}

} // namespace

Worksheet::Worksheet(const std::string& name, int sheet_id)
    : name_(name), sheet_id_(sheet_id) {
}

const Cell& Worksheet::getCell(int row, int col) const {
    auto it = cells_.find({row, col});
    return it != cells_.end() ? it->second : kEmptyCell;
}

void Worksheet::setCell(int row, int col, const Cell& cell) {
    EXCELPIPE_THROW_IF(!utils::CommonUtils::isValidCellPosition(row, col),
                       fmt::format("Invalid cell position ({}, {}) on sheet '{}'", row, col, name_),
                       "row/col");
    if (cell.isEmpty() && !cell.hasFormula()) {
        cells_.erase({row, col});
        return;
    }
    cells_[{row, col}] = cell;
}

void Worksheet::clearCell(int row, int col) {
    cells_.erase({row, col});
}

bool Worksheet::hasCellAt(int row, int col) const {
    return cells_.find({row, col}) != cells_.end();
}

std::optional<CellRange> Worksheet::getUsedRange() const {
    std::optional<CellRange> used;
    auto extend = [&used](const CellRange& r) {
        if (!used) {
            used = r;
            return;
        }
        used->first_row = std::min(used->first_row, r.first_row);
        used->first_col = std::min(used->first_col, r.first_col);
        used->last_row = std::max(used->last_row, r.last_row);
        used->last_col = std::max(used->last_col, r.last_col);
    };

    for (const auto& [pos, cell] : cells_) {
        extend(CellRange(pos.first, pos.second, pos.first, pos.second));
    }
    for (const auto& table : tables_) {
        extend(table->ref);
    }
    for (const auto& range : named_ranges_) {
        extend(range->range);
    }
    return used;
}

VoidResult Worksheet::insertRows(int row, int count) {
    if (row < 0 || row >= Constants::kMaxRows || count < 0) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("Cannot insert {} rows at row {}", count, row + 1), name_);
    }
    if (count == 0) {
        return {};
    }

    auto used = getUsedRange();
    if (used && used->last_row >= row && used->last_row + count >= Constants::kMaxRows) {
        return makeError(ErrorCode::StructuralGrowthFailed,
                         fmt::format("Inserting {} rows at row {} would push data past the last sheet row",
                                     count, row + 1), name_);
    }

    // 先收集再移动，避免覆盖尚未移动的单元格
    std::vector<std::tuple<int, int, Cell>> moves;
    for (auto it = cells_.lower_bound({row, 0}); it != cells_.end(); ) {
        moves.emplace_back(it->first.first + count, it->first.second, std::move(it->second));
        it = cells_.erase(it);
    }
    for (auto& [r, c, cell] : moves) {
        cells_.emplace(std::make_pair(r, c), std::move(cell));
    }

    for (auto& table : tables_) {
        adjustSpan(table->ref.first_row, table->ref.last_row, row, count);
    }
    for (auto& range : named_ranges_) {
        adjustSpan(range->range.first_row, range->range.last_row, row, count);
    }

    CORE_DEBUG("Inserted {} rows at row {} on sheet '{}'", count, row + 1, name_);
    return {};
}

VoidResult Worksheet::insertColumns(int col, int count) {
    if (col < 0 || col >= Constants::kMaxColumns || count < 0) {
        return makeError(ErrorCode::InvalidArgument,
                         fmt::format("Cannot insert {} columns at column {}", count, col + 1), name_);
    }
    if (count == 0) {
        return {};
    }

    auto used = getUsedRange();
    if (used && used->last_col >= col && used->last_col + count >= Constants::kMaxColumns) {
        return makeError(ErrorCode::StructuralGrowthFailed,
                         fmt::format("Inserting {} columns at column {} would push data past the last sheet column",
                                     count, utils::CommonUtils::columnToLetter(col)), name_);
    }

    std::vector<std::tuple<int, int, Cell>> moves;
    for (auto it = cells_.begin(); it != cells_.end(); ) {
        if (it->first.second >= col) {
            moves.emplace_back(it->first.first, it->first.second + count, std::move(it->second));
            it = cells_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& [r, c, cell] : moves) {
        cells_.emplace(std::make_pair(r, c), std::move(cell));
    }

    for (auto& table : tables_) {
        int old_first = table->ref.first_col;
        if (adjustSpan(table->ref.first_col, table->ref.last_col, col, count)) {
            auto index = static_cast<size_t>(col - old_first);
            index = std::min(index, table->column_names.size());
            for (int i = 0; i < count; ++i) {
                std::string placeholder = uniqueColumnName(table->column_names, index + 1 + i);
                table->column_names.insert(table->column_names.begin() + static_cast<std::ptrdiff_t>(index + i),
                                           placeholder);
            }
        }
    }
    for (auto& range : named_ranges_) {
        adjustSpan(range->range.first_col, range->range.last_col, col, count);
    }

    CORE_DEBUG("Inserted {} columns at column {} on sheet '{}'", count,
               utils::CommonUtils::columnToLetter(col), name_);
    return {};
}

TableDefinition& Worksheet::addTable(TableDefinition definition) {
    EXCELPIPE_THROW_IF(definition.name.empty(), "Table name must not be empty", "name");
    if (definition.display_name.empty()) {
        definition.display_name = definition.name;
    }
    tables_.push_back(std::make_unique<TableDefinition>(std::move(definition)));
    return *tables_.back();
}

TableDefinition* Worksheet::findTable(const std::string& name) {
    for (auto& table : tables_) {
        if (table->name == name) return table.get();
    }
    return nullptr;
}

const TableDefinition* Worksheet::findTable(const std::string& name) const {
    for (const auto& table : tables_) {
        if (table->name == name) return table.get();
    }
    return nullptr;
}

NamedRange& Worksheet::addNamedRange(const std::string& name, const CellRange& range) {
    EXCELPIPE_THROW_IF(name.empty(), "Named range name must not be empty", "name");
    named_ranges_.push_back(std::make_unique<NamedRange>(NamedRange{name, range}));
    return *named_ranges_.back();
}

NamedRange* Worksheet::findNamedRange(const std::string& name) {
    for (auto& range : named_ranges_) {
        if (range->name == name) return range.get();
    }
    return nullptr;
}

const NamedRange* Worksheet::findNamedRange(const std::string& name) const {
    for (const auto& range : named_ranges_) {
        if (range->name == name) return range.get();
    }
    return nullptr;
}

std::string Worksheet::uniqueColumnName(const std::vector<std::string>& existing, size_t start_index) {
    for (size_t n = start_index; ; ++n) {
        std::string candidate = "Column" + std::to_string(n);
        if (std::find(existing.begin(), existing.end(), candidate) == existing.end()) {
            return candidate;
        }
    }
}

}} // namespace excelpipe::core
