#pragma once

#include "excelpipe/core/Worksheet.hpp"
#include "excelpipe/utils/CommonUtils.hpp"
#include "excelpipe/view/EnumLabels.hpp"

#include <optional>
#include <string>

namespace excelpipe {
namespace view {

/**
 * @brief 枚举标签读取结果
 *
 * blank 表示单元格为空或只有空白（不算错误），
 * 否则 found 为 false 时 text 保存无法识别的原文。
 */
template<typename E>
struct LabelLookup {
    E value{};
    bool found = false;
    bool blank = true;
    std::string text;
};

/**
 * @brief 工作表单元格的类型化读写，坐标基于0
 *
 * 不产生诊断，只负责类型转换；定位信息由 TableView / RangeView 补充。
 */
class CellAccessor {
public:
    explicit CellAccessor(core::Worksheet& sheet) : sheet_(&sheet) {}

    const core::Cell& cell(int row, int col) const { return sheet_->getCell(row, col); }
    bool isBlank(int row, int col) const { return cell(row, col).isBlank(); }

    /**
     * @brief 空单元格或转换失败时返回 std::nullopt
     */
    template<typename T>
    std::optional<T> getTyped(int row, int col) const {
        return cell(row, col).template tryGetValue<T>();
    }

    /**
     * @brief 写入值；空字符串清空单元格
     */
    template<typename T>
    void setTyped(int row, int col, const T& value) {
        sheet_->setValue(row, col, value);
    }

    template<typename E>
    LabelLookup<E> getEnumLabel(int row, int col) const {
        LabelLookup<E> lookup;
        auto text = getTyped<std::string>(row, col);
        if (!text) {
            return lookup;
        }
        lookup.text = utils::CommonUtils::trim(*text);
        if (lookup.text.empty()) {
            return lookup;
        }
        lookup.blank = false;
        if (auto parsed = parseEnumLabel<E>(lookup.text)) {
            lookup.value = *parsed;
            lookup.found = true;
        }
        return lookup;
    }

    core::Worksheet& sheet() const { return *sheet_; }

private:
    core::Worksheet* sheet_;
};

}} // namespace excelpipe::view
