#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace view {

/**
 * @brief 表格列名 -> 列偏移（基于0）
 *
 * 构建时裁剪表头文本，查找时精确匹配且区分大小写。
 * 重复表头不去重，后出现的同名列无法通过名称访问。
 */
class ColumnIndex {
public:
    ColumnIndex() = default;
    explicit ColumnIndex(const std::vector<std::string>& headers);

    std::optional<int> resolve(const std::string& name) const;

    /**
     * @brief 在末尾登记新列
     * @return 新列的偏移
     */
    int append(const std::string& name);

    const std::vector<std::string>& names() const { return names_; }
    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }

    /**
     * @brief 忽略大小写和首尾空白后相同的已知列名
     */
    std::optional<std::string> nearMatch(const std::string& name) const;
    bool hasNearMatch(const std::string& name) const { return nearMatch(name).has_value(); }

    /**
     * @brief 找不到列时的说明：列出所有已知列名，有近似匹配时追加提示
     */
    std::string describeMissing(const std::string& name, const std::string& table_name) const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, int> positions_;
};

}} // namespace excelpipe::view
