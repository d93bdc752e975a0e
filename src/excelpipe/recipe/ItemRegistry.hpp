#pragma once

#include "excelpipe/recipe/InventoryItem.hpp"

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace recipe {

/**
 * @brief 名称 -> 物品查找接口（区分大小写，精确匹配）
 */
class IItemLookup {
public:
    virtual ~IItemLookup() = default;

    /**
     * @return 找不到时返回 nullptr
     */
    virtual const InventoryItem* resolve(const std::string& name) const = 0;
};

/**
 * @brief 物品注册表：按名称持有所有物品
 *
 * 物品以 unique_ptr 保存，创建后地址不变，可以安全地被配方引用。
 */
class ItemRegistry : public IItemLookup {
public:
    ItemRegistry() = default;

    ItemRegistry(const ItemRegistry&) = delete;
    ItemRegistry& operator=(const ItemRegistry&) = delete;

    const InventoryItem* resolve(const std::string& name) const override;

    InventoryItem* find(const std::string& name);

    /**
     * @brief 查找物品，不存在时在 category 下新建
     *
     * 返回的物品都会被标记为 dirty。
     * @throws ParameterException 名称为空
     */
    InventoryItem& findOrCreate(const std::string& name, const std::string& category);

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<std::unique_ptr<InventoryItem>>& items() const { return items_; }

    const std::set<std::string>& categories() const { return categories_; }
    bool hasCategory(const std::string& category) const;

    size_t dirtyCount() const;
    void clearDirty();

    /**
     * @brief 规范化分类路径：统一分隔符，去掉开头的 Assets/ 和首尾的 '/'
     */
    static std::string normalizeCategory(const std::string& category);

private:
    std::vector<std::unique_ptr<InventoryItem>> items_;
    std::unordered_map<std::string, InventoryItem*> lookup_;
    std::set<std::string> categories_;
};

}} // namespace excelpipe::recipe
