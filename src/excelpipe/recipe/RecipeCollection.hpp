#pragma once

#include "excelpipe/core/Diagnostic.hpp"
#include "excelpipe/recipe/ItemRegistry.hpp"
#include "excelpipe/recipe/RecipeKey.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace excelpipe {
namespace recipe {

/**
 * @brief 一条配方记录：按名称排序的原料 + 产物
 */
struct Recipe {
    std::vector<const InventoryItem*> ingredients;
    const InventoryItem* product = nullptr;

    /**
     * @brief (A + B) => Product
     */
    std::string label() const;
};

/**
 * @brief 配方集合：有序的配方记录 + 原料组合到产物的查找表
 *
 * 原料组合与顺序无关；同一组合只保留第一次登记的产物。
 */
class RecipeCollection {
public:
    RecipeCollection() = default;

    /**
     * @brief 按名称登记一条配方
     *
     * 名称先裁剪首尾空白再查找，与物品导入时登记的名称一致。
     * 空白或找不到的原料名直接忽略；没有可用原料、超过三种原料或找不到产物时返回 false。
     * 组合已存在时保留原有映射，报告 DuplicateRecipe 警告，仍然返回 true。
     */
    bool tryAdd(const IItemLookup& items, const std::string& product_name,
                const std::vector<std::string>& ingredient_names);

    void clear();

    size_t size() const { return recipes_.size(); }
    bool empty() const { return recipes_.empty(); }
    const std::vector<Recipe>& recipes() const { return recipes_; }

    /**
     * @brief 按原料组合查找产物，原料顺序任意
     * @return 找不到时返回 nullptr
     */
    const InventoryItem* findProduct(const std::vector<const InventoryItem*>& ingredients) const;

    /**
     * @brief 没有匹配配方时的产物（例如“失败的药水”）
     */
    void setDefaultProduct(const InventoryItem* product) { default_product_ = product; }
    const InventoryItem* defaultProduct() const { return default_product_; }
    const InventoryItem* findProductOrDefault(const std::vector<const InventoryItem*>& ingredients) const;

    /**
     * @brief 用已保存的配方记录重建集合
     *
     * 每条记录重新排序并生成键；无效记录被跳过，重复组合保留先出现的记录。
     * @return 恢复的记录数
     */
    size_t restore(const std::vector<Recipe>& records);

    void setDiagnostics(core::DiagnosticLog* log) { log_ = log; }

private:
    static void sortIngredients(std::vector<const InventoryItem*>& ingredients);
    void report(core::Diagnostic diagnostic) const;

    std::vector<Recipe> recipes_;
    std::unordered_map<RecipeKey, const InventoryItem*, RecipeKeyHash> lookup_;
    const InventoryItem* default_product_ = nullptr;
    core::DiagnosticLog* log_ = nullptr;
};

}} // namespace excelpipe::recipe
