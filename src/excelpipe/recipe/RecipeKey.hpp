#pragma once

#include "excelpipe/core/Constants.hpp"
#include "excelpipe/recipe/InventoryItem.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace excelpipe {
namespace recipe {

/**
 * @brief 配方键：最多三个原料槽位，空槽为 nullptr
 *
 * 构建前原料必须已按名称排序，这样原料顺序不同的同一组合得到相同的键。
 * 全空的键无效。
 */
class RecipeKey {
public:
    using Slots = std::array<const InventoryItem*, core::Constants::kRecipeKeySlots>;

    RecipeKey() { slots_.fill(nullptr); }

    /**
     * @brief 由已排序的原料构建，超出槽位的原料被忽略
     */
    static RecipeKey fromSorted(const std::vector<const InventoryItem*>& ingredients);

    const Slots& slots() const { return slots_; }
    const InventoryItem* slot(size_t index) const { return index < slots_.size() ? slots_[index] : nullptr; }

    size_t ingredientCount() const;
    bool isValid() const { return ingredientCount() > 0; }

    /**
     * @brief 'A' + 'B' + '' 形式的描述，空槽显示为 ''
     */
    std::string describe() const;

    bool operator==(const RecipeKey& other) const { return slots_ == other.slots_; }
    bool operator!=(const RecipeKey& other) const { return !(*this == other); }

private:
    Slots slots_;
};

struct RecipeKeyHash {
    size_t operator()(const RecipeKey& key) const noexcept {
        size_t seed = 0;
        for (const auto* item : key.slots()) {
            seed ^= std::hash<const InventoryItem*>{}(item) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

}} // namespace excelpipe::recipe
