#pragma once

#include "excelpipe/view/EnumLabels.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace excelpipe {
namespace recipe {

/**
 * @brief 物品稀有度，Unset 为零值
 */
enum class Rarity : uint8_t {
    Unset = 0,
    Common,
    Uncommon,
    Rare,
    Epic,
    Legendary
};

/**
 * @brief 库存物品（原料或药水）
 *
 * 由 ItemRegistry 持有，配方只保存指向它的指针。
 */
struct InventoryItem {
    std::string name;           // 唯一名称，配方表按它引用物品
    std::string display_name;
    std::string category;       // 来源表名，如 Ingredients / Potions
    Rarity rarity = Rarity::Unset;
    int cost = 0;
    int uses = 0;
    int max_profit = 0;
    bool dirty = false;         // 本次导入修改过，需要保存
};

}} // namespace excelpipe::recipe

namespace excelpipe {
namespace view {

template<>
struct EnumLabels<recipe::Rarity> {
    static constexpr std::string_view typeName() { return "Rarity"; }

    static constexpr std::array<std::pair<std::string_view, recipe::Rarity>, 6> entries{{
        {"Unset", recipe::Rarity::Unset},
        {"Common", recipe::Rarity::Common},
        {"Uncommon", recipe::Rarity::Uncommon},
        {"Rare", recipe::Rarity::Rare},
        {"Epic", recipe::Rarity::Epic},
        {"Legendary", recipe::Rarity::Legendary}
    }};
};

}} // namespace excelpipe::view
