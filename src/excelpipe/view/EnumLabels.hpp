#pragma once

#include <optional>
#include <string_view>
#include <type_traits>

namespace excelpipe {
namespace view {

/**
 * @brief 可导入枚举的名称表
 *
 * 每个需要从单元格文本读取的枚举都要提供特化：
 * @code
 * template<>
 * struct EnumLabels<Rarity> {
 *     static constexpr std::string_view typeName() { return "Rarity"; }
 *     static constexpr std::array<std::pair<std::string_view, Rarity>, 2> entries{{
 *         {"Common", Rarity::Common}, {"Rare", Rarity::Rare}}};
 * };
 * @endcode
 * 枚举的零值（E{}）作为读取失败时的缺省值。
 */
template<typename E>
struct EnumLabels {
    static_assert(sizeof(E) == 0, "EnumLabels<E> must be specialized for every importable enum");
};

/**
 * @brief 按成员名称解析（区分大小写，不裁剪）
 */
template<typename E>
std::optional<E> parseEnumLabel(std::string_view text) {
    static_assert(std::is_enum_v<E>, "parseEnumLabel<E>() requires an enum type");
    for (const auto& entry : EnumLabels<E>::entries) {
        if (entry.first == text) {
            return entry.second;
        }
    }
    return std::nullopt;
}

/**
 * @brief 成员名称；未登记的值返回空串
 */
template<typename E>
std::string_view enumLabel(E value) {
    for (const auto& entry : EnumLabels<E>::entries) {
        if (entry.second == value) {
            return entry.first;
        }
    }
    return {};
}

}} // namespace excelpipe::view
