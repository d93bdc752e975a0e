#include "excelpipe/recipe/RecipeKey.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace excelpipe {
namespace recipe {

RecipeKey RecipeKey::fromSorted(const std::vector<const InventoryItem*>& ingredients) {
    RecipeKey key;
    const size_t count = std::min(ingredients.size(), key.slots_.size());
    for (size_t i = 0; i < count; ++i) {
        key.slots_[i] = ingredients[i];
    }
    return key;
}

size_t RecipeKey::ingredientCount() const {
    size_t count = 0;
    for (const auto* item : slots_) {
        if (item) ++count;
    }
    return count;
}

std::string RecipeKey::describe() const {
    std::string text;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (i > 0) {
            text += " + ";
        }
        text += fmt::format("'{}'", slots_[i] ? slots_[i]->name : std::string());
    }
    return text;
}

}} // namespace excelpipe::recipe
