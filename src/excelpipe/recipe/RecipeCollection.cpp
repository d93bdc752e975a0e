#include "excelpipe/recipe/RecipeCollection.hpp"
#include "excelpipe/core/Constants.hpp"
#include "excelpipe/utils/CommonUtils.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace excelpipe {
namespace recipe {

std::string Recipe::label() const {
    std::string text = "(";
    for (size_t i = 0; i < ingredients.size(); ++i) {
        if (i > 0) {
            text += " + ";
        }
        text += ingredients[i] ? ingredients[i]->name : std::string("?");
    }
    text += ") => ";
    text += product ? product->name : std::string("?");
    return text;
}

bool RecipeCollection::tryAdd(const IItemLookup& items, const std::string& product_name,
                              const std::vector<std::string>& ingredient_names) {
    std::vector<const InventoryItem*> ingredients;
    ingredients.reserve(ingredient_names.size());
    for (const auto& name : ingredient_names) {
        if (utils::CommonUtils::isBlank(name)) {
            continue;
        }
        if (const auto* item = items.resolve(utils::CommonUtils::trim(name))) {
            ingredients.push_back(item);
        }
    }

    if (ingredients.empty()) {
        RECIPE_DEBUG("No known ingredients for product '{}', row skipped", product_name);
        return false;
    }

    sortIngredients(ingredients);

    const auto* product = items.resolve(utils::CommonUtils::trim(product_name));
    if (!product) {
        RECIPE_DEBUG("Unknown product '{}', row skipped", product_name);
        return false;
    }

    if (ingredients.size() > core::Constants::kRecipeKeySlots) {
        report(core::Diagnostic(core::Severity::Error, core::ErrorCode::TooManyIngredients,
                                fmt::format("Recipe for {} uses {} ingredients, at most {} are supported.",
                                            product->name, ingredients.size(), core::Constants::kRecipeKeySlots)));
        return false;
    }

    const RecipeKey key = RecipeKey::fromSorted(ingredients);
    auto existing = lookup_.find(key);
    if (existing != lookup_.end()) {
        report(core::Diagnostic(core::Severity::Warning, core::ErrorCode::DuplicateRecipe,
                                fmt::format("Duplicate recipe detected: {} maps to both {} and {}.\n"
                                            "Only the first mapping will be kept.",
                                            key.describe(), existing->second->name, product->name)));
        return true;
    }

    recipes_.push_back(Recipe{std::move(ingredients), product});
    lookup_.emplace(key, product);
    return true;
}

void RecipeCollection::clear() {
    recipes_.clear();
    lookup_.clear();
}

const InventoryItem* RecipeCollection::findProduct(const std::vector<const InventoryItem*>& ingredients) const {
    std::vector<const InventoryItem*> sorted;
    sorted.reserve(ingredients.size());
    for (const auto* item : ingredients) {
        if (item) sorted.push_back(item);
    }
    if (sorted.empty() || sorted.size() > core::Constants::kRecipeKeySlots) {
        return nullptr;
    }
    sortIngredients(sorted);

    auto it = lookup_.find(RecipeKey::fromSorted(sorted));
    return it != lookup_.end() ? it->second : nullptr;
}

const InventoryItem* RecipeCollection::findProductOrDefault(const std::vector<const InventoryItem*>& ingredients) const {
    const auto* product = findProduct(ingredients);
    return product ? product : default_product_;
}

size_t RecipeCollection::restore(const std::vector<Recipe>& records) {
    clear();
    for (const auto& record : records) {
        Recipe recipe;
        recipe.product = record.product;
        for (const auto* item : record.ingredients) {
            if (item) recipe.ingredients.push_back(item);
        }

        if (recipe.ingredients.empty() || recipe.ingredients.size() > core::Constants::kRecipeKeySlots) {
            report(core::Diagnostic(core::Severity::Warning, core::ErrorCode::NoIngredients,
                                    fmt::format("Skipping stored recipe {}: it has {} ingredients.",
                                                record.label(), recipe.ingredients.size())));
            continue;
        }
        if (!recipe.product) {
            report(core::Diagnostic(core::Severity::Warning, core::ErrorCode::ProductNotFound,
                                    fmt::format("Skipping stored recipe {}: it has no product.", record.label())));
            continue;
        }

        sortIngredients(recipe.ingredients);
        const RecipeKey key = RecipeKey::fromSorted(recipe.ingredients);
        auto existing = lookup_.find(key);
        if (existing != lookup_.end()) {
            report(core::Diagnostic(core::Severity::Warning, core::ErrorCode::DuplicateRecipe,
                                    fmt::format("Duplicate recipe detected: {} maps to both {} and {}.\n"
                                                "Only the first mapping will be kept.",
                                                key.describe(), existing->second->name, recipe.product->name)));
            continue;
        }

        lookup_.emplace(key, recipe.product);
        recipes_.push_back(std::move(recipe));
    }

    RECIPE_INFO("Restored {} of {} stored recipes", recipes_.size(), records.size());
    return recipes_.size();
}

void RecipeCollection::sortIngredients(std::vector<const InventoryItem*>& ingredients) {
    std::stable_sort(ingredients.begin(), ingredients.end(),
        [](const InventoryItem* a, const InventoryItem* b) { return a->name < b->name; });
}

void RecipeCollection::report(core::Diagnostic diagnostic) const {
    core::emitDiagnostic(log_, std::move(diagnostic), core::LogModule::Recipe);
}

}} // namespace excelpipe::recipe
