#include "excelpipe/recipe/ItemRegistry.hpp"
#include "excelpipe/core/Exception.hpp"
#include "excelpipe/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace excelpipe {
namespace recipe {

const InventoryItem* ItemRegistry::resolve(const std::string& name) const {
    auto it = lookup_.find(name);
    return it != lookup_.end() ? it->second : nullptr;
}

InventoryItem* ItemRegistry::find(const std::string& name) {
    auto it = lookup_.find(name);
    return it != lookup_.end() ? it->second : nullptr;
}

InventoryItem& ItemRegistry::findOrCreate(const std::string& name, const std::string& category) {
    EXCELPIPE_THROW_IF(name.empty(), "Item name must not be empty", "name");

    if (auto* existing = find(name)) {
        existing->dirty = true;
        return *existing;
    }

    std::string folder = normalizeCategory(category);
    if (categories_.insert(folder).second) {
        RECIPE_WARN("Category '{}' does not exist - creating it now.", folder);
    }

    auto item = std::make_unique<InventoryItem>();
    item->name = name;
    item->category = folder;
    item->dirty = true;
    items_.push_back(std::move(item));
    lookup_.emplace(name, items_.back().get());

    RECIPE_DEBUG("Created item '{}' in category '{}'", name, folder);
    return *items_.back();
}

bool ItemRegistry::hasCategory(const std::string& category) const {
    return categories_.count(normalizeCategory(category)) > 0;
}

size_t ItemRegistry::dirtyCount() const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
        [](const std::unique_ptr<InventoryItem>& item) { return item->dirty; }));
}

void ItemRegistry::clearDirty() {
    for (auto& item : items_) {
        item->dirty = false;
    }
}

std::string ItemRegistry::normalizeCategory(const std::string& category) {
    std::string folder = category;
    std::replace(folder.begin(), folder.end(), '\\', '/');
    if (folder.rfind("Assets/", 0) == 0) {
        folder.erase(0, 7);
    }
    while (!folder.empty() && folder.front() == '/') {
        folder.erase(folder.begin());
    }
    while (!folder.empty() && folder.back() == '/') {
        folder.pop_back();
    }
    return folder;
}

}} // namespace excelpipe::recipe
