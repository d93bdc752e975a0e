#include <gtest/gtest.h>
#include "excelpipe/recipe/RecipeCollection.hpp"
#include "excelpipe/recipe/ItemRegistry.hpp"
#include "excelpipe/core/Exception.hpp"

#include <string>
#include <vector>

using namespace excelpipe;
using excelpipe::core::ErrorCode;
using excelpipe::core::Severity;
using excelpipe::recipe::InventoryItem;
using excelpipe::recipe::Recipe;

class RecipeCollectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        herb = &registry.findOrCreate("Herb", "Ingredients");
        water = &registry.findOrCreate("Water", "Ingredients");
        ember = &registry.findOrCreate("Ember", "Ingredients");
        salt = &registry.findOrCreate("Salt", "Ingredients");
        potion_a = &registry.findOrCreate("Potion A", "Potions");
        potion_b = &registry.findOrCreate("Potion B", "Potions");
        collection.setDiagnostics(&log);
    }

    recipe::ItemRegistry registry;
    recipe::RecipeCollection collection;
    core::DiagnosticLog log;

    const InventoryItem* herb = nullptr;
    const InventoryItem* water = nullptr;
    const InventoryItem* ember = nullptr;
    const InventoryItem* salt = nullptr;
    const InventoryItem* potion_a = nullptr;
    const InventoryItem* potion_b = nullptr;
};

// 测试登记配方并按任意顺序查找
TEST_F(RecipeCollectionTest, AddAndFind) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Water", "Herb", ""}));
    ASSERT_EQ(collection.size(), 1u);

    const auto& stored = collection.recipes()[0];
    EXPECT_EQ(stored.ingredients, (std::vector<const InventoryItem*>{herb, water}));
    EXPECT_EQ(stored.product, potion_a);
    EXPECT_EQ(stored.label(), "(Herb + Water) => Potion A");

    EXPECT_EQ(collection.findProduct({herb, water}), potion_a);
    EXPECT_EQ(collection.findProduct({water, herb}), potion_a);
    EXPECT_EQ(collection.findProduct({herb}), nullptr);
    EXPECT_TRUE(log.empty());
}

// 测试原料顺序不同的两条配方冲突，保留第一条
TEST_F(RecipeCollectionTest, DuplicateKeepsFirst) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb", "Water"}));
    EXPECT_TRUE(collection.tryAdd(registry, "Potion B", {"Water", "Herb"}));

    EXPECT_EQ(collection.size(), 1u);
    EXPECT_EQ(collection.findProduct({water, herb}), potion_a);

    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].code, ErrorCode::DuplicateRecipe);
    EXPECT_EQ(log.entries()[0].severity, Severity::Warning);
    EXPECT_EQ(log.entries()[0].message,
              "Duplicate recipe detected: 'Herb' + 'Water' + '' maps to both Potion A and Potion B.\n"
              "Only the first mapping will be kept.");
}

// 测试重复登记同一条配方
TEST_F(RecipeCollectionTest, ReimportSameRecipe) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb", "Water"}));
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb", "Water"}));
    EXPECT_EQ(collection.size(), 1u);
    EXPECT_EQ(log.count(ErrorCode::DuplicateRecipe), 1u);
}

// 测试没有可用原料或产物未知时跳过
TEST_F(RecipeCollectionTest, RejectsUnusableRows) {
    EXPECT_FALSE(collection.tryAdd(registry, "Potion A", {"", "  ", ""}));
    EXPECT_FALSE(collection.tryAdd(registry, "Potion A", {"Moonstone"}));
    EXPECT_FALSE(collection.tryAdd(registry, "Potion Z", {"Herb"}));

    EXPECT_TRUE(collection.empty());
    EXPECT_TRUE(log.empty());
}

// 测试未知原料名被忽略
TEST_F(RecipeCollectionTest, UnknownIngredientIgnored) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb", "Moonstone"}));
    EXPECT_EQ(collection.recipes()[0].label(), "(Herb) => Potion A");
}

// 测试名称首尾空白不影响查找
TEST_F(RecipeCollectionTest, NamesAreTrimmed) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A ", {"Herb ", " Water"}));
    ASSERT_EQ(collection.size(), 1u);
    EXPECT_EQ(collection.recipes()[0].ingredients.size(), 2u);
    EXPECT_EQ(collection.recipes()[0].label(), "(Herb + Water) => Potion A");
    EXPECT_EQ(collection.findProduct({water, herb}), potion_a);
    EXPECT_TRUE(log.empty());
}

// 测试超过三种原料
TEST_F(RecipeCollectionTest, TooManyIngredients) {
    EXPECT_FALSE(collection.tryAdd(registry, "Potion A", {"Herb", "Water", "Ember", "Salt"}));
    EXPECT_TRUE(collection.empty());
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries()[0].code, ErrorCode::TooManyIngredients);
    EXPECT_EQ(log.entries()[0].severity, Severity::Error);
}

// 测试三种原料的配方
TEST_F(RecipeCollectionTest, ThreeIngredients) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion B", {"Water", "Ember", "Herb"}));
    EXPECT_EQ(collection.recipes()[0].label(), "(Ember + Herb + Water) => Potion B");
    EXPECT_EQ(collection.findProduct({herb, water, ember}), potion_b);
    EXPECT_EQ(collection.findProduct({herb, water}), nullptr);
}

// 测试缺省产物
TEST_F(RecipeCollectionTest, FindProductOrDefault) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb"}));
    EXPECT_EQ(collection.findProductOrDefault({salt}), nullptr);

    collection.setDefaultProduct(potion_b);
    EXPECT_EQ(collection.findProductOrDefault({salt}), potion_b);
    EXPECT_EQ(collection.findProductOrDefault({herb}), potion_a);
}

// 测试从已保存的记录恢复
TEST_F(RecipeCollectionTest, Restore) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Salt"}));

    std::vector<Recipe> records;
    records.push_back(Recipe{{water, herb}, potion_a});
    records.push_back(Recipe{{herb, water}, potion_b});
    records.push_back(Recipe{{}, potion_b});
    records.push_back(Recipe{{ember}, nullptr});
    records.push_back(Recipe{{ember, salt}, potion_b});

    EXPECT_EQ(collection.restore(records), 2u);
    EXPECT_EQ(collection.findProduct({salt}), nullptr);
    EXPECT_EQ(collection.findProduct({herb, water}), potion_a);
    EXPECT_EQ(collection.findProduct({salt, ember}), potion_b);
    EXPECT_EQ(collection.recipes()[0].ingredients, (std::vector<const InventoryItem*>{herb, water}));

    EXPECT_EQ(log.count(ErrorCode::DuplicateRecipe), 1u);
    EXPECT_EQ(log.count(ErrorCode::NoIngredients), 1u);
    EXPECT_EQ(log.count(ErrorCode::ProductNotFound), 1u);
}

// 测试清空
TEST_F(RecipeCollectionTest, Clear) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb"}));
    collection.clear();
    EXPECT_TRUE(collection.empty());
    EXPECT_EQ(collection.findProduct({herb}), nullptr);
    EXPECT_TRUE(collection.tryAdd(registry, "Potion B", {"Herb"}));
    EXPECT_EQ(collection.findProduct({herb}), potion_b);
}

// 测试配方诊断经 emitDiagnostic 记录，定位信息为空
TEST_F(RecipeCollectionTest, DiagnosticsUseRecipeModule) {
    ASSERT_TRUE(collection.tryAdd(registry, "Potion A", {"Herb"}));
    ASSERT_TRUE(collection.tryAdd(registry, "Potion B", {"Herb"}));

    ASSERT_EQ(log.size(), 1u);
    EXPECT_TRUE(log.entries()[0].source.empty());
    EXPECT_EQ(log.entries()[0].describe().rfind("[", 0), 0u);

    EXPECT_STREQ(core::moduleTag(core::LogModule::Recipe), "rcpe");
    EXPECT_STREQ(core::moduleTag(core::LogModule::Import), "impt");
    EXPECT_STREQ(core::moduleTag(core::LogModule::View), "view");
    EXPECT_STREQ(core::moduleTag(core::LogModule::Core), "core");
}

// ========== ItemRegistry ==========

// 测试查找或新建物品
TEST(ItemRegistryTest, FindOrCreate) {
    recipe::ItemRegistry registry;
    auto& herb = registry.findOrCreate("Herb", "Ingredients");
    EXPECT_EQ(herb.name, "Herb");
    EXPECT_EQ(herb.category, "Ingredients");
    EXPECT_TRUE(herb.dirty);

    auto& again = registry.findOrCreate("Herb", "Potions");
    EXPECT_EQ(&again, &herb);
    EXPECT_EQ(again.category, "Ingredients");
    EXPECT_EQ(registry.size(), 1u);

    EXPECT_EQ(registry.resolve("Herb"), &herb);
    EXPECT_EQ(registry.resolve("herb"), nullptr);
    EXPECT_THROW(registry.findOrCreate("", "Ingredients"), core::ParameterException);
}

// 测试 dirty 标记
TEST(ItemRegistryTest, DirtyTracking) {
    recipe::ItemRegistry registry;
    registry.findOrCreate("Herb", "Ingredients");
    registry.findOrCreate("Water", "Ingredients");
    EXPECT_EQ(registry.dirtyCount(), 2u);

    registry.clearDirty();
    EXPECT_EQ(registry.dirtyCount(), 0u);
    registry.findOrCreate("Herb", "Ingredients");
    EXPECT_EQ(registry.dirtyCount(), 1u);
}

// 测试分类路径规范化
TEST(ItemRegistryTest, NormalizeCategory) {
    EXPECT_EQ(recipe::ItemRegistry::normalizeCategory("Assets/Items/Potions/"), "Items/Potions");
    EXPECT_EQ(recipe::ItemRegistry::normalizeCategory("Items\\Herbs"), "Items/Herbs");
    EXPECT_EQ(recipe::ItemRegistry::normalizeCategory("/Potions"), "Potions");

    recipe::ItemRegistry registry;
    registry.findOrCreate("Herb", "Assets/Ingredients");
    EXPECT_TRUE(registry.hasCategory("Ingredients"));
}
