/// @file effect_catalog_test.cpp
/// @brief Unit tests for EffectCatalog registration and YAML loading.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "vigor/game/effect_catalog.hpp"

using namespace vigor::game;
using vigor::foundation::EffectDefinitionId;
using vigor::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════════════

TEST(EffectCatalogTest, RegisterAssignsSequentialIds) {
    EffectCatalog catalog;
    StatusEffectDefinition a;
    a.name = "Haste";
    StatusEffectDefinition b;
    b.name = "Fear";

    auto first = catalog.Register(a);
    auto second = catalog.Register(b);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value().value(), 1u);
    EXPECT_EQ(second.value().value(), 2u);
    EXPECT_EQ(catalog.Size(), 2u);
}

TEST(EffectCatalogTest, RejectsEmptyName) {
    EffectCatalog catalog;
    auto result = catalog.Register(StatusEffectDefinition{});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(EffectCatalogTest, RejectsDuplicateNameIgnoringCase) {
    EffectCatalog catalog;
    StatusEffectDefinition def;
    def.name = "Poison";
    ASSERT_TRUE(catalog.Register(def).hasValue());

    def.name = "POISON";
    auto again = catalog.Register(def);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST(EffectCatalogTest, RejectsDuplicateExplicitId) {
    EffectCatalog catalog;
    StatusEffectDefinition a;
    a.name = "A";
    a.id = EffectDefinitionId(7);
    StatusEffectDefinition b;
    b.name = "B";
    b.id = EffectDefinitionId(7);

    ASSERT_TRUE(catalog.Register(a).hasValue());
    EXPECT_TRUE(catalog.Register(b).hasError());

    StatusEffectDefinition c;
    c.name = "C";
    EXPECT_EQ(catalog.Register(c).value().value(), 8u);
}

TEST(EffectCatalogTest, ClampsNonsenseNumbers) {
    EffectCatalog catalog;
    StatusEffectDefinition def;
    def.name = "Odd";
    def.maxStacks = 0;
    def.tickIntervalSeconds = -5;
    def.defaultDurationSeconds = -1;
    ASSERT_TRUE(catalog.Register(def).hasValue());

    auto stored = catalog.FindByName("odd");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->maxStacks, 1);
    EXPECT_EQ(stored->tickIntervalSeconds, 0);
    EXPECT_EQ(stored->defaultDurationSeconds, 0);
}

TEST(EffectCatalogTest, LookupsMissReturnNull) {
    EffectCatalog catalog;
    EXPECT_EQ(catalog.FindByName("Nothing"), nullptr);
    EXPECT_EQ(catalog.FindById(EffectDefinitionId(3)), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// Built-in definitions
// ═══════════════════════════════════════════════════════════════════════════

TEST(EffectCatalogTest, SeedDefaultsRegistersBuiltIns) {
    EffectCatalog catalog;
    int added = catalog.SeedDefaults();
    EXPECT_EQ(added, static_cast<int>(EffectCatalog::DefaultDefinitions().size()));

    auto wound = catalog.FindByName(kWoundEffectName);
    ASSERT_NE(wound, nullptr);
    EXPECT_EQ(wound->category, EffectCategory::Wound);
    EXPECT_TRUE(wound->stackable);

    auto poison = catalog.FindByName("poison");
    ASSERT_NE(poison, nullptr);
    EXPECT_EQ(poison->maxStacks, 5);
    EXPECT_EQ(poison->tickIntervalSeconds, 6);
}

TEST(EffectCatalogTest, SeedingTwiceAddsNothing) {
    EffectCatalog catalog;
    catalog.SeedDefaults();
    auto size = catalog.Size();
    EXPECT_EQ(catalog.SeedDefaults(), 0);
    EXPECT_EQ(catalog.Size(), size);
}

TEST(EffectCatalogTest, AllIsOrderedById) {
    EffectCatalog catalog;
    catalog.SeedDefaults();
    auto all = catalog.All();
    ASSERT_FALSE(all.empty());
    for (std::size_t i = 1; i < all.size(); ++i) {
        EXPECT_LT(all[i - 1]->id, all[i]->id);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// YAML loading
// ═══════════════════════════════════════════════════════════════════════════

TEST(EffectCatalogYamlTest, LoadsDefinitionsAndImpacts) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYamlString(R"(
effects:
  - name: Bleeding
    category: DamageOverTime
    stackable: true
    max_stacks: 3
    tick_interval_seconds: 6
    default_duration_seconds: 60
    impacts:
      - type: PeriodicVitalityDamage
        value: 1
  - name: Warding
    category: Buff
    impacts:
      - type: ModifyDamageReceived
        value: -10
        percentage: true
)");
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_EQ(loaded.value(), 2);

    auto bleeding = catalog.FindByName("Bleeding");
    ASSERT_NE(bleeding, nullptr);
    EXPECT_EQ(bleeding->category, EffectCategory::DamageOverTime);
    EXPECT_EQ(bleeding->maxStacks, 3);
    ASSERT_EQ(bleeding->impacts.size(), 1u);
    EXPECT_EQ(bleeding->impacts[0].type, ImpactType::PeriodicVitalityDamage);

    auto warding = catalog.FindByName("Warding");
    ASSERT_NE(warding, nullptr);
    EXPECT_TRUE(warding->impacts[0].isPercentage);
    EXPECT_DOUBLE_EQ(warding->impacts[0].value, -10.0);
}

TEST(EffectCatalogYamlTest, DuplicatesAreSkipped) {
    EffectCatalog catalog;
    catalog.SeedDefaults();
    auto before = catalog.Size();
    auto loaded = catalog.LoadFromYamlString(R"(
effects:
  - name: Poison
  - name: Frostbite
    category: Debuff
)");
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value(), 1);
    EXPECT_EQ(catalog.Size(), before + 1);
}

TEST(EffectCatalogYamlTest, UnknownCategoryFailsWholeLoad) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYamlString(R"(
effects:
  - name: Fine
  - name: Weird
    category: Sideways
)");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::EffectCatalogLoadFailed);
    EXPECT_EQ(catalog.Size(), 0u);
}

TEST(EffectCatalogYamlTest, UnknownImpactTypeFails) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYamlString(R"(
effects:
  - name: Glitter
    impacts:
      - type: Sparkle
        value: 1
)");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::EffectCatalogLoadFailed);
}

TEST(EffectCatalogYamlTest, MissingEffectsListFails) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYamlString("combat:\n  health_tick_ms: 3000\n");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::EffectCatalogLoadFailed);
}

TEST(EffectCatalogYamlTest, MalformedYamlFails) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYamlString("effects: [ {name: A");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::EffectCatalogLoadFailed);
}

TEST(EffectCatalogYamlTest, MissingFileFails) {
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYaml("/nonexistent/vigor/effects.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::EffectCatalogLoadFailed);
}

TEST(EffectCatalogYamlTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "vigor_effect_catalog_test.yaml";
    {
        std::ofstream out(path);
        out << "effects:\n  - name: Rooted\n    impacts:\n      - type: PreventMovement\n";
    }
    EffectCatalog catalog;
    auto loaded = catalog.LoadFromYaml(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.hasValue());
    EXPECT_NE(catalog.FindByName("Rooted"), nullptr);
}
