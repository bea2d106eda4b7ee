/// @file effect_catalog.cpp
/// @brief EffectCatalog implementation: built-in definitions and YAML loading.

#include "vigor/game/effect_catalog.hpp"

#include <algorithm>
#include <mutex>

#include <yaml-cpp/yaml.h>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::ErrorCode;
using vigor::foundation::GameError;
using vigor::foundation::LogCategory;

// ── Registration / lookup ───────────────────────────────────────────────

GameResult<EffectDefinitionId> EffectCatalog::Register(StatusEffectDefinition definition) {
    if (definition.name.empty()) {
        return GameResult<EffectDefinitionId>::err(
            GameError(ErrorCode::InvalidArgument, "effect definition needs a name"));
    }
    definition.maxStacks = std::max(1, definition.maxStacks);
    definition.tickIntervalSeconds = std::max(0, definition.tickIntervalSeconds);
    definition.defaultDurationSeconds = std::max(0, definition.defaultDurationSeconds);

    std::unique_lock lock(mutex_);
    auto key = asciiLower(definition.name);
    if (byName_.count(key) > 0) {
        return GameResult<EffectDefinitionId>::err(
            GameError(ErrorCode::AlreadyExists, "effect already registered: " + definition.name));
    }
    if (!definition.id.isValid()) {
        definition.id = EffectDefinitionId(nextId_);
    }
    if (byId_.count(definition.id) > 0) {
        return GameResult<EffectDefinitionId>::err(
            GameError(ErrorCode::AlreadyExists,
                      "effect id already registered: " + std::to_string(definition.id.value())));
    }
    nextId_ = std::max(nextId_, definition.id.value() + 1);

    auto id = definition.id;
    auto ptr = std::make_shared<const StatusEffectDefinition>(std::move(definition));
    byId_.emplace(id, ptr);
    byName_.emplace(std::move(key), std::move(ptr));
    return GameResult<EffectDefinitionId>::ok(id);
}

EffectCatalog::DefinitionPtr EffectCatalog::FindById(EffectDefinitionId id) const {
    std::shared_lock lock(mutex_);
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : it->second;
}

EffectCatalog::DefinitionPtr EffectCatalog::FindByName(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = byName_.find(asciiLower(name));
    return it == byName_.end() ? nullptr : it->second;
}

std::vector<EffectCatalog::DefinitionPtr> EffectCatalog::All() const {
    std::vector<DefinitionPtr> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(byId_.size());
        for (const auto& [_, def] : byId_) {
            out.push_back(def);
        }
    }
    std::sort(out.begin(), out.end(), [](const DefinitionPtr& a, const DefinitionPtr& b) {
        return a->id < b->id;
    });
    return out;
}

std::size_t EffectCatalog::Size() const {
    std::shared_lock lock(mutex_);
    return byId_.size();
}

// ── Built-in definitions ────────────────────────────────────────────────

namespace {

StatusEffectDefinition makeDefinition(std::string name, std::string description,
                                      EffectCategory category, int durationSeconds,
                                      EffectImpact impact) {
    StatusEffectDefinition def;
    def.name = std::move(name);
    def.description = std::move(description);
    def.category = category;
    def.defaultDurationSeconds = durationSeconds;
    def.impacts.push_back(std::move(impact));
    return def;
}

EffectImpact impact(ImpactType type, double value, std::string target = {},
                    bool scales = true) {
    EffectImpact out;
    out.type = type;
    out.value = value;
    out.target = std::move(target);
    out.scalesWithIntensity = scales;
    return out;
}

} // namespace

std::vector<StatusEffectDefinition> EffectCatalog::DefaultDefinitions() {
    std::vector<StatusEffectDefinition> defs;

    // Wounds: permanent until healed; the -2 AV per stack is applied by the
    // summary, the impact here is the steady fatigue drain.
    auto wound = makeDefinition(std::string(kWoundEffectName),
                                "An injury that saps strength until it heals.",
                                EffectCategory::Wound, 0,
                                impact(ImpactType::PeriodicFatigueDamage, 1, {}, false));
    wound.stackable = true;
    wound.maxStacks = 10;
    wound.tickIntervalSeconds = 6;
    defs.push_back(std::move(wound));

    defs.push_back(makeDefinition("Strength", "Magically enhanced physical strength.",
                                  EffectCategory::Buff, 300,
                                  impact(ImpactType::ModifyAttribute, 2, "Physicality")));
    defs.push_back(makeDefinition("Agility", "Magically enhanced agility and reflexes.",
                                  EffectCategory::Buff, 300,
                                  impact(ImpactType::ModifyAttribute, 2, "Dodge")));
    defs.push_back(makeDefinition("Endurance", "Magically enhanced stamina and endurance.",
                                  EffectCategory::Buff, 300,
                                  impact(ImpactType::ModifyAttribute, 2, "Drive")));
    defs.push_back(makeDefinition("Protection", "A ward that softens incoming blows.",
                                  EffectCategory::Buff, 300,
                                  impact(ImpactType::ModifyDamageReceived, -0.20)));
    defs.push_back(makeDefinition("Battle Focus", "Heightened focus in combat.",
                                  EffectCategory::Buff, 180,
                                  impact(ImpactType::ModifyAttackValue, 2)));
    defs.push_back(makeDefinition("Iron Skin", "Skin hardened against attacks.",
                                  EffectCategory::Buff, 180,
                                  impact(ImpactType::ModifyDefenseValue, 2)));
    defs.push_back(makeDefinition("Slow", "Movements are sluggish.",
                                  EffectCategory::Debuff, 120,
                                  impact(ImpactType::ModifyAttribute, -3, "Dodge")));
    defs.push_back(makeDefinition("Curse", "Blows land with less force.",
                                  EffectCategory::Debuff, 300,
                                  impact(ImpactType::ModifyDamageDealt, -0.25)));

    auto poison = makeDefinition("Poison", "Toxins burn through the blood.",
                                 EffectCategory::DamageOverTime, 60,
                                 impact(ImpactType::PeriodicVitalityDamage, 2));
    poison.stackable = true;
    poison.maxStacks = 5;
    poison.tickIntervalSeconds = 6;
    defs.push_back(std::move(poison));

    auto burning = makeDefinition("Burning", "Flames sear the flesh.",
                                  EffectCategory::DamageOverTime, 30,
                                  impact(ImpactType::PeriodicVitalityDamage, 3));
    burning.stackable = true;
    burning.maxStacks = 3;
    burning.tickIntervalSeconds = 3;
    defs.push_back(std::move(burning));

    auto regeneration = makeDefinition("Regeneration", "Wounds knit themselves closed.",
                                       EffectCategory::HealOverTime, 60,
                                       impact(ImpactType::PeriodicVitalityHealing, 3));
    regeneration.tickIntervalSeconds = 6;
    defs.push_back(std::move(regeneration));

    auto rejuvenation = makeDefinition("Rejuvenation", "Energy flows back into tired limbs.",
                                       EffectCategory::HealOverTime, 60,
                                       impact(ImpactType::PeriodicFatigueHealing, 2));
    rejuvenation.tickIntervalSeconds = 6;
    defs.push_back(std::move(rejuvenation));

    defs.push_back(makeDefinition("Invisibility", "Unseen by ordinary eyes.",
                                  EffectCategory::Status, 120,
                                  impact(ImpactType::Invisibility, 1, {}, false)));
    defs.push_back(makeDefinition("Stunned", "Dazed and unable to act.",
                                  EffectCategory::Status, 6,
                                  impact(ImpactType::PreventActions, 1, {}, false)));
    return defs;
}

int EffectCatalog::SeedDefaults() {
    int added = 0;
    for (auto& def : DefaultDefinitions()) {
        if (FindByName(def.name)) {
            continue;
        }
        if (Register(std::move(def)).hasValue()) {
            ++added;
        }
    }
    VIGOR_LOG_INFO(LogCategory::Effect,
                   "seeded " + std::to_string(added) + " built-in effect definitions");
    return added;
}

// ── YAML loading ────────────────────────────────────────────────────────

namespace {

GameResult<int> loadFailed(std::string message) {
    return GameResult<int>::err(GameError(ErrorCode::EffectCatalogLoadFailed, std::move(message)));
}

GameResult<StatusEffectDefinition> parseDefinition(const YAML::Node& node) {
    using Result = GameResult<StatusEffectDefinition>;
    StatusEffectDefinition def;
    def.name = node["name"].as<std::string>("");
    if (def.name.empty()) {
        return Result::err(GameError(ErrorCode::EffectCatalogLoadFailed, "effect without a name"));
    }
    def.description = node["description"].as<std::string>("");
    if (node["id"]) {
        def.id = EffectDefinitionId(node["id"].as<uint64_t>());
    }

    auto categoryName = node["category"].as<std::string>("Status");
    auto category = parseEffectCategory(categoryName);
    if (!category) {
        return Result::err(GameError(ErrorCode::EffectCatalogLoadFailed,
                                     def.name + ": unknown category '" + categoryName + "'"));
    }
    def.category = *category;
    def.stackable = node["stackable"].as<bool>(false);
    def.maxStacks = node["max_stacks"].as<int>(1);
    def.tickIntervalSeconds = node["tick_interval_seconds"].as<int>(0);
    def.defaultDurationSeconds = node["default_duration_seconds"].as<int>(0);
    def.defaultIntensity = node["default_intensity"].as<double>(1.0);

    for (const auto& impactNode : node["impacts"]) {
        auto typeName = impactNode["type"].as<std::string>("");
        auto type = parseImpactType(typeName);
        if (!type) {
            return Result::err(GameError(ErrorCode::EffectCatalogLoadFailed,
                                         def.name + ": unknown impact type '" + typeName + "'"));
        }
        EffectImpact impact;
        impact.type = *type;
        impact.value = impactNode["value"].as<double>(0.0);
        impact.target = impactNode["target"].as<std::string>("");
        impact.scalesWithIntensity = impactNode["scales_with_intensity"].as<bool>(true);
        impact.isPercentage = impactNode["percentage"].as<bool>(false);
        def.impacts.push_back(std::move(impact));
    }
    return Result::ok(std::move(def));
}

GameResult<std::vector<StatusEffectDefinition>> parseCatalog(const YAML::Node& root) {
    using Result = GameResult<std::vector<StatusEffectDefinition>>;
    std::vector<StatusEffectDefinition> parsed;
    try {
        auto effects = root["effects"];
        if (!effects || !effects.IsSequence()) {
            return Result::err(GameError(ErrorCode::EffectCatalogLoadFailed,
                                         "effect catalog needs an 'effects' list"));
        }
        for (const auto& node : effects) {
            auto def = parseDefinition(node);
            if (def.hasError()) {
                return Result::err(def.error());
            }
            parsed.push_back(std::move(def).value());
        }
    } catch (const YAML::Exception& e) {
        return Result::err(GameError(ErrorCode::EffectCatalogLoadFailed,
                                     std::string("effect catalog parse error: ") + e.what()));
    }
    return Result::ok(std::move(parsed));
}

} // namespace

GameResult<int> EffectCatalog::LoadFromYaml(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return loadFailed("failed to open effect catalog: " + path.string());
    } catch (const YAML::Exception& e) {
        return loadFailed(std::string("effect catalog parse error: ") + e.what());
    }

    auto parsed = parseCatalog(root);
    if (parsed.hasError()) {
        return GameResult<int>::err(parsed.error());
    }
    return GameResult<int>::ok(registerLoaded(std::move(parsed).value()));
}

GameResult<int> EffectCatalog::LoadFromYamlString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return loadFailed(std::string("effect catalog parse error: ") + e.what());
    }

    auto parsed = parseCatalog(root);
    if (parsed.hasError()) {
        return GameResult<int>::err(parsed.error());
    }
    return GameResult<int>::ok(registerLoaded(std::move(parsed).value()));
}

int EffectCatalog::registerLoaded(std::vector<StatusEffectDefinition> definitions) {
    int added = 0;
    for (auto& def : definitions) {
        auto name = def.name;
        auto registered = Register(std::move(def));
        if (registered.hasError()) {
            VIGOR_LOG_WARN(LogCategory::Effect,
                           "skipping effect '" + name + "': " +
                           std::string(registered.error().message()));
            continue;
        }
        ++added;
    }
    VIGOR_LOG_INFO(LogCategory::Effect,
                   "loaded " + std::to_string(added) + " effect definitions from catalog");
    return added;
}

}  // namespace vigor::game
