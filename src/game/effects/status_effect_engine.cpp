/// @file status_effect_engine.cpp
/// @brief StatusEffectEngine implementation.

#include "vigor/game/status_effect_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::ErrorCode;
using vigor::foundation::GameError;
using vigor::foundation::LogCategory;
using vigor::foundation::LogContext;
using vigor::foundation::saturatingAdd;

namespace {

double scaledValue(const EffectImpact& impact, const StatusEffectInstance& instance) {
    double value = impact.value * static_cast<double>(instance.stacks);
    if (impact.scalesWithIntensity) {
        value *= instance.intensity;
    }
    return value;
}

int roundToInt(double value) {
    auto rounded = std::lround(value);
    rounded = std::clamp<long>(rounded, std::numeric_limits<int>::min(),
                               std::numeric_limits<int>::max());
    return static_cast<int>(rounded);
}

int clampedProduct(int perTick, int64_t ticks) {
    auto total = static_cast<int64_t>(perTick) * ticks;
    total = std::clamp<int64_t>(total, std::numeric_limits<int>::min(),
                                std::numeric_limits<int>::max());
    return static_cast<int>(total);
}

std::optional<GameTime> expiryFor(const StatusEffectDefinition& definition,
                                  const ApplyEffectOptions& options, GameTime now) {
    if (options.durationSeconds.has_value()) {
        return now + std::chrono::seconds(*options.durationSeconds);
    }
    if (definition.defaultDurationSeconds > 0) {
        return now + std::chrono::seconds(definition.defaultDurationSeconds);
    }
    return std::nullopt;
}

int effectiveDuration(const StatusEffectDefinition& definition,
                      const ApplyEffectOptions& options) {
    return options.durationSeconds.value_or(definition.defaultDurationSeconds);
}

LogContext effectContext(CombatantId combatant, const StatusEffectDefinition& definition) {
    LogContext ctx;
    ctx.combatantId = combatant;
    ctx.extra["effect"] = definition.name;
    return ctx;
}

void lowerWoundPool(Combatant& combatant, int healed) {
    if (healed <= 0) {
        return;
    }
    std::lock_guard lock(combatant.Mutex());
    auto& pools = combatant.Pools();
    pools.wounds = std::max(0, pools.wounds - healed);
}

} // namespace

StatusEffectEngine::StatusEffectEngine(std::shared_ptr<const EffectCatalog> catalog,
                                       std::shared_ptr<const IClock> clock)
    : catalog_(std::move(catalog)), clock_(std::move(clock)) {}

// ── Application ─────────────────────────────────────────────────────────

GameResult<EffectApplication> StatusEffectEngine::ApplyEffect(
    CombatantId combatant, std::string_view name, const ApplyEffectOptions& options) {
    auto definition = catalog_->FindByName(name);
    if (!definition) {
        return GameResult<EffectApplication>::err(
            GameError(ErrorCode::EffectDefinitionNotFound,
                      "Effect '" + std::string(name) + "' not found"));
    }
    std::lock_guard lock(mutex_);
    return applyLocked(combatant, *definition, options, clock_->now());
}

GameResult<EffectApplication> StatusEffectEngine::ApplyEffect(
    CombatantId combatant, EffectDefinitionId definitionId, const ApplyEffectOptions& options) {
    auto definition = catalog_->FindById(definitionId);
    if (!definition) {
        return GameResult<EffectApplication>::err(
            GameError(ErrorCode::EffectDefinitionNotFound, "Effect definition not found"));
    }
    std::lock_guard lock(mutex_);
    return applyLocked(combatant, *definition, options, clock_->now());
}

GameResult<EffectApplication> StatusEffectEngine::ApplyWound(
    CombatantId combatant, BodyLocation location, std::optional<CombatantId> source) {
    ApplyEffectOptions options;
    options.bodyLocation = location;
    options.sourceId = source;
    return ApplyEffect(combatant, kWoundEffectName, options);
}

StatusEffectInstance* StatusEffectEngine::findMergeTarget(InstanceList& list,
                                                          EffectDefinitionId definition,
                                                          std::optional<BodyLocation> location,
                                                          GameTime now) {
    StatusEffectInstance* oldest = nullptr;
    for (auto& instance : list) {
        if (!instance.active || instance.definitionId != definition || instance.IsExpiredAt(now)) {
            continue;
        }
        if (location.has_value() && instance.bodyLocation != location) {
            continue;
        }
        if (oldest == nullptr || instance.appliedAt < oldest->appliedAt) {
            oldest = &instance;
        }
    }
    return oldest;
}

GameResult<EffectApplication> StatusEffectEngine::applyLocked(
    CombatantId combatant, const StatusEffectDefinition& definition,
    const ApplyEffectOptions& options, GameTime now) {
    if (options.durationSeconds.has_value() && *options.durationSeconds < 0) {
        return GameResult<EffectApplication>::err(
            GameError(ErrorCode::InvalidArgument, "effect duration must not be negative"));
    }

    auto& list = instances_[combatant];
    auto duration = effectiveDuration(definition, options);
    auto ctx = effectContext(combatant, definition);

    if (auto* existing = findMergeTarget(list, definition.id, options.bodyLocation, now)) {
        EffectApplication application;
        application.instanceId = existing->id;

        if (definition.stackable) {
            if (existing->stacks < definition.maxStacks) {
                ++existing->stacks;
                existing->appliedAt = now;
                if (duration > 0) {
                    existing->expiresAt = now + std::chrono::seconds(duration);
                }
                application.stacks = existing->stacks;
                application.stacked = true;
                application.message = definition.name + " stacked (" +
                                       std::to_string(existing->stacks) + "/" +
                                       std::to_string(definition.maxStacks) + ")";
            } else {
                if (duration > 0) {
                    existing->appliedAt = now;
                    existing->expiresAt = now + std::chrono::seconds(duration);
                }
                application.stacks = existing->stacks;
                application.refreshed = true;
                application.message = definition.name + " refreshed (max stacks)";
            }
        } else {
            existing->appliedAt = now;
            existing->intensity = options.intensity.value_or(definition.defaultIntensity);
            if (duration > 0) {
                existing->expiresAt = now + std::chrono::seconds(duration);
            }
            application.stacks = existing->stacks;
            application.refreshed = true;
            application.message = definition.name + " refreshed";
        }
        VIGOR_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Effect,
                      application.message, ctx);
        return GameResult<EffectApplication>::ok(std::move(application));
    }

    StatusEffectInstance instance;
    instance.id = EffectInstanceId(nextInstanceId_++);
    instance.combatantId = combatant;
    instance.definitionId = definition.id;
    instance.stacks = 1;
    instance.intensity = options.intensity.value_or(definition.defaultIntensity);
    instance.appliedAt = now;
    instance.expiresAt = expiryFor(definition, options, now);
    instance.bodyLocation = options.bodyLocation;
    instance.sourceId = options.sourceId;

    EffectApplication application;
    application.instanceId = instance.id;
    application.stacks = 1;
    application.message = definition.name + " applied";
    list.push_back(std::move(instance));

    VIGOR_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Effect, application.message, ctx);
    return GameResult<EffectApplication>::ok(std::move(application));
}

// ── Removal ─────────────────────────────────────────────────────────────

GameResult<StatusEffectInstance> StatusEffectEngine::RemoveEffect(
    CombatantId combatant, EffectInstanceId instanceId, std::string_view reason) {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it != instances_.end()) {
        auto& list = it->second;
        auto pos = std::find_if(list.begin(), list.end(),
                                [&](const StatusEffectInstance& i) { return i.id == instanceId; });
        if (pos != list.end()) {
            auto removed = std::move(*pos);
            list.erase(pos);
            removed.active = false;
            removed.removedAt = clock_->now();
            removed.removalReason = std::string(reason);
            return GameResult<StatusEffectInstance>::ok(std::move(removed));
        }
    }
    return GameResult<StatusEffectInstance>::err(
        GameError(ErrorCode::EffectInstanceNotFound,
                  "no effect instance " + std::to_string(instanceId.value())));
}

int StatusEffectEngine::RemoveEffectsByCategory(CombatantId combatant, EffectCategory category,
                                                std::string_view reason) {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return 0;
    }
    auto& list = it->second;
    auto before = list.size();
    std::erase_if(list, [&](const StatusEffectInstance& instance) {
        auto def = catalog_->FindById(instance.definitionId);
        return def && def->category == category;
    });
    auto removed = static_cast<int>(before - list.size());
    if (removed > 0) {
        VIGOR_LOG_DEBUG(LogCategory::Effect,
                        "removed " + std::to_string(removed) + " " +
                        std::string(effectCategoryName(category)) + " effects (" +
                        std::string(reason) + ")");
    }
    return removed;
}

int StatusEffectEngine::HealWoundStacks(CombatantId combatant, int count,
                                        std::optional<BodyLocation> location) {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return 0;
    }
    auto& list = it->second;

    std::vector<StatusEffectInstance*> wounds;
    for (auto& instance : list) {
        auto def = catalog_->FindById(instance.definitionId);
        if (!def || def->category != EffectCategory::Wound) {
            continue;
        }
        if (location.has_value() && instance.bodyLocation.value_or(BodyLocation::General) != *location) {
            continue;
        }
        wounds.push_back(&instance);
    }
    std::stable_sort(wounds.begin(), wounds.end(),
                     [](const StatusEffectInstance* a, const StatusEffectInstance* b) {
                         return a->appliedAt < b->appliedAt;
                     });

    int healed = 0;
    for (auto* wound : wounds) {
        if (count > 0 && healed >= count) {
            break;
        }
        int take = count > 0 ? std::min(wound->stacks, count - healed) : wound->stacks;
        wound->stacks -= take;
        healed += take;
        if (wound->stacks <= 0) {
            wound->active = false;
            wound->removalReason = "healed";
        }
    }
    std::erase_if(list, [](const StatusEffectInstance& i) { return !i.active; });
    return healed;
}

int StatusEffectEngine::HealWounds(Combatant& combatant, int count,
                                   std::optional<BodyLocation> location) {
    int healed = HealWoundStacks(combatant.Id(), count, location);
    lowerWoundPool(combatant, healed);
    return healed;
}

void StatusEffectEngine::RemoveAllFor(CombatantId combatant) {
    std::lock_guard lock(mutex_);
    instances_.erase(combatant);
}

// ── Queries ─────────────────────────────────────────────────────────────

EffectSummary StatusEffectEngine::Summarize(const std::vector<StatusEffectInstance>& instances,
                                            const EffectCatalog& catalog, GameTime now) {
    EffectSummary summary;
    for (const auto& instance : instances) {
        if (!instance.active || instance.IsExpiredAt(now)) {
            continue;
        }
        auto def = catalog.FindById(instance.definitionId);
        if (!def) {
            continue;
        }

        summary.activeEffectNames.push_back(
            instance.stacks > 1 ? def->name + " x" + std::to_string(instance.stacks) : def->name);

        if (def->category == EffectCategory::Wound) {
            summary.woundCount += instance.stacks;
            summary.woundsByLocation[instance.bodyLocation.value_or(BodyLocation::General)] +=
                instance.stacks;
            summary.attackValueModifier += kWoundAttackPenalty * instance.stacks;
        }

        for (const auto& impact : def->impacts) {
            double value = scaledValue(impact, instance);
            int rounded = roundToInt(value);
            switch (impact.type) {
                case ImpactType::ModifyAttribute:
                    summary.attributeModifiers[impact.target] += rounded;
                    break;
                case ImpactType::ModifySkill:
                    summary.skillModifiers[impact.target] += rounded;
                    break;
                case ImpactType::ModifyAttackValue:
                    summary.attackValueModifier += rounded;
                    break;
                case ImpactType::ModifyDefenseValue:
                    summary.defenseValueModifier += rounded;
                    break;
                case ImpactType::ModifyMaxFatigue:
                    summary.maxFatigueModifier += rounded;
                    break;
                case ImpactType::ModifyMaxVitality:
                    summary.maxVitalityModifier += rounded;
                    break;
                case ImpactType::PreventMovement:
                    summary.canMove = false;
                    break;
                case ImpactType::PreventSpellcasting:
                    summary.canCastSpells = false;
                    break;
                case ImpactType::PreventActions:
                    summary.canAct = false;
                    break;
                case ImpactType::Invisibility:
                    summary.isInvisible = true;
                    break;
                case ImpactType::ModifyDamageDealt:
                    summary.damageDealtModifier += impact.isPercentage ? value / 100.0 : value;
                    break;
                case ImpactType::ModifyDamageReceived:
                    summary.damageReceivedModifier += impact.isPercentage ? value / 100.0 : value;
                    break;
                case ImpactType::PeriodicFatigueDamage:
                case ImpactType::PeriodicVitalityDamage:
                case ImpactType::PeriodicFatigueHealing:
                case ImpactType::PeriodicVitalityHealing:
                    break;
            }
        }
    }
    return summary;
}

EffectSummary StatusEffectEngine::Summary(CombatantId combatant) const {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return EffectSummary{};
    }
    return Summarize(it->second, *catalog_, clock_->now());
}

std::vector<StatusEffectInstance> StatusEffectEngine::ActiveEffects(CombatantId combatant) const {
    std::lock_guard lock(mutex_);
    std::vector<StatusEffectInstance> out;
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return out;
    }
    auto now = clock_->now();
    for (const auto& instance : it->second) {
        if (instance.active && !instance.IsExpiredAt(now)) {
            out.push_back(instance);
        }
    }
    return out;
}

bool StatusEffectEngine::HasEffect(CombatantId combatant, std::string_view name) const {
    auto definition = catalog_->FindByName(name);
    if (!definition) {
        return false;
    }
    auto active = ActiveEffects(combatant);
    return std::any_of(active.begin(), active.end(), [&](const StatusEffectInstance& i) {
        return i.definitionId == definition->id;
    });
}

int StatusEffectEngine::WoundCount(CombatantId combatant) const {
    return Summary(combatant).woundCount;
}

std::map<BodyLocation, int> StatusEffectEngine::WoundsByLocation(CombatantId combatant) const {
    return Summary(combatant).woundsByLocation;
}

std::vector<CombatantId> StatusEffectEngine::AffectedCombatants() const {
    std::lock_guard lock(mutex_);
    std::vector<CombatantId> out;
    out.reserve(instances_.size());
    for (const auto& [id, list] : instances_) {
        if (!list.empty()) {
            out.push_back(id);
        }
    }
    return out;
}

// ── Tick processing ─────────────────────────────────────────────────────

PeriodicResult StatusEffectEngine::CollectPeriodicEffects(CombatantId combatant) {
    PeriodicResult result;
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return result;
    }
    auto now = clock_->now();

    for (auto& instance : it->second) {
        if (!instance.active) {
            continue;
        }
        auto def = catalog_->FindById(instance.definitionId);
        if (!def || def->tickIntervalSeconds <= 0) {
            continue;
        }

        auto interval = std::chrono::seconds(def->tickIntervalSeconds);
        auto base = instance.lastTickAt.value_or(instance.appliedAt);
        auto horizon = instance.expiresAt.has_value() ? std::min(now, *instance.expiresAt) : now;
        if (horizon <= base) {
            continue;
        }
        int64_t ticks = (horizon - base) / interval;
        if (ticks <= 0) {
            continue;
        }

        for (const auto& impact : def->impacts) {
            int perTick = roundToInt(scaledValue(impact, instance));
            int amount = clampedProduct(perTick, ticks);
            switch (impact.type) {
                case ImpactType::PeriodicFatigueDamage:
                    result.fatigueDelta = saturatingAdd(result.fatigueDelta, amount);
                    result.messages.push_back(def->name + " deals " + std::to_string(amount) +
                                              " fatigue damage");
                    break;
                case ImpactType::PeriodicVitalityDamage:
                    result.vitalityDelta = saturatingAdd(result.vitalityDelta, amount);
                    result.messages.push_back(def->name + " deals " + std::to_string(amount) +
                                              " vitality damage");
                    break;
                case ImpactType::PeriodicFatigueHealing:
                    result.fatigueDelta = saturatingAdd(result.fatigueDelta, -amount);
                    result.messages.push_back(def->name + " restores " + std::to_string(amount) +
                                              " fatigue");
                    break;
                case ImpactType::PeriodicVitalityHealing:
                    result.vitalityDelta = saturatingAdd(result.vitalityDelta, -amount);
                    result.messages.push_back(def->name + " restores " + std::to_string(amount) +
                                              " vitality");
                    break;
                default:
                    break;
            }
        }
        instance.lastTickAt = base + interval * ticks;
    }
    return result;
}

PeriodicResult StatusEffectEngine::ProcessPeriodicEffects(Combatant& combatant) {
    auto result = CollectPeriodicEffects(combatant.Id());
    if (result.fatigueDelta != 0 || result.vitalityDelta != 0) {
        combatant.AddPending(result.fatigueDelta, result.vitalityDelta);

        LogContext ctx;
        ctx.combatantId = combatant.Id();
        ctx.extra["fatigue"] = std::to_string(result.fatigueDelta);
        ctx.extra["vitality"] = std::to_string(result.vitalityDelta);
        VIGOR_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Effect,
                      "periodic effects queued", ctx);
    }
    return result;
}

int StatusEffectEngine::CollectNaturalWoundHealing(CombatantId combatant) {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(combatant);
    if (it == instances_.end()) {
        return 0;
    }
    auto now = clock_->now();
    auto& list = it->second;

    std::vector<StatusEffectInstance*> wounds;
    for (auto& instance : list) {
        auto def = catalog_->FindById(instance.definitionId);
        if (instance.active && def && def->category == EffectCategory::Wound) {
            wounds.push_back(&instance);
        }
    }
    std::stable_sort(wounds.begin(), wounds.end(),
                     [](const StatusEffectInstance* a, const StatusEffectInstance* b) {
                         return a->appliedAt < b->appliedAt;
                     });

    int healed = 0;
    for (auto* wound : wounds) {
        if (now <= wound->appliedAt) {
            continue;
        }
        auto due = static_cast<int>(std::min<int64_t>(
            (now - wound->appliedAt) / kNaturalWoundHealInterval, std::numeric_limits<int>::max()));
        if (due <= 0) {
            continue;
        }
        int take = std::min(due, wound->stacks);
        wound->stacks -= take;
        wound->appliedAt = now;
        healed += take;
        if (wound->stacks <= 0) {
            wound->active = false;
            wound->removalReason = "natural_healing";
        }
    }
    std::erase_if(list, [](const StatusEffectInstance& i) { return !i.active; });

    if (healed > 0) {
        LogContext ctx;
        ctx.combatantId = combatant;
        VIGOR_LOG_CTX(foundation::LogLevel::Debug, LogCategory::Effect,
                      std::to_string(healed) + " wound(s) healed naturally", ctx);
    }
    return healed;
}

int StatusEffectEngine::ProcessNaturalWoundHealing(Combatant& combatant) {
    int healed = CollectNaturalWoundHealing(combatant.Id());
    lowerWoundPool(combatant, healed);
    return healed;
}

std::vector<StatusEffectInstance> StatusEffectEngine::CleanupExpired() {
    std::vector<StatusEffectInstance> expired;
    std::lock_guard lock(mutex_);
    auto now = clock_->now();
    for (auto it = instances_.begin(); it != instances_.end();) {
        auto& list = it->second;
        for (auto pos = list.begin(); pos != list.end();) {
            if (pos->IsExpiredAt(now)) {
                pos->active = false;
                pos->removedAt = now;
                pos->removalReason = "expired";
                expired.push_back(std::move(*pos));
                pos = list.erase(pos);
            } else {
                ++pos;
            }
        }
        it = list.empty() ? instances_.erase(it) : std::next(it);
    }
    if (!expired.empty()) {
        VIGOR_LOG_DEBUG(LogCategory::Effect,
                        "expired " + std::to_string(expired.size()) + " effect instance(s)");
    }
    return expired;
}

}  // namespace vigor::game
