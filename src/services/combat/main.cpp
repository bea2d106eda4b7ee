/// @file main.cpp
/// @brief Combat service entry point.
///
/// Standalone executable hosting the combat core: it loads the effect
/// catalog, wires the engines together and drives the recurring health and
/// effect ticks from a fixed-rate loop until SIGINT or SIGTERM.

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/config_manager.hpp"
#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/game_logger.hpp"
#include "vigor/foundation/job_scheduler.hpp"
#include "vigor/game/action_gate.hpp"
#include "vigor/game/attack_resolver.hpp"
#include "vigor/game/combat_events.hpp"
#include "vigor/game/combat_session_manager.hpp"
#include "vigor/game/combatant_registry.hpp"
#include "vigor/game/dice.hpp"
#include "vigor/game/effect_catalog.hpp"
#include "vigor/game/equipment.hpp"
#include "vigor/game/health_pool_processor.hpp"
#include "vigor/game/npc_decision_policy.hpp"
#include "vigor/game/status_effect_engine.hpp"
#include "vigor/service/combat_tick_service.hpp"
#include "vigor/service/game_loop.hpp"
#include "vigor/service/service_runner.hpp"

namespace {

using vigor::foundation::LogCategory;

std::shared_ptr<vigor::game::EffectCatalog> buildCatalog(
    const vigor::foundation::ConfigManager& config) {
    auto catalog = std::make_shared<vigor::game::EffectCatalog>();
    catalog->SeedDefaults();

    auto effectsFile = config.getOr<std::string>("combat.effects_file", "");
    if (!effectsFile.empty()) {
        auto loaded = catalog->LoadFromYaml(effectsFile);
        if (loaded.hasError()) {
            // The seeded definitions are enough to run.
            VIGOR_LOG_WARN(LogCategory::Config, std::string(loaded.error().message()));
        }
    }
    return catalog;
}

void subscribeNarration(vigor::foundation::EventBus& events) {
    events.Subscribe<vigor::game::CombatActionEvent>(
        [](const vigor::game::CombatActionEvent& e) {
            VIGOR_LOG_INFO(LogCategory::Combat, e.description);
        });
    events.Subscribe<vigor::game::CombatNarration>(
        [](const vigor::game::CombatNarration& e) {
            VIGOR_LOG_INFO(LogCategory::Effect, e.message);
        });
    events.Subscribe<vigor::game::CombatEnded>(
        [](const vigor::game::CombatEnded& e) {
            VIGOR_LOG_INFO(LogCategory::Combat, "combat ended: " + e.reason);
        });
}

} // namespace

int main(int argc, char* argv[]) {
    vigor::service::SignalHandler signals;

    auto configPath = vigor::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/vigor/vigor.yaml";
    }

    vigor::foundation::ConfigManager config;
    auto loadResult = vigor::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    vigor::service::applyLoggingConfig(config);

    auto settings = vigor::service::CombatTickSettings::FromConfig(config);
    auto workers = static_cast<std::size_t>(std::max(1, config.getOr<int>("combat.worker_threads", 2)));
    auto loopRate = static_cast<uint32_t>(std::max(1, config.getOr<int>("combat.loop_rate_hz", 10)));

    // ── Combat core ─────────────────────────────────────────────────────
    auto clock = std::make_shared<vigor::foundation::SystemClock>();
    auto events = std::make_shared<vigor::foundation::EventBus>();
    auto registry = std::make_shared<vigor::game::CombatantRegistry>();
    auto catalog = buildCatalog(config);
    auto effects = std::make_shared<vigor::game::StatusEffectEngine>(catalog, clock);
    auto sessions = std::make_shared<vigor::game::CombatSessionManager>(events, clock);
    auto equipment = std::make_shared<vigor::game::InMemoryEquipmentProvider>();
    auto dice = std::make_shared<vigor::game::DiceRoller>(nullptr);
    auto gate = std::make_shared<vigor::game::ActionGate>(dice, events);
    auto resolver = std::make_shared<vigor::game::AttackResolver>(
        sessions, effects, equipment, dice, gate, events, clock);
    auto baseTick = std::max(std::chrono::seconds(1),
                             std::chrono::duration_cast<std::chrono::seconds>(settings.healthTick));
    auto healthPools = std::make_shared<vigor::game::HealthPoolProcessor>(clock, baseTick);
    auto npcPolicy = std::make_shared<vigor::game::NpcDecisionPolicy>(sessions, resolver,
                                                                      registry, events);
    subscribeNarration(*events);

    vigor::service::CombatTickService ticks(
        {registry, sessions, effects, healthPools, npcPolicy, events}, settings);

    // ── Scheduling ──────────────────────────────────────────────────────
    vigor::foundation::GameJobScheduler scheduler(workers);
    auto registered = ticks.Register(scheduler);
    if (!registered) {
        std::cerr << "Failed to register combat ticks: "
                  << registered.error().message() << "\n";
        return EXIT_FAILURE;
    }

    vigor::service::GameLoop loop(loopRate);
    loop.setTickCallback([&scheduler](std::chrono::milliseconds dt) {
        scheduler.processTick(dt);
    });
    if (!loop.start()) {
        std::cerr << "Failed to start game loop\n";
        return EXIT_FAILURE;
    }

    std::cout << "Combat service started (effects: " << catalog->Size()
              << ", workers: " << workers << ", loop: " << loopRate << " Hz)\n";

    vigor::service::GracefulShutdown shutdown;
    shutdown.addHook("loop", [&loop]() { loop.stop(); });
    shutdown.addHook("scheduler", [&scheduler]() { scheduler.requestStop(); });
    shutdown.addHook("logger", []() {
        auto flushed = vigor::foundation::GameLogger::instance().flush();
        if (flushed.hasError()) {
            std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
        }
    });

    signals.waitForShutdown();

    std::cout << "Shutting down combat service...\n";
    shutdown.execute();
    std::cout << "Combat service stopped\n";
    return EXIT_SUCCESS;
}
