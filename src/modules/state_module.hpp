#pragma once
#include "../components.hpp"
#include "../conditions.hpp"
#include "../fixed_timestep.hpp"
#include "../pipeline.hpp"
#include "../schedule_config.hpp"
#include "../state.hpp"
#include "../systems/app_flow.hpp"
#include "../systems/arena.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// StateModule
//
// Builds the AppState transition machine and wires the flow systems that
// request transitions.
//
//   Menu    exit  → ArenaSystem::StartSession
//   Menu    enter → ArenaSystem::ClearSession
//   Paused  enter → pause the "simulation" fixed timestep
//   Paused  exit  → resume it
//
// Logic-phase order: flow systems (each gated by in_state) then the machine,
// so a request made this frame is applied this frame. A logger gated on
// on_event<StateTransition<AppState>> runs after the machine.
// ---------------------------------------------------------------------------

struct StateModule {
    static constexpr const char* kSimulationLabel = "simulation";

    static void install(ecs::World& /*world*/, sched::Pipeline& pipeline,
                        const sched::ScheduleConfig& config) {
        sched::ConditionSet flow;
        flow.run_if(sched::resource_exists<InputRecord>())
            .with_system(sched::run_if(AppFlowSystem::MenuUpdate,    sched::in_state(AppState::Menu)))
            .with_system(sched::run_if(AppFlowSystem::PlayingUpdate, sched::in_state(AppState::Playing)))
            .with_system(sched::run_if(AppFlowSystem::PausedUpdate,  sched::in_state(AppState::Paused)));
        for (auto& sys : std::move(flow).into_systems()) pipeline.add_logic(std::move(sys));

        sched::StateTransitionMachine<AppState>::Builder machine(AppState::Menu);
        machine.on_exit(AppState::Menu,   ArenaSystem::StartSession)
               .on_enter(AppState::Menu,  ArenaSystem::ClearSession)
               .on_enter(AppState::Paused, [](ecs::World& w) {
                   sched::timesteps(w).pause(kSimulationLabel);
               })
               .on_exit(AppState::Paused, [](ecs::World& w) {
                   sched::timesteps(w).resume(kSimulationLabel);
               })
               .max_transitions_per_run(config.max_transitions_per_run);
        pipeline.add_logic(std::move(machine).build().into_system());

        pipeline.add_logic(sched::run_if(
            [](ecs::World& w) {
                for (const auto& t : w.resource<sched::Events<sched::StateTransition<AppState>>>().read()) {
                    TraceLog(LOG_INFO, "STATE: %s -> %s",
                             t.from ? to_string(*t.from) : "(none)", to_string(t.to));
                }
            },
            sched::on_event<sched::StateTransition<AppState>>()));
    }
};
