#pragma once
#include "../components.hpp"
#include "../conditions.hpp"
#include "../pipeline.hpp"
#include "../schedule_config.hpp"
#include "../systems/arena.hpp"
#include "../systems/simulation.hpp"
#include "state_module.hpp"
#include <ecs/ecs.hpp>
#include <chrono>

// ---------------------------------------------------------------------------
// SimulationModule
//
// Creates the Arena and SessionStats resources, adds the gated
// SpawnOnRequest system to the Logic phase and registers the "simulation"
// fixed timestep (60 Hz unless configured) with BallSimulationSystem as its
// only stage.
//
// The stage is additionally gated on in_state(Playing); the Paused state
// also pauses the timestep itself, so no backlog builds while paused.
// ---------------------------------------------------------------------------

struct SimulationModule {
    static void install(ecs::World& world, sched::Pipeline& pipeline,
                        const sched::ScheduleConfig& config) {
        world.set_resource(Arena{});
        world.set_resource(SessionStats{});

        pipeline.add_logic(sched::run_if(ArenaSystem::SpawnOnRequest,
                                         sched::in_state(AppState::Playing)));

        auto builder = config.timestep_builder(StateModule::kSimulationLabel,
                                               std::chrono::microseconds(16667));
        sched::ConditionSet playing;
        playing.run_if(sched::in_state(AppState::Playing))
               .with_system(BallSimulationSystem::Update);
        builder.with_stage(std::move(playing).into_stage());
        pipeline.add_fixed(std::move(builder).build());
    }
};
