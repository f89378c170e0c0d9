#pragma once
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds InputGatherSystem to the Pre-Update phase, after the EventBus flush.
// The InputRecord resource is created up front so resource_exists<> gates
// downstream are true from the first frame.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, sched::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        pipeline.add_pre_update([](ecs::World& w) { InputGatherSystem::Update(w); });
    }
};
