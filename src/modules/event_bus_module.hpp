#pragma once
#include "../components.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../state.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource, registers the demo's event
// queues and installs the per-frame flush as the first Pre-Update step.
// Must be the first module installed so later modules find live queues.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, sched::Pipeline& pipeline) {
        world.set_resource(sched::EventRegistry{});
        auto& reg = world.resource<sched::EventRegistry>();
        reg.register_queue<BounceEvent>(world);
        reg.register_queue<sched::StateTransition<AppState>>(world);

        pipeline.add_pre_update([](ecs::World& w) {
            w.resource<sched::EventRegistry>().flush_all(w);
        });
    }
};
