#pragma once
#include "../components.hpp"
#include "../conditions.hpp"
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Adds the bounce flash (gated on on_event<BounceEvent>) and RenderSystem to
// the Render phase, in that order.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, sched::Pipeline& pipeline) {
        world.set_resource(BounceFlash{});
        pipeline.add_render(sched::run_if(RenderSystem::BounceFlashUpdate,
                                          sched::on_event<BounceEvent>()));
        pipeline.add_render([](ecs::World& w) { RenderSystem::Draw(w); });
    }
};
