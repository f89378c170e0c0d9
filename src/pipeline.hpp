#pragma once
#include "fixed_timestep.hpp"
#include "stage.hpp"
#include <ecs/ecs.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sched {

/**
 * @brief Host frame driver: groups systems by execution phase.
 * @details One update() runs, in order:
 *   1. Pre-Update: input, event flush
 *   2. Logic: gameplay systems, state machines
 *   3. Fixed: every fixed-timestep runner, advanced by the frame delta
 * render() runs the Render phase separately so the caller can place it
 * between BeginDrawing()/EndDrawing().
 *
 * Deferred commands are flushed after each phase.
 */
class Pipeline {
public:
    void add_pre_update(System sys) { pre_update_.add_system(std::move(sys)); }
    void add_logic(System sys)      { logic_.add_system(std::move(sys)); }
    void add_render(System sys)     { render_.add_system(std::move(sys)); }

    void add_fixed(FixedTimestepRunner runner) { fixed_.push_back(std::move(runner)); }

    // Frame deltas above `max` are clamped before they reach any runner.
    void set_max_frame_delta(std::optional<Duration> max) { max_frame_delta_ = max; }

    /**
     * @brief Executes the per-frame update flow.
     * @details Publishes the (clamped) delta as the FrameTime resource first.
     */
    void update(ecs::World& world, Duration delta) {
        if (max_frame_delta_ && delta > *max_frame_delta_) delta = *max_frame_delta_;

        if (auto* ft = world.try_resource<FrameTime>()) {
            ft->delta = delta;
            ++ft->frame;
        } else {
            world.set_resource(FrameTime{delta, 0});
        }

        pre_update_.run(world);
        logic_.run(world);
        for (auto& runner : fixed_) runner.advance(delta, world);
        world.deferred().flush(world);
    }

    void render(ecs::World& world) { render_.run(world); }

    FixedTimestepRunner* fixed(const std::string& label) {
        for (auto& runner : fixed_) {
            if (runner.label() == label) return &runner;
        }
        return nullptr;
    }

private:
    Stage                            pre_update_;
    Stage                            logic_;
    std::vector<FixedTimestepRunner> fixed_;
    Stage                            render_;
    std::optional<Duration>          max_frame_delta_;
};

} // namespace sched
