#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace sched {

// ---------------------------------------------------------------------------
// Units of work
//
// System: run for its side effects on the world.
// Condition: run for its boolean result; side-effect free by convention.
// ---------------------------------------------------------------------------

using System    = std::function<void(ecs::World&)>;
using Condition = std::function<bool(ecs::World&)>;

/**
 * @brief An ordered sub-pipeline of systems.
 * @details Systems run in insertion order. Deferred world commands are flushed
 * once the last system has returned, so the next stage sees every structural
 * change made by this one.
 */
class Stage {
public:
    Stage() = default;
    explicit Stage(std::vector<System> systems) : systems_(std::move(systems)) {}

    Stage& add_system(System system) {
        systems_.push_back(std::move(system));
        return *this;
    }

    void run(ecs::World& world) const {
        for (const auto& sys : systems_) sys(world);
        world.deferred().flush(world);
    }

    bool        empty() const { return systems_.empty(); }
    std::size_t size()  const { return systems_.size(); }

    // Wraps the stage as a single opaque system.
    System into_system() && {
        auto shared = std::make_shared<const Stage>(std::move(*this));
        return [shared](ecs::World& w) { shared->run(w); };
    }

private:
    std::vector<System> systems_;
};

} // namespace sched
