#pragma once
#include "../components.hpp"
#include <ecs/ecs.hpp>

// Integrates Ball motion. Runs only inside the "simulation" fixed timestep
// and reads its dt from FixedTimestepInfo.
class BallSimulationSystem {
public:
    static void Update(ecs::World& world);

    // Pure integration step: no world access. Exposed for unit testing.
    // Returns true if the ball bounced off the floor during this step.
    static bool step_ball(Ball& ball, float dt, const Arena& arena);

    static constexpr float kRestitution = 0.85f;
};
