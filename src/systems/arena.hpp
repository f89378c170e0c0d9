#pragma once
#include <ecs/ecs.hpp>

// Spawns and clears the balls of a game session. Used as enter/exit stages
// of the AppState machine and, for SpawnOnRequest, as a gated Logic system.
class ArenaSystem {
public:
    static constexpr int kInitialBalls = 6;

    // Exit stage of Menu: starts a session with kInitialBalls balls.
    static void StartSession(ecs::World& world);

    // Enter stage of Menu: destroys every ArenaTag entity.
    static void ClearSession(ecs::World& world);

    // Logic system (Playing only): one extra ball per InputRecord::spawn.
    static void SpawnOnRequest(ecs::World& world);

    // Deterministic placement of the i-th ball.
    static void spawn_ball(ecs::World& world, int index);
};
