#pragma once
#include <ecs/ecs.hpp>

// Samples raylib keyboard state into the InputRecord resource.
// First Pre-Update step after the event flush.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
