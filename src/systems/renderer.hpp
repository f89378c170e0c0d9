#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem: draws the arena and the HUD.
//
// Draw() owns BeginDrawing()/EndDrawing(). BounceFlash() is gated on
// on_event<BounceEvent>() and only marks the frame; Draw() consumes the mark.
// ---------------------------------------------------------------------------

struct BounceFlash {
    float remaining = 0.0f; // seconds
};

class RenderSystem {
public:
    static void BounceFlashUpdate(ecs::World& world);
    static void Draw(ecs::World& world);
};
