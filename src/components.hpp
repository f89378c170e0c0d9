#pragma once
#include <ecs/ecs.hpp>
#include <cstdint>

// ---------------------------------------------------------------------------
// Demo game data. No raylib dependency: compilable in the headless test
// target.
// ---------------------------------------------------------------------------

enum class AppState { Menu, Playing, Paused };

inline const char* to_string(AppState s) {
    switch (s) {
        case AppState::Menu:    return "Menu";
        case AppState::Playing: return "Playing";
        case AppState::Paused:  return "Paused";
    }
    return "?";
}

struct Color4 {
    float r, g, b, a;
};

namespace Colors {
    constexpr Color4 White  = {1.0f,  1.0f,  1.0f,  1.0f};
    constexpr Color4 Maroon = {0.75f, 0.13f, 0.22f, 1.0f};
    constexpr Color4 Gold   = {1.0f,  0.8f,  0.0f,  1.0f};
    constexpr Color4 Sky    = {0.4f,  0.75f, 1.0f,  1.0f};
}

// Play-field bounds in pixels (World resource).
struct Arena {
    float width   = 1280.0f;
    float height  = 720.0f;
    float gravity = 900.0f; // px/s^2, +y is down
};

// Simulated body. Stepped only by the fixed-timestep simulation stage.
struct Ball {
    float  x = 0.0f, y = 0.0f;
    float  vx = 0.0f, vy = 0.0f;
    float  radius = 12.0f;
    Color4 color = Colors::White;
};

// Entities despawned when the game returns to the menu.
struct ArenaTag {};

// Running totals shown on the HUD (World resource).
struct SessionStats {
    std::uint64_t sim_ticks     = 0;
    std::uint64_t bounces       = 0;
    std::uint32_t games_started = 0;
};

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

// Emitted by BallSimulationSystem when a ball hits the floor.
struct BounceEvent {
    ecs::Entity entity;
    float       speed;
};
