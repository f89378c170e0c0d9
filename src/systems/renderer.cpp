#include "renderer.hpp"
#include "../components.hpp"
#include "../fixed_timestep.hpp"
#include "../state.hpp"
#include <raylib.h>
#include <cstdio>

using namespace ecs;

static constexpr float kFlashSeconds = 0.12f;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

void RenderSystem::BounceFlashUpdate(World& world) {
    if (auto* flash = world.try_resource<BounceFlash>()) {
        flash->remaining = kFlashSeconds;
    } else {
        world.set_resource(BounceFlash{kFlashSeconds});
    }
}

void RenderSystem::Draw(World& world) {
    const float frame_dt = world.try_resource<sched::FrameTime>()
                               ? world.resource<sched::FrameTime>().dt() : 0.0f;

    Color background = {30, 30, 36, 255};
    if (auto* flash = world.try_resource<BounceFlash>()) {
        if (flash->remaining > 0.0f) {
            background = {48, 40, 36, 255};
            flash->remaining -= frame_dt;
        }
    }

    BeginDrawing();
    ClearBackground(background);

    // 1. Balls
    world.each<Ball>([&](Entity, Ball& b) {
        DrawCircleV({b.x, b.y}, b.radius, to_raylib(b.color));
    });

    // 2. HUD
    const AppState* state = sched::current_state<AppState>(world);
    const char*     state_name = state ? to_string(*state) : "-";

    char line[128];
    DrawFPS(10, 10);
    std::snprintf(line, sizeof(line), "STATE: %s", state_name);
    DrawText(line, 10, 34, 20, RAYWHITE);

    if (auto* stats = world.try_resource<SessionStats>()) {
        std::snprintf(line, sizeof(line), "sim ticks %llu | bounces %llu | games %u",
                      static_cast<unsigned long long>(stats->sim_ticks),
                      static_cast<unsigned long long>(stats->bounces),
                      stats->games_started);
        DrawText(line, 10, 58, 16, LIGHTGRAY);
    }

    if (auto* timesteps = world.try_resource<sched::FixedTimesteps>()) {
        int y = 80;
        for (const auto& [label, entry] : timesteps->entries) {
            const double overstep = entry.step.count() > 0
                ? static_cast<double>(entry.accumulated.count()) / entry.step.count() : 0.0;
            std::snprintf(line, sizeof(line), "[%s] step %.2f ms | overstep %.2f%s",
                          label.c_str(),
                          std::chrono::duration<double, std::milli>(entry.step).count(),
                          overstep, entry.paused ? " | PAUSED" : "");
            DrawText(line, 10, y, 16, entry.paused ? ORANGE : SKYBLUE);
            y += 20;
        }
    }

    if (state) {
        switch (*state) {
            case AppState::Menu:
                DrawText("ENTER / SPACE: Start", 10, 140, 20, YELLOW);
                break;
            case AppState::Playing:
                DrawText("P: Pause | B: Spawn Ball | M: Menu", 10, 140, 20, YELLOW);
                break;
            case AppState::Paused:
                DrawText("PAUSED  -  P / ENTER: Resume | M: Menu", 10, 140, 20, ORANGE);
                break;
        }
    }

    EndDrawing();
}
