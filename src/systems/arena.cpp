#include "arena.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include <vector>

using namespace ecs;

void ArenaSystem::spawn_ball(World& world, int index) {
    const Arena* arena = world.try_resource<Arena>();
    const float width  = arena ? arena->width : Arena{}.width;

    Ball ball;
    ball.radius = 10.0f + static_cast<float>(index % 3) * 4.0f;
    ball.x  = width * (0.15f + 0.7f * static_cast<float>((index * 37) % 100) / 100.0f);
    ball.y  = 60.0f + static_cast<float>(index % 4) * 30.0f;
    ball.vx = (index % 2 == 0 ? 1.0f : -1.0f) * (120.0f + 15.0f * static_cast<float>(index % 5));
    ball.vy = 0.0f;
    ball.color = (index % 3 == 0) ? Colors::Gold : (index % 3 == 1) ? Colors::Sky : Colors::Maroon;

    auto ent = world.create();
    world.add(ent, std::move(ball));
    world.add(ent, ArenaTag{});
}

void ArenaSystem::StartSession(World& world) {
    for (int i = 0; i < kInitialBalls; ++i) spawn_ball(world, i);
    if (auto* stats = world.try_resource<SessionStats>()) stats->games_started++;
}

void ArenaSystem::ClearSession(World& world) {
    std::vector<Entity> to_destroy;
    world.each<ArenaTag>([&](Entity e, ArenaTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
}

void ArenaSystem::SpawnOnRequest(World& world) {
    const auto* input = world.try_resource<InputRecord>();
    if (!input || !input->spawn) return;

    int count = 0;
    world.each<Ball>([&](Entity, Ball&) { ++count; });
    spawn_ball(world, count);
}
