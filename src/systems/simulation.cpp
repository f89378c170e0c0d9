#include "simulation.hpp"
#include "../events.hpp"
#include "../fixed_timestep.hpp"

using namespace ecs;

bool BallSimulationSystem::step_ball(Ball& ball, float dt, const Arena& arena) {
    ball.vy += arena.gravity * dt;
    ball.x  += ball.vx * dt;
    ball.y  += ball.vy * dt;

    // Side walls
    if (ball.x - ball.radius < 0.0f) {
        ball.x  = ball.radius;
        ball.vx = -ball.vx;
    } else if (ball.x + ball.radius > arena.width) {
        ball.x  = arena.width - ball.radius;
        ball.vx = -ball.vx;
    }

    // Floor
    if (ball.y + ball.radius > arena.height && ball.vy > 0.0f) {
        ball.y  = arena.height - ball.radius;
        ball.vy = -ball.vy * kRestitution;
        return true;
    }
    return false;
}

void BallSimulationSystem::Update(World& world) {
    const auto* info = world.try_resource<sched::FixedTimestepInfo>();
    if (!info || !info->in_tick) return;
    const float dt = info->dt();

    const Arena arena = world.try_resource<Arena>() ? world.resource<Arena>() : Arena{};
    auto* bounces = world.try_resource<sched::Events<BounceEvent>>();

    std::uint64_t bounced = 0;
    world.each<Ball>([&](Entity e, Ball& ball) {
        if (!step_ball(ball, dt, arena)) return;
        ++bounced;
        if (bounces) bounces->send(BounceEvent{e, -ball.vy});
    });

    if (auto* stats = world.try_resource<SessionStats>()) {
        stats->sim_ticks++;
        stats->bounces += bounced;
    }
}
