#include "app_flow.hpp"
#include "../state.hpp"

std::optional<AppState> AppFlowSystem::next_state(AppState current, const InputRecord& input) {
    switch (current) {
        case AppState::Menu:
            if (input.confirm) return AppState::Playing;
            break;
        case AppState::Playing:
            if (input.back)  return AppState::Menu;
            if (input.pause) return AppState::Paused;
            break;
        case AppState::Paused:
            if (input.back)                  return AppState::Menu;
            if (input.pause || input.confirm) return AppState::Playing;
            break;
    }
    return std::nullopt;
}

static void request_from_input(ecs::World& world, AppState current) {
    const auto* input = world.try_resource<InputRecord>();
    if (!input) return;
    if (auto next = AppFlowSystem::next_state(current, *input)) {
        sched::request_state(world, *next);
    }
}

void AppFlowSystem::MenuUpdate(ecs::World& world)    { request_from_input(world, AppState::Menu); }
void AppFlowSystem::PlayingUpdate(ecs::World& world) { request_from_input(world, AppState::Playing); }
void AppFlowSystem::PausedUpdate(ecs::World& world)  { request_from_input(world, AppState::Paused); }
