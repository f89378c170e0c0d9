#pragma once
#include "../components.hpp"
#include "../input_state.hpp"
#include <ecs/ecs.hpp>
#include <optional>

// Turns InputRecord actions into NextState<AppState> requests.
// Runs in the Logic phase, before the AppState transition machine.
class AppFlowSystem {
public:
    // One system per state; each is gated with in_state() by StateModule.
    static void MenuUpdate(ecs::World& world);
    static void PlayingUpdate(ecs::World& world);
    static void PausedUpdate(ecs::World& world);

    // Pure transition table: no world access. Exposed for unit testing.
    static std::optional<AppState> next_state(AppState current, const InputRecord& input);
};
