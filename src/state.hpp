#pragma once
#include "events.hpp"
#include "stage.hpp"
#include <ecs/ecs.hpp>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace sched {

// ---------------------------------------------------------------------------
// State resources
//
// CurrentState<S>: active value. Absent until the machine for S first runs.
// NextState<S>: pending request. An empty optional (or a missing
// resource) means nothing is pending.
// ---------------------------------------------------------------------------

template<typename S>
struct CurrentState {
    S value;
};

template<typename S>
struct NextState {
    std::optional<S> value;
};

// Emitted into Events<StateTransition<S>> when that queue is registered.
// `from` is empty for the initial transition.
template<typename S>
struct StateTransition {
    std::optional<S> from;
    S                to;
};

// Queues a transition to `value`. A later request in the same frame replaces
// an earlier one.
template<typename S>
void request_state(ecs::World& world, S value) {
    if (auto* next = world.try_resource<NextState<S>>()) {
        next->value = std::move(value);
    } else {
        world.set_resource(NextState<S>{std::move(value)});
    }
}

// Overwrites CurrentState<S> directly. No enter or exit stage runs.
template<typename S>
void force_state(ecs::World& world, S value) {
    if (auto* current = world.try_resource<CurrentState<S>>()) {
        current->value = std::move(value);
    } else {
        world.set_resource(CurrentState<S>{std::move(value)});
    }
}

template<typename S>
const S* current_state(ecs::World& world) {
    const auto* current = world.try_resource<CurrentState<S>>();
    return current ? &current->value : nullptr;
}

/**
 * @brief Drives transitions of CurrentState<S> from NextState<S> requests.
 * @details One call to run():
 *   1. On the first call (no CurrentState<S> yet) inserts the initial value and
 *      runs its enter stages. No exit stage runs.
 *   2. While NextState<S> holds a value: take it; if it equals the current
 *      value do nothing; otherwise run exit(previous), assign, run
 *      enter(target).
 * Requests made from inside enter/exit stages cascade within the same call.
 * The current value is assigned before the enter stages run, so it stays
 * updated if one of them throws.
 */
template<typename S>
class StateTransitionMachine {
    struct Hooks {
        std::vector<Stage> enter;
        std::vector<Stage> exit;
    };

public:
    enum class Status { Uninitialized, Settled };

    class Builder {
    public:
        explicit Builder(S initial) : initial_(std::move(initial)) {}

        Builder& on_enter(const S& state, Stage stage) {
            hooks_[state].enter.push_back(std::move(stage));
            return *this;
        }
        Builder& on_exit(const S& state, Stage stage) {
            hooks_[state].exit.push_back(std::move(stage));
            return *this;
        }
        Builder& on_enter(const S& state, System system) {
            return on_enter(state, Stage(std::vector<System>{std::move(system)}));
        }
        Builder& on_exit(const S& state, System system) {
            return on_exit(state, Stage(std::vector<System>{std::move(system)}));
        }

        // 0 = unbounded. When the cap is reached a still-pending request is
        // left in NextState<S> for the next call.
        Builder& max_transitions_per_run(std::size_t n) {
            max_transitions_ = n;
            return *this;
        }

        StateTransitionMachine build() && {
            return StateTransitionMachine(std::move(initial_), std::move(hooks_), max_transitions_);
        }

    private:
        S                   initial_;
        std::map<S, Hooks>  hooks_;
        std::size_t         max_transitions_ = 0;
    };

    // Returns the number of transitions performed, the initial one included.
    std::size_t run(ecs::World& world) {
        std::size_t transitions = 0;

        if (!world.try_resource<CurrentState<S>>()) {
            world.set_resource(CurrentState<S>{initial_});
            status_ = Status::Settled;
            ++transitions;
            emit(world, std::nullopt, initial_);
            run_hooks(initial_, &Hooks::enter, world);
        }
        status_ = Status::Settled;

        std::size_t changes = 0;
        for (;;) {
            auto* next = world.try_resource<NextState<S>>();
            if (!next || !next->value) break;
            if (max_transitions_ != 0 && changes == max_transitions_) break;

            S target = std::move(*next->value);
            next->value.reset();

            S previous = world.resource<CurrentState<S>>().value;
            if (target == previous) continue;

            run_hooks(previous, &Hooks::exit, world);
            world.resource<CurrentState<S>>().value = target;
            ++changes;
            emit(world, previous, target);
            run_hooks(target, &Hooks::enter, world);
        }
        return transitions + changes;
    }

    Status   status()  const { return status_; }
    const S& initial() const { return initial_; }

    // Wraps the machine as a single opaque system that owns it.
    System into_system() && {
        auto shared = std::make_shared<StateTransitionMachine>(std::move(*this));
        return [shared](ecs::World& w) { shared->run(w); };
    }

private:
    StateTransitionMachine(S initial, std::map<S, Hooks> hooks, std::size_t max_transitions)
        : initial_(std::move(initial)), hooks_(std::move(hooks)), max_transitions_(max_transitions) {}

    static void emit(ecs::World& world, std::optional<S> from, const S& to) {
        if (auto* q = world.try_resource<Events<StateTransition<S>>>()) {
            q->send(StateTransition<S>{std::move(from), to});
        }
    }

    void run_hooks(const S& state, std::vector<Stage> Hooks::*which, ecs::World& world) const {
        auto it = hooks_.find(state);
        if (it == hooks_.end()) return;
        for (const auto& stage : it->second.*which) stage.run(world);
    }

    S                  initial_;
    std::map<S, Hooks> hooks_;
    std::size_t        max_transitions_ = 0;
    Status             status_          = Status::Uninitialized;
};

} // namespace sched
