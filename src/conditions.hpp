#pragma once
#include "conditional.hpp"
#include "events.hpp"
#include "state.hpp"
#include <ecs/ecs.hpp>
#include <utility>

// ---------------------------------------------------------------------------
// Stock conditions
//
// Plain Conditions with no special handling in ConditionalRunner. Every
// comparison helper reports false when the resource it inspects is absent,
// for both the "equals" and the "not equals" form.
// ---------------------------------------------------------------------------

namespace sched {

// True when Events<E> is registered and holds at least one event this frame.
template<typename E>
Condition on_event() {
    return [](ecs::World& w) {
        const auto* q = w.try_resource<Events<E>>();
        return q && !q->empty();
    };
}

template<typename R>
Condition resource_exists() {
    return [](ecs::World& w) { return w.try_resource<R>() != nullptr; };
}

template<typename R>
Condition resource_absent() {
    return [](ecs::World& w) { return w.try_resource<R>() == nullptr; };
}

template<typename R>
Condition resource_equals(R value) {
    return [value = std::move(value)](ecs::World& w) {
        const auto* r = w.try_resource<R>();
        return r && *r == value;
    };
}

template<typename R>
Condition resource_not_equals(R value) {
    return [value = std::move(value)](ecs::World& w) {
        const auto* r = w.try_resource<R>();
        return r && !(*r == value);
    };
}

template<typename S>
Condition in_state(S value) {
    return [value = std::move(value)](ecs::World& w) {
        const auto* current = w.try_resource<CurrentState<S>>();
        return current && current->value == value;
    };
}

template<typename S>
Condition not_in_state(S value) {
    return [value = std::move(value)](ecs::World& w) {
        const auto* current = w.try_resource<CurrentState<S>>();
        return current && !(current->value == value);
    };
}

} // namespace sched
