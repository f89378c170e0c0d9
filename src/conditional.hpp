#pragma once
#include "stage.hpp"
#include <ecs/ecs.hpp>
#include <vector>

namespace sched {

enum class RunResult { Ran, Skipped };

// Inverts a condition. The wrapped condition still runs.
Condition negate(Condition condition);

/**
 * @brief A system gated by an ordered conjunction of conditions.
 * @details Conditions are evaluated left to right and evaluation stops at the
 * first false one. The system runs iff every condition held (or none were
 * registered). Exceptions from conditions or the system are not caught.
 *
 * Built through ConditionalRunner::Builder; the condition list is frozen once
 * build() returns.
 */
class ConditionalRunner {
public:
    class Builder {
    public:
        explicit Builder(System system) : system_(std::move(system)) {}

        Builder& run_if(Condition condition) {
            conditions_.push_back(std::move(condition));
            return *this;
        }
        Builder& run_if_not(Condition condition) {
            conditions_.push_back(negate(std::move(condition)));
            return *this;
        }

        ConditionalRunner build() &&;

    private:
        System                 system_;
        std::vector<Condition> conditions_;
    };

    RunResult run(ecs::World& world) const;

    std::size_t condition_count() const { return conditions_.size(); }

    // Wraps the runner as a single opaque system so it can be nested.
    System into_system() &&;

private:
    ConditionalRunner(System system, std::vector<Condition> conditions);

    System                 system_;
    std::vector<Condition> conditions_;
};

// Shorthand for a runner with a single condition, already wrapped as a system.
System run_if(System system, Condition condition);

/**
 * @brief Applies one condition list to several systems.
 * @details Every system gets its own ConditionalRunner holding a copy of the
 * conditions, so a condition in the set is evaluated once per system per
 * frame, not once per set.
 */
class ConditionSet {
public:
    ConditionSet& run_if(Condition condition) {
        conditions_.push_back(std::move(condition));
        return *this;
    }
    ConditionSet& run_if_not(Condition condition) {
        conditions_.push_back(negate(std::move(condition)));
        return *this;
    }
    ConditionSet& with_system(System system) {
        systems_.push_back(std::move(system));
        return *this;
    }

    // Produces one gated system per registered system, in registration order.
    std::vector<System> into_systems() &&;

    // Same systems, collected into a single stage.
    Stage into_stage() &&;

private:
    std::vector<Condition> conditions_;
    std::vector<System>    systems_;
};

} // namespace sched
