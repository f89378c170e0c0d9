#include "conditional.hpp"
#include <memory>
#include <utility>

namespace sched {

Condition negate(Condition condition) {
    return [c = std::move(condition)](ecs::World& w) { return !c(w); };
}

ConditionalRunner::ConditionalRunner(System system, std::vector<Condition> conditions)
    : system_(std::move(system)), conditions_(std::move(conditions)) {}

ConditionalRunner ConditionalRunner::Builder::build() && {
    return ConditionalRunner(std::move(system_), std::move(conditions_));
}

RunResult ConditionalRunner::run(ecs::World& world) const {
    for (const auto& condition : conditions_) {
        if (!condition(world)) return RunResult::Skipped;
    }
    system_(world);
    return RunResult::Ran;
}

System ConditionalRunner::into_system() && {
    auto shared = std::make_shared<const ConditionalRunner>(std::move(*this));
    return [shared](ecs::World& w) { shared->run(w); };
}

System run_if(System system, Condition condition) {
    ConditionalRunner::Builder builder(std::move(system));
    builder.run_if(std::move(condition));
    return std::move(builder).build().into_system();
}

std::vector<System> ConditionSet::into_systems() && {
    std::vector<System> out;
    out.reserve(systems_.size());
    for (auto& sys : systems_) {
        ConditionalRunner::Builder builder(std::move(sys));
        for (const auto& c : conditions_) builder.run_if(c);
        out.push_back(std::move(builder).build().into_system());
    }
    systems_.clear();
    return out;
}

Stage ConditionSet::into_stage() && {
    return Stage(std::move(*this).into_systems());
}

} // namespace sched
