#include "fixed_timestep.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace sched {

// ---------------------------------------------------------------------------
// FixedTimestepAccumulator
// ---------------------------------------------------------------------------

FixedTimestepAccumulator::FixedTimestepAccumulator(Duration step) : step_(step) {
    if (step_ <= Duration::zero()) {
        throw std::invalid_argument("FixedTimestepAccumulator: step must be positive");
    }
}

void FixedTimestepAccumulator::accumulate(Duration delta) {
    if (delta < Duration::zero()) {
        throw std::invalid_argument("FixedTimestepAccumulator: negative time delta");
    }
    accumulated_ += delta;
}

std::uint64_t FixedTimestepAccumulator::pending_ticks() const {
    return static_cast<std::uint64_t>(accumulated_ / step_);
}

bool FixedTimestepAccumulator::consume_tick() {
    if (accumulated_ < step_) return false;
    accumulated_ -= step_;
    return true;
}

void FixedTimestepAccumulator::drop_ticks(std::uint64_t n) {
    const std::uint64_t available = pending_ticks();
    if (n > available) n = available;
    accumulated_ -= step_ * static_cast<Duration::rep>(n);
}

double FixedTimestepAccumulator::overstep_fraction() const {
    return static_cast<double>(accumulated_.count()) / static_cast<double>(step_.count());
}

// ---------------------------------------------------------------------------
// FixedTimesteps
// ---------------------------------------------------------------------------

FixedTimesteps::Entry* FixedTimesteps::find(const std::string& label) {
    auto it = entries.find(label);
    return it == entries.end() ? nullptr : &it->second;
}

const FixedTimesteps::Entry* FixedTimesteps::find(const std::string& label) const {
    auto it = entries.find(label);
    return it == entries.end() ? nullptr : &it->second;
}

bool FixedTimesteps::is_paused(const std::string& label) const {
    const auto* e = find(label);
    return e && e->paused;
}

FixedTimesteps& timesteps(ecs::World& world) {
    if (!world.try_resource<FixedTimesteps>()) world.set_resource(FixedTimesteps{});
    return world.resource<FixedTimesteps>();
}

static FixedTimesteps::Entry& timestep_entry(ecs::World& world, const std::string& label) {
    return timesteps(world).entries[label];
}

static void publish_info(ecs::World& world, const FixedTimestepInfo& info) {
    if (auto* current = world.try_resource<FixedTimestepInfo>()) {
        *current = info;
    } else {
        world.set_resource(info);
    }
}

// Publishes per-tick info and, on scope exit (exceptions included), puts back
// the enclosing runner's info or marks the last tick as finished.
namespace {
class TickScope {
public:
    explicit TickScope(ecs::World& world) : world_(world) {
        if (const auto* prev = world.try_resource<FixedTimestepInfo>()) enclosing_ = *prev;
    }
    ~TickScope() {
        if (!published_) return;
        if (enclosing_) {
            publish_info(world_, *enclosing_);
        } else if (auto* current = world_.try_resource<FixedTimestepInfo>()) {
            current->in_tick = false;
        }
    }
    TickScope(const TickScope&) = delete;
    TickScope& operator=(const TickScope&) = delete;

    void publish(const FixedTimestepInfo& info) {
        publish_info(world_, info);
        published_ = true;
    }

private:
    ecs::World&                      world_;
    std::optional<FixedTimestepInfo> enclosing_;
    bool                             published_ = false;
};
} // namespace

// ---------------------------------------------------------------------------
// FixedTimestepRunner
// ---------------------------------------------------------------------------

FixedTimestepRunner::Builder::Builder(Duration step) : acc_(step) {}

FixedTimestepRunner::Builder& FixedTimestepRunner::Builder::with_label(std::string label) {
    label_ = std::move(label);
    return *this;
}

FixedTimestepRunner::Builder& FixedTimestepRunner::Builder::with_stage(Stage stage) {
    stages_.push_back(std::move(stage));
    return *this;
}

FixedTimestepRunner::Builder& FixedTimestepRunner::Builder::with_system(System system) {
    stages_.push_back(Stage(std::vector<System>{std::move(system)}));
    return *this;
}

FixedTimestepRunner::Builder& FixedTimestepRunner::Builder::max_ticks_per_advance(std::uint64_t n) {
    max_ticks_ = n;
    return *this;
}

FixedTimestepRunner FixedTimestepRunner::Builder::build() && {
    return FixedTimestepRunner(acc_, std::move(label_), std::move(stages_), max_ticks_);
}

FixedTimestepRunner::FixedTimestepRunner(FixedTimestepAccumulator acc, std::string label,
                                         std::vector<Stage> stages, std::uint64_t max_ticks)
    : acc_(acc), label_(std::move(label)), stages_(std::move(stages)), max_ticks_(max_ticks) {}

std::uint64_t FixedTimestepRunner::advance(Duration delta, ecs::World& world) {
    if (!label_.empty()) {
        auto& entry = timestep_entry(world, label_);
        entry.step = acc_.step();
        if (entry.paused) return 0;
    }

    acc_.accumulate(delta);

    // Computed once. Ticks that run slower than wall time do not extend it.
    std::uint64_t ticks = acc_.pending_ticks();
    if (max_ticks_ != 0 && ticks > max_ticks_) {
        acc_.drop_ticks(ticks - max_ticks_);
        ticks = max_ticks_;
    }

    {
        TickScope scope(world);
        for (std::uint64_t i = 0; i < ticks; ++i) {
            if (!acc_.consume_tick()) break;
            scope.publish(FixedTimestepInfo{label_, acc_.step(), acc_.accumulated(), i, ticks, true});
            for (const auto& stage : stages_) stage.run(world);
        }
    }

    if (!label_.empty()) {
        auto& entry = timestep_entry(world, label_);
        entry.accumulated  = acc_.accumulated();
        entry.total_ticks += ticks;
    }
    return ticks;
}

System FixedTimestepRunner::into_system() && {
    auto shared = std::make_shared<FixedTimestepRunner>(std::move(*this));
    return [shared](ecs::World& w) {
        const auto* info = w.try_resource<FixedTimestepInfo>();
        if (info && info->in_tick) {
            shared->advance(info->step, w);
            return;
        }
        const auto* frame = w.try_resource<FrameTime>();
        shared->advance(frame ? frame->delta : Duration::zero(), w);
    };
}

} // namespace sched
