#pragma once
#include "stage.hpp"
#include <ecs/ecs.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sched {

// Integer nanoseconds: identical inputs give identical tick sequences.
using Duration = std::chrono::nanoseconds;

// Converts a float seconds frame time (raylib GetFrameTime()) to Duration.
inline Duration from_seconds(float seconds) {
    return std::chrono::duration_cast<Duration>(std::chrono::duration<float>(seconds));
}

inline float to_seconds(Duration d) {
    return std::chrono::duration<float>(d).count();
}

/**
 * @brief Converts elapsed time into whole fixed-size ticks.
 * @details `accumulated` only grows through accumulate() and only shrinks by
 * whole steps (consume_tick(), drop_ticks()).
 */
class FixedTimestepAccumulator {
public:
    // Throws std::invalid_argument if step <= 0.
    explicit FixedTimestepAccumulator(Duration step);

    // Throws std::invalid_argument if delta < 0.
    void accumulate(Duration delta);

    // floor(accumulated / step)
    std::uint64_t pending_ticks() const;

    // Removes one step if a whole step is available.
    bool consume_tick();

    // Removes up to n whole steps without running them.
    void drop_ticks(std::uint64_t n);

    void reset() { accumulated_ = Duration::zero(); }

    Duration step()        const { return step_; }
    Duration accumulated() const { return accumulated_; }

    // accumulated / step, in [0, 1) once all pending ticks have run.
    double overstep_fraction() const;

private:
    Duration step_;
    Duration accumulated_ = Duration::zero();
};

// ---------------------------------------------------------------------------
// FixedTimestepInfo: World resource written before every tick.
//
// Systems inside a fixed stage read `step` as their dt. If another runner's
// info was present when advance() started (nesting), it is restored after
// the tick loop; otherwise the last tick's info is left in place with
// `in_tick` cleared.
// ---------------------------------------------------------------------------

struct FixedTimestepInfo {
    std::string   label;
    Duration      step        = Duration::zero();
    Duration      accumulated = Duration::zero();
    std::uint64_t tick        = 0;  // index within the current advance()
    std::uint64_t ticks       = 0;  // ticks scheduled for the current advance()
    bool          in_tick     = false;

    float  dt()       const { return to_seconds(step); }
    double overstep() const {
        return step.count() > 0 ? static_cast<double>(accumulated.count()) / step.count() : 0.0;
    }
};

// ---------------------------------------------------------------------------
// FixedTimesteps: World resource listing every labelled runner.
//
// A labelled runner publishes its step and budget after each advance() and
// checks `paused` before accumulating. Any system may pause or resume a
// timestep through this resource.
// ---------------------------------------------------------------------------

struct FixedTimesteps {
    struct Entry {
        Duration      step        = Duration::zero();
        Duration      accumulated = Duration::zero();
        std::uint64_t total_ticks = 0;
        bool          paused      = false;
    };

    Entry*       find(const std::string& label);
    const Entry* find(const std::string& label) const;

    // Creates the entry if the labelled runner has not advanced yet.
    void pause(const std::string& label)  { entries[label].paused = true; }
    void resume(const std::string& label) { entries[label].paused = false; }
    bool is_paused(const std::string& label) const;

    std::map<std::string, Entry> entries;
};

// Returns the world's FixedTimesteps resource, creating it if needed.
FixedTimesteps& timesteps(ecs::World& world);

/**
 * @brief Runs an ordered list of stages once per accumulated tick.
 * @details advance(delta):
 *   1. accumulated += delta
 *   2. ticks = floor(accumulated / step), computed once
 *   3. ticks times: accumulated -= step, then every stage in order
 * Catch-up is unbounded unless max_ticks_per_advance() was set. An exception
 * from a stage aborts the remaining stages and ticks of that advance().
 */
class FixedTimestepRunner {
public:
    class Builder {
    public:
        // Throws std::invalid_argument if step <= 0.
        explicit Builder(Duration step);

        Builder& with_label(std::string label);
        Builder& with_stage(Stage stage);
        Builder& with_system(System system);

        // 0 = unbounded. When more ticks are pending, the excess whole steps
        // are dropped before n ticks run.
        Builder& max_ticks_per_advance(std::uint64_t n);

        FixedTimestepRunner build() &&;

    private:
        FixedTimestepAccumulator acc_;
        std::string              label_;
        std::vector<Stage>       stages_;
        std::uint64_t            max_ticks_ = 0;
    };

    // Returns the number of ticks executed.
    std::uint64_t advance(Duration delta, ecs::World& world);

    const FixedTimestepAccumulator& accumulator() const { return acc_; }
    const std::string&              label()       const { return label_; }
    std::size_t                     stage_count() const { return stages_.size(); }

    // Wraps the runner as a system. Run from inside another runner's tick it
    // advances by that runner's step; otherwise by the FrameTime delta.
    System into_system() &&;

private:
    FixedTimestepRunner(FixedTimestepAccumulator acc, std::string label,
                        std::vector<Stage> stages, std::uint64_t max_ticks);

    FixedTimestepAccumulator acc_;
    std::string              label_;
    std::vector<Stage>       stages_;
    std::uint64_t            max_ticks_;
};

// ---------------------------------------------------------------------------
// FrameTime: World resource holding this frame's (clamped) delta.
// Written by Pipeline::update() before any phase runs.
// ---------------------------------------------------------------------------

struct FrameTime {
    Duration      delta = Duration::zero();
    std::uint64_t frame = 0;

    float dt() const { return to_seconds(delta); }
};

} // namespace sched
