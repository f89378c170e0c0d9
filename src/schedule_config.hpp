#pragma once
#include "fixed_timestep.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sched {

// ---------------------------------------------------------------------------
// ScheduleConfig: tunables for the scheduling layer, read from JSON.
//
//   {
//     "max_frame_delta_ms": 250,
//     "max_transitions_per_run": 16,
//     "fixed_timesteps": [
//       { "label": "simulation", "step_ms": 16.666, "max_ticks_per_advance": 8 }
//     ]
//   }
//
// Every key is optional. Missing caps mean "unbounded". Caps are integers;
// timestep labels are unique.
// ---------------------------------------------------------------------------

struct FixedTimestepConfig {
    std::string   label;
    Duration      step                  = std::chrono::milliseconds(16);
    std::uint64_t max_ticks_per_advance = 0;
};

struct ScheduleConfig {
    std::optional<Duration>          max_frame_delta;
    std::size_t                      max_transitions_per_run = 0;
    std::vector<FixedTimestepConfig> fixed_timesteps;

    const FixedTimestepConfig* find_timestep(const std::string& label) const;

    // Builder preloaded with the step, cap and label of `label`, or with
    // `fallback_step` when the label is not configured.
    FixedTimestepRunner::Builder timestep_builder(const std::string& label,
                                                  Duration fallback_step) const;
};

class ScheduleConfigLoader {
public:
    // Returns false if the file cannot be opened, the JSON is malformed or a
    // value is out of range. `out` is left untouched on failure.
    static bool load(const std::string& path, ScheduleConfig& out);

    // Identical to load() without file I/O. Intended for unit testing.
    static bool load_from_string(const std::string& json, ScheduleConfig& out);
};

} // namespace sched
