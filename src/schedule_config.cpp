#include "schedule_config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace sched {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Duration parse_millis(const json& j, const char* what) {
    const double ms = j.get<double>();
    if (!std::isfinite(ms) || ms <= 0.0) {
        throw std::runtime_error(std::string("ScheduleConfig: ") + what + " must be positive");
    }
    // Duration::max() rounds up when widened to double, so equality overflows too.
    static const double kMaxMillis =
        std::chrono::duration<double, std::milli>(Duration::max()).count();
    if (ms >= kMaxMillis) {
        throw std::runtime_error(std::string("ScheduleConfig: ") + what + " is out of range");
    }
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double, std::milli>(ms));
}

static std::uint64_t parse_cap(const json& j, const char* what) {
    if (!j.is_number_integer()) {
        throw std::runtime_error(std::string("ScheduleConfig: ") + what + " must be an integer");
    }
    if (j.is_number_unsigned()) return j.get<std::uint64_t>();
    const auto n = j.get<std::int64_t>();
    if (n < 0) {
        throw std::runtime_error(std::string("ScheduleConfig: ") + what + " must not be negative");
    }
    return static_cast<std::uint64_t>(n);
}

static FixedTimestepConfig parse_timestep(const json& t) {
    FixedTimestepConfig cfg;
    cfg.label = t.value("label", std::string());
    cfg.step  = parse_millis(t.at("step_ms"), "step_ms");
    if (cfg.step <= Duration::zero()) {
        throw std::runtime_error("ScheduleConfig: step_ms rounds to zero");
    }
    if (t.contains("max_ticks_per_advance")) {
        cfg.max_ticks_per_advance = parse_cap(t["max_ticks_per_advance"], "max_ticks_per_advance");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// ScheduleConfig
// ---------------------------------------------------------------------------

const FixedTimestepConfig* ScheduleConfig::find_timestep(const std::string& label) const {
    for (const auto& t : fixed_timesteps) {
        if (t.label == label) return &t;
    }
    return nullptr;
}

FixedTimestepRunner::Builder ScheduleConfig::timestep_builder(const std::string& label,
                                                              Duration fallback_step) const {
    const auto* cfg = find_timestep(label);
    FixedTimestepRunner::Builder builder(cfg ? cfg->step : fallback_step);
    builder.with_label(label);
    if (cfg) builder.max_ticks_per_advance(cfg->max_ticks_per_advance);
    return builder;
}

// ---------------------------------------------------------------------------
// ScheduleConfigLoader
// ---------------------------------------------------------------------------

bool ScheduleConfigLoader::load_from_string(const std::string& json_str, ScheduleConfig& out) {
    try {
        json doc = json::parse(json_str);
        ScheduleConfig cfg;

        if (doc.contains("max_frame_delta_ms")) {
            cfg.max_frame_delta = parse_millis(doc["max_frame_delta_ms"], "max_frame_delta_ms");
        }
        if (doc.contains("max_transitions_per_run")) {
            cfg.max_transitions_per_run = static_cast<std::size_t>(
                parse_cap(doc["max_transitions_per_run"], "max_transitions_per_run"));
        }
        if (doc.contains("fixed_timesteps")) {
            const auto& list = doc.at("fixed_timesteps");
            if (!list.is_array()) {
                throw std::runtime_error("ScheduleConfig: fixed_timesteps must be an array");
            }
            for (const auto& t : list) {
                auto timestep = parse_timestep(t);
                if (cfg.find_timestep(timestep.label)) {
                    throw std::runtime_error("ScheduleConfig: duplicate timestep label '" +
                                             timestep.label + "'");
                }
                cfg.fixed_timesteps.push_back(std::move(timestep));
            }
        }

        out = std::move(cfg);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ScheduleConfigLoader::load(const std::string& path, ScheduleConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out);
}

} // namespace sched
