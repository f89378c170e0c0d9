#include "fixed_timestep.hpp"
#include "pipeline.hpp"
#include "schedule_config.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/render_module.hpp"
#include "modules/simulation_module.hpp"
#include "modules/state_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

static const char* CONFIG_PATH = "resources/schedule.json";

int main() {
  InitWindow(1280, 720, "Frame Scheduling - Bouncing Arena");
  SetExitKey(KEY_ESCAPE);
  SetTargetFPS(60);

  sched::ScheduleConfig config;
  if (!sched::ScheduleConfigLoader::load(CONFIG_PATH, config)) {
    TraceLog(LOG_WARNING, "SCHED: Could not load '%s', using defaults.", CONFIG_PATH);
  }

  ecs::World world;
  sched::Pipeline pipeline;
  pipeline.set_max_frame_delta(config.max_frame_delta);

  // --- Module installation (order is significant) ---
  EventBusModule::install(world, pipeline);                // pre-update: flush
  InputModule::install(world, pipeline);                   // pre-update: input
  StateModule::install(world, pipeline, config);           // logic: flow, machine, log
  SimulationModule::install(world, pipeline, config);      // logic: spawn; fixed: sim
  RenderModule::install(world, pipeline);                  // render

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    pipeline.update(world, sched::from_seconds(GetFrameTime()));
    pipeline.render(world);
  }

  CloseWindow();
  return 0;
}
