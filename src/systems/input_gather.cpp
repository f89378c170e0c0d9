#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    input.confirm = IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_SPACE);
    input.pause   = IsKeyPressed(KEY_P);
    input.back    = IsKeyPressed(KEY_M) || IsKeyPressed(KEY_BACKSPACE);
    input.spawn   = IsKeyPressed(KEY_B);
}
