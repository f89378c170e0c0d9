#pragma once

// ---------------------------------------------------------------------------
// InputRecord: this frame's edge-triggered actions (World resource).
//
// Written by InputGatherSystem (raylib) in Pre-Update; every other system
// reads only these flags, so game logic stays testable without a window.
// ---------------------------------------------------------------------------

struct InputRecord {
    bool confirm = false; // ENTER / SPACE
    bool pause   = false; // P
    bool back    = false; // M / BACKSPACE
    bool spawn   = false; // B
};
