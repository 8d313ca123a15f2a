#pragma once

#include "platform/desktop/simulatedDisplay.hpp"
#include "platform/platform.hpp"
#include "video/syncGate.hpp"


// Fresh simulated hardware for each test: zeroed memory, the scan position at
// the top of the frame, and no keys pressed.
class console_fixture {
public:
    console_fixture() : display(SimulatedDisplay::instance()), gate(pfrm)
    {
        display.reset();
        display.clear_cycle_source();
        display.set_step(64);
        pfrm.logger().set_threshold(Severity::error);
    }

    ~console_fixture()
    {
        display.clear_cycle_source();
    }

    SimulatedDisplay& display;
    Platform pfrm;
    SyncGate gate;
};
