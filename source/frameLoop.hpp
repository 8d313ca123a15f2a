#pragma once

#include "keypad.hpp"
#include "video/object.hpp"
#include "video/syncGate.hpp"


class Platform;


class ConsoleState {
public:
    u32 frame() const
    {
        return frame_;
    }

    // Invokes f on frames where frame % frequency == offset % frequency.
    template <typename F> void every(u32 offset, u32 frequency, F&& f) const
    {
        if (frequency and frame_ % frequency == offset % frequency) {
            f();
        }
    }

    void advance()
    {
        ++frame_;
    }

private:
    u32 frame_ = 0;
};


class FrameClient {
public:
    virtual ~FrameClient()
    {
    }

    // Runs during the visible part of the frame. Must not touch video memory.
    virtual void logic(Platform& pfrm, ConsoleState& state, const Keypad& keys) = 0;

    // Runs at the start of vertical blank.
    virtual void draw(Platform& pfrm,
                      const ConsoleState& state,
                      const VBlank& vblank) = 0;
};


////////////////////////////////////////////////////////////////////////////////
// FrameDriver
//
// One iteration per displayed frame: poll the keypad, run the client's logic,
// wait for vblank, hide released sprites, run the client's draw, then wait for
// the display to start scanning again. Overrunning the blanking window with
// draw work is detected and reported by the sync gate.
//
////////////////////////////////////////////////////////////////////////////////


class FrameDriver {
public:
    FrameDriver(Platform& pfrm, ObjectAllocator& objects);

    // Hides every sprite entry, and returns once the display starts scanning
    // the next frame. Called once before the first frame.
    void start();

    // Runs until frame_limit frames have elapsed, or until the platform stops
    // running when frame_limit is zero. Returns the number of frames run.
    u32 run(FrameClient& client, u32 frame_limit);

    SyncGate& gate()
    {
        return gate_;
    }

    const ConsoleState& state() const
    {
        return state_;
    }

    const Keypad& keypad() const
    {
        return keypad_;
    }

private:
    void step(FrameClient& client);

    Platform& pfrm_;
    ObjectAllocator& objects_;
    SyncGate gate_;
    ConsoleState state_;
    Keypad keypad_;
};
