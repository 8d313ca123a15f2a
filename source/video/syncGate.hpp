#pragma once

#include "number/numeric.hpp"


class Platform;
class SyncGate;


// The scan timing windows of a frame. Visible: the display is reading video
// memory for the current line. Hblank: the tail of each line. Vblank: the
// lines below the bottom of the screen.
enum class Window : u8 { visible, hblank, vblank };


const char* window_name(Window window);


////////////////////////////////////////////////////////////////////////////////
// Blank
//
// Proof that the caller is inside a blanking window. Routines that write to
// memory which is only safe to modify while the display is not reading it take
// one of these by reference, so that such a write cannot be expressed outside
// of a window. Tokens are obtained from SyncGate, and cannot be copied. When a
// token is destroyed, the gate checks that the window is still open, and
// records an overrun if the writes ran past its end.
//
////////////////////////////////////////////////////////////////////////////////


class Blank {
public:
    Blank(const Blank&) = delete;
    Blank& operator=(const Blank&) = delete;

    Blank(Blank&& other) noexcept;

    ~Blank();

    Window window() const
    {
        return window_;
    }

    // Scanline on which the window was granted.
    u16 line() const
    {
        return line_;
    }

protected:
    Blank(SyncGate& gate, Window window, u16 line);

private:
    SyncGate* gate_;
    Window window_;
    u16 line_;
};


class VBlank : public Blank {
public:
    VBlank(VBlank&&) = default;

private:
    VBlank(SyncGate& gate, u16 line);

    friend class SyncGate;
};


class HBlank : public Blank {
public:
    HBlank(HBlank&&) = default;

private:
    HBlank(SyncGate& gate, u16 line);

    friend class SyncGate;
};


////////////////////////////////////////////////////////////////////////////////
// SyncGate
////////////////////////////////////////////////////////////////////////////////


class SyncGate {
public:
    SyncGate(Platform& pfrm);

    SyncGate(const SyncGate&) = delete;

    // Classifies the current scan position. Lines 160 and above are vblank,
    // otherwise the hblank status flag decides between hblank and visible.
    Window current() const;

    // Blocks until the requested window begins. When called from inside the
    // requested window, first waits for it to end, the caller always receives
    // a window from its start.
    void wait_for(Window window);

    VBlank vblank();

    HBlank hblank();

    u32 overrun_count() const
    {
        return overruns_;
    }

    void report_overruns(bool enabled)
    {
        report_overruns_ = enabled;
    }

private:
    friend class Blank;

    u16 scanline() const;

    void close(Window window, u16 line);

    Platform& pfrm_;
    u32 overruns_ = 0;
    bool report_overruns_ = true;
};
