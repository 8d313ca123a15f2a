#include "syncGate.hpp"
#include "conf.hpp"
#include "memoryMap.hpp"
#include "platform/platform.hpp"
#include "util.hpp"


const char* window_name(Window window)
{
    switch (window) {
    case Window::visible:
        return "visible";

    case Window::hblank:
        return "hblank";

    case Window::vblank:
        return "vblank";
    }
    return "";
}


Blank::Blank(SyncGate& gate, Window window, u16 line)
    : gate_(&gate), window_(window), line_(line)
{
}


Blank::Blank(Blank&& other) noexcept
    : gate_(other.gate_), window_(other.window_), line_(other.line_)
{
    other.gate_ = nullptr;
}


Blank::~Blank()
{
    if (gate_) {
        gate_->close(window_, line_);
    }
}


VBlank::VBlank(SyncGate& gate, u16 line) : Blank(gate, Window::vblank, line)
{
}


HBlank::HBlank(SyncGate& gate, u16 line) : Blank(gate, Window::hblank, line)
{
}


SyncGate::SyncGate(Platform& pfrm) : pfrm_(pfrm)
{
    Conf conf(pfrm);
    report_overruns_ = conf.value_or<Conf::Bool>("sync", "report_overruns", true);
}


u16 SyncGate::scanline() const
{
    return hw::VCount::cell().read();
}


Window SyncGate::current() const
{
    if (scanline() >= hw::visible_lines) {
        return Window::vblank;
    }

    if (hw::DispStat::cell().read() & hw::dispstat::hblank) {
        return Window::hblank;
    }

    return Window::visible;
}


void SyncGate::wait_for(Window window)
{
    while (current() == window) {
        pfrm_.poll_scanline();
    }

    if (window == Window::vblank) {
        pfrm_.wait_vblank_interrupt();
    }

    while (current() not_eq window) {
        pfrm_.poll_scanline();
    }
}


VBlank SyncGate::vblank()
{
    wait_for(Window::vblank);
    return VBlank(*this, scanline());
}


HBlank SyncGate::hblank()
{
    wait_for(Window::hblank);
    return HBlank(*this, scanline());
}


void SyncGate::close(Window window, u16 line)
{
    const auto now = current();

    // An hblank is only valid for the line on which it was granted. A vblank
    // that wrapped all the way around into the next frame's vblank cannot be
    // told apart from one that did not.
    const bool overrun = now not_eq window or
                         (window == Window::hblank and scanline() not_eq line);

    if (not UNLIKELY(overrun)) {
        return;
    }

    ++overruns_;

    if (report_overruns_) {
        StringBuffer<80> msg("sync: ");
        msg += window_name(window);
        msg += " overrun, granted on line ";
        msg += to_string<10>(line);
        msg += ", closed on line ";
        msg += to_string<10>(scanline());
        warning(pfrm_, msg.c_str());
    }
}
