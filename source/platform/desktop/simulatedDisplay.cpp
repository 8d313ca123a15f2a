#include "simulatedDisplay.hpp"
#include <algorithm>
#include <cstring>


SimulatedDisplay& SimulatedDisplay::instance()
{
    static SimulatedDisplay inst;
    return inst;
}


SimulatedDisplay::SimulatedDisplay()
{
    reset();
}


u8* SimulatedDisplay::region(Region region)
{
    switch (region) {
    case Region::io:
        return io_.data();

    case Region::palette:
        return palette_.data();

    case Region::vram:
        return vram_.data();

    case Region::oam:
        return oam_.data();
    }
    return nullptr;
}


void SimulatedDisplay::reset()
{
    io_.fill(0);
    palette_.fill(0);
    vram_.fill(0);
    oam_.fill(0);

    line_ = 0;
    cycle_ = 0;
    frame_ = 0;

    set_pressed_keys(0);
    publish();
}


void SimulatedDisplay::advance(u32 cycles)
{
    frame_ += cycles / hw::cycles_per_frame;
    cycles %= hw::cycles_per_frame;

    u32 position = u32(line_) * hw::cycles_per_line + cycle_ + cycles;

    frame_ += position / hw::cycles_per_frame;
    position %= hw::cycles_per_frame;

    line_ = position / hw::cycles_per_line;
    cycle_ = position % hw::cycles_per_line;

    publish();
}


void SimulatedDisplay::poll()
{
    if (source_) {
        advance(std::min(source_(), max_step));
    } else {
        advance(step_);
    }
}


u32 SimulatedDisplay::set_step(u32 cycles)
{
    step_ = std::clamp(cycles, u32(1), max_step);
    return step_;
}


void SimulatedDisplay::seek(u16 line, u16 cycle)
{
    line_ = line % hw::lines_per_frame;
    cycle_ = cycle % hw::cycles_per_line;
    publish();
}


void SimulatedDisplay::set_pressed_keys(u16 mask)
{
    write_register(keyinput_offset, u16(~mask & 0x03ff));
}


// The arena is accessed directly here rather than through MemoryAddress, the
// latter resolves its base via instance(), which may still be under
// construction.
u16 SimulatedDisplay::read_register(u32 offset) const
{
    u16 value;
    std::memcpy(&value, io_.data() + offset, sizeof value);
    return value;
}


void SimulatedDisplay::write_register(u32 offset, u16 value)
{
    std::memcpy(io_.data() + offset, &value, sizeof value);
}


void SimulatedDisplay::publish()
{
    write_register(vcount_offset, line_);

    // Software owns the upper bits (irq enables, vcount setting), the display
    // owns the status flags.
    u16 status =
        read_register(dispstat_offset) & ~hw::dispstat::status_mask;

    // The vblank flag drops on the last line of the frame.
    if (line_ >= hw::visible_lines and line_ < hw::lines_per_frame - 1) {
        status |= hw::dispstat::vblank;
    }

    if (cycle_ >= hw::hblank_start_cycle) {
        status |= hw::dispstat::hblank;
    }

    if (line_ == (status >> 8)) {
        status |= hw::dispstat::vcount_match;
    }

    write_register(dispstat_offset, status);
}
