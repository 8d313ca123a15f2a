#pragma once

#include "function.hpp"
#include "video/memoryMap.hpp"


// Host side stand-in for the console's display hardware. Owns a backing arena
// for each memory mapped region, and keeps VCOUNT and the DISPSTAT status bits
// in step with a simulated scan position, using the console's timing: 1232
// cycles per line with horizontal blank starting at cycle 960, 228 lines per
// frame with vertical blank starting at line 160.
//
// The scan position only moves when the display is advanced, either
// explicitly, or via poll(), which the platform calls from busy-wait loops.
class SimulatedDisplay {
public:
    // Returns a number of elapsed cycles. Called once per poll().
    using CycleSource = Function<16, u32()>;

    // The most a single poll() may advance. One cycle short of the hblank
    // window, so that busy waits can observe every hblank and every vblank.
    static constexpr u32 max_step =
        hw::cycles_per_line - hw::hblank_start_cycle - 1;

    static SimulatedDisplay& instance();

    u8* region(Region region);

    // Zeroes every region, releases all keys, and rewinds to cycle zero of
    // line zero.
    void reset();

    void advance(u32 cycles);

    // Advances by the cycle source's count, or by the fixed step when no
    // source is installed. Either is capped at max_step.
    void poll();

    // Returns the step in effect, which is cycles clamped to [1, max_step].
    u32 set_step(u32 cycles);

    u32 step() const
    {
        return step_;
    }

    void set_cycle_source(CycleSource source)
    {
        source_ = std::move(source);
    }

    void clear_cycle_source()
    {
        source_.reset();
    }

    void seek(u16 line, u16 cycle);

    u16 line() const
    {
        return line_;
    }

    u16 cycle() const
    {
        return cycle_;
    }

    u32 frame() const
    {
        return frame_;
    }

    // Keys are active low on the hardware. The mask passed here uses one bit
    // per pressed key, in KEYINPUT order.
    void set_pressed_keys(u16 mask);

private:
    SimulatedDisplay();

    static constexpr u32 dispstat_offset = 0x04;
    static constexpr u32 vcount_offset = 0x06;
    static constexpr u32 keyinput_offset = 0x130;

    u16 read_register(u32 offset) const;
    void write_register(u32 offset, u16 value);

    void publish();

    alignas(4) std::array<u8, region_size(Region::io)> io_;
    alignas(4) std::array<u8, region_size(Region::palette)> palette_;
    alignas(4) std::array<u8, region_size(Region::vram)> vram_;
    alignas(4) std::array<u8, region_size(Region::oam)> oam_;

    CycleSource source_;
    u32 step_ = 64;
    u16 line_ = 0;
    u16 cycle_ = 0;
    u32 frame_ = 0;
};
