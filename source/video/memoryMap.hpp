#pragma once

#include "volatile.hpp"


// Io register layout and display timing of the console. Video memory regions
// are described next to the code that writes them.


namespace hw {


using DispCnt = MemoryAddress<Region::io, 0x00, u16>;
using DispStat = MemoryAddress<Region::io, 0x04, u16>;
using VCount = MemoryAddress<Region::io, 0x06, u16>;

// BG0CNT through BG3CNT.
using BgCnt = MemoryAddress<Region::io, 0x08, u16, 4>;

// Horizontal and vertical scroll, interleaved: BG0HOFS, BG0VOFS, BG1HOFS...
using BgOffset = MemoryAddress<Region::io, 0x10, u16, 8>;

// PA, PB, PC, PD for BG2 and BG3, followed by the reference point.
using Bg2Transform = MemoryAddress<Region::io, 0x20, s16, 4>;
using Bg2Reference = MemoryAddress<Region::io, 0x28, s32, 2>;
using Bg3Transform = MemoryAddress<Region::io, 0x30, s16, 4>;
using Bg3Reference = MemoryAddress<Region::io, 0x38, s32, 2>;

using KeyInput = MemoryAddress<Region::io, 0x130, u16>;


namespace dispcnt {
constexpr u16 mode_mask = 0x0007;
constexpr u16 obj_1d_mapping = 1 << 6;
constexpr u16 forced_blank = 1 << 7;
constexpr u16 bg0_enable = 1 << 8;
constexpr u16 obj_enable = 1 << 12;
} // namespace dispcnt


namespace dispstat {
constexpr u16 vblank = 1 << 0;
constexpr u16 hblank = 1 << 1;
constexpr u16 vcount_match = 1 << 2;
constexpr u16 vblank_irq = 1 << 3;
constexpr u16 status_mask = vblank | hblank | vcount_match;
} // namespace dispstat


constexpr u16 screen_width = 240;
constexpr u16 screen_height = 160;

constexpr u16 visible_lines = 160;
constexpr u16 lines_per_frame = 228;
constexpr u16 cycles_per_line = 1232;
constexpr u16 hblank_start_cycle = 960;
constexpr u32 cycles_per_frame = u32(cycles_per_line) * lines_per_frame;


} // namespace hw
