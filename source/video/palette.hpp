#pragma once

#include "color.hpp"
#include "syncGate.hpp"
#include <array>


// Palette ram holds 256 background colors followed by 256 object colors. In
// 4bpp mode each half is split into sixteen banks of sixteen colors.


constexpr u32 palette_colors = 256;
constexpr u32 palette_bank_colors = 16;


using Palette16 = std::array<Color, palette_bank_colors>;


// Writes colors to the background palette, from index zero. Returns the number
// of colors written, truncated at 256.
u32 load_palette(const Color* colors, u32 count, const VBlank& vblank);

// Writes colors to the object palette, from index offset. Returns the number
// of colors written: nothing past the end of the palette is touched, and an
// offset beyond the end writes nothing.
u32 load_object_palette(u32 offset,
                        const Color* colors,
                        u32 count,
                        const VBlank& vblank);

bool load_palette_bank(u8 bank, const Palette16& colors, const VBlank& vblank);

bool load_object_palette_bank(u8 bank,
                              const Palette16& colors,
                              const VBlank& vblank);

Color read_palette(u32 index);

Color read_object_palette(u32 index);
