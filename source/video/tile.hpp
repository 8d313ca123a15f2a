#pragma once

#include "number/numeric.hpp"
#include <array>


enum class ColorMode : u8 {
    // Sixteen colors per tile, chosen by a palette bank.
    bit4,
    // One 256 color palette.
    bit8,
};


// Tile coordinates within a map. Signed, so that drawables may be positioned
// partially off the left or top edge.
using TilePos = Vec2<s16>;
using TileSize = Vec2<u16>;


// A text background map entry.
//
// bits 0-9:   tile index
// bit 10:     horizontal flip
// bit 11:     vertical flip
// bits 12-15: palette bank (4bpp tiles only)
class Tile {
public:
    constexpr Tile() : value_(0)
    {
    }

    constexpr explicit Tile(u16 index) : value_(index & index_mask)
    {
    }

    static constexpr Tile empty()
    {
        return Tile();
    }

    static constexpr Tile from_raw(u16 raw)
    {
        Tile t;
        t.value_ = raw;
        return t;
    }

    constexpr Tile flip_hori() const
    {
        return from_raw(value_ ^ hflip_bit);
    }

    constexpr Tile flip_vert() const
    {
        return from_raw(value_ ^ vflip_bit);
    }

    constexpr Tile with_palette(u8 bank) const
    {
        return from_raw(u16((value_ & ~palette_mask) | ((bank & 0xf) << 12)));
    }

    constexpr u16 index() const
    {
        return value_ & index_mask;
    }

    constexpr bool hflipped() const
    {
        return value_ & hflip_bit;
    }

    constexpr bool vflipped() const
    {
        return value_ & vflip_bit;
    }

    constexpr u8 palette() const
    {
        return value_ >> 12;
    }

    constexpr u16 raw() const
    {
        return value_;
    }

    constexpr bool operator==(const Tile& other) const
    {
        return value_ == other.value_;
    }

    constexpr bool operator not_eq(const Tile& other) const
    {
        return value_ not_eq other.value_;
    }

private:
    static constexpr u16 index_mask = 0x03ff;
    static constexpr u16 hflip_bit = 1 << 10;
    static constexpr u16 vflip_bit = 1 << 11;
    static constexpr u16 palette_mask = 0xf000;

    u16 value_;
};


static_assert(sizeof(Tile) == 2);


// Pixel data for one 8x8 tile. Two pixels per byte in 4bpp mode, one pixel
// per byte in 8bpp mode. Stored as halfwords, the unit in which it is copied
// into vram.
template <ColorMode mode> struct TileBitmap {
    static constexpr u32 halfwords = mode == ColorMode::bit4 ? 16 : 32;

    std::array<u16, halfwords> data_;
};


// Size of a tile bitmap in 32 byte units, the granularity with which object
// attributes address sprite tile memory.
template <ColorMode mode> constexpr u32 tile_units()
{
    return mode == ColorMode::bit4 ? 1 : 2;
}
