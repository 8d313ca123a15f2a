#pragma once

#include "number/numeric.hpp"


// A palette entry: 15 bit BGR, five bits per channel, the format stored in
// palette ram.
class Color {
public:
    constexpr Color() : value_(0)
    {
    }

    // Channels are five bit values, 0 through 31.
    constexpr Color(u8 r, u8 g, u8 b)
        : value_(u16((r & 0x1f) | ((g & 0x1f) << 5) | ((b & 0x1f) << 10)))
    {
    }

    // From 24 bit 0xRRGGBB, as written in an image editor.
    static constexpr Color from_hex(u32 rgb)
    {
        return Color(u8(((rgb & 0xFF0000) >> 16) >> 3),
                     u8(((rgb & 0x00FF00) >> 8) >> 3),
                     u8((rgb & 0x0000FF) >> 3));
    }

    static constexpr Color from_bgr_hex_555(u16 val)
    {
        return Color(u8(0x1F & val),
                     u8((0x3E0 & val) >> 5),
                     u8((0x7C00 & val) >> 10));
    }

    constexpr u16 bgr_hex_555() const
    {
        return value_;
    }

    constexpr u8 r() const
    {
        return value_ & 0x1f;
    }

    constexpr u8 g() const
    {
        return (value_ >> 5) & 0x1f;
    }

    constexpr u8 b() const
    {
        return (value_ >> 10) & 0x1f;
    }

    constexpr bool operator==(const Color& other) const
    {
        return value_ == other.value_;
    }

    constexpr bool operator not_eq(const Color& other) const
    {
        return value_ not_eq other.value_;
    }

private:
    u16 value_;
};


static_assert(sizeof(Color) == 2);
