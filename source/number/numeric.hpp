#pragma once

#include "int.h"
#include <ciso646> // For MSVC. What an inept excuse for a compiler.


template <typename T> struct Vec2 {
    T x = 0;
    T y = 0;
};


template <typename T> bool operator==(const Vec2<T>& lhs, const Vec2<T>& rhs)
{
    return lhs.x == rhs.x and lhs.y == rhs.y;
}


template <typename T> bool operator not_eq(const Vec2<T>& lhs, const Vec2<T>& rhs)
{
    return not(lhs == rhs);
}


// Signed fixed point value with eight fractional bits, the format used by the
// affine background registers.
using Fixed8 = s32;


constexpr Fixed8 to_fixed8(s32 integer)
{
    return integer * 256;
}
