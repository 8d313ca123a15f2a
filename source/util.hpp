#pragma once

#include "number/int.h"

#define COLD [[gnu::cold]]
#define HOT [[gnu::hot]]

#ifdef __GNUC__
#define UNLIKELY(COND) __builtin_expect((COND), false)
#else
#define UNLIKELY(COND) (COND)
#endif


#ifdef __GBA__
#define READ_ONLY_DATA __attribute__((section(".rodata")))
#else
#define READ_ONLY_DATA
#endif


// Number of trailing one bits in a byte. Used for free-slot searches over
// occupancy bitmaps.
inline int trailing_ones(u8 byte)
{
    int count = 0;
    while (byte & 1) {
        byte >>= 1;
        ++count;
    }
    return count;
}
