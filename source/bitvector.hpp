#pragma once

#include "number/numeric.hpp"
#include "util.hpp"
#include <array>
#include <optional>


template <u32 bits> class Bitvector {
public:
    constexpr Bitvector() : data_({})
    {
    }

    constexpr u32 size() const
    {
        return bits;
    }

    constexpr void set(u32 index, bool value)
    {
        auto& byte = data_[index / 8];
        const auto bit = index % 8;

        if (value) {
            byte = byte | (1 << bit);
        } else {
            byte &= ~(1 << bit);
        }
    }

    constexpr bool get(u32 index) const
    {
        auto& byte = data_[index / 8];
        const auto bit = index % 8;
        const u8 mask = (1 << bit);
        return byte & mask;
    }

    constexpr bool operator[](u32 index) const
    {
        return get(index);
    }

    constexpr void clear()
    {
        for (u8& byte : data_) {
            byte = 0;
        }
    }

    // Lowest index whose bit is unset, or nullopt if every bit is set. Whole
    // bytes of set bits are skipped before looking at individual bits.
    std::optional<u32> first_clear() const
    {
        for (u32 i = 0; i < data_.size(); ++i) {
            if (data_[i] not_eq 0xff) {
                const u32 index = i * 8 + trailing_ones(data_[i]);
                if (index < bits) {
                    return index;
                }
                return {};
            }
        }
        return {};
    }

    u32 count() const
    {
        u32 result = 0;
        for (u32 i = 0; i < bits; ++i) {
            if (get(i)) {
                ++result;
            }
        }
        return result;
    }

    bool any() const
    {
        for (u8 byte : data_) {
            if (byte) {
                return true;
            }
        }
        return false;
    }

private:
    std::array<u8, (bits / 8) + ((bits % 8) ? 1 : 0)> data_;
};
