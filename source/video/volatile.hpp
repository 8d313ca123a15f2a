#pragma once

#include "number/numeric.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <type_traits>


////////////////////////////////////////////////////////////////////////////////
//
// Memory mapped hardware access.
//
// Every access to video memory and to the io registers goes through the types
// in this header. All of the regions sit on a 16 bit bus: byte writes to vram,
// palette ram, or oam are either dropped or duplicated by the hardware, so a
// cell is accessed as a sequence of halfwords, in ascending address order. A
// 32 bit value at a word aligned address is accessed with a single word load
// or store.
//
// Raw integers never turn into cells. Addresses are described by
// MemoryAddress, which checks alignment and bounds at compile time, and whose
// base comes from the platform implementation.
//
////////////////////////////////////////////////////////////////////////////////


enum class Region : u8 { io, palette, vram, oam };


constexpr u32 region_size(Region region)
{
    switch (region) {
    case Region::io:
        return 0x400;

    case Region::palette:
        return 0x400;

    case Region::vram:
        return 0x18000;

    case Region::oam:
        return 0x400;
    }
    return 0;
}


// Defined by the platform implementation.
u8* region_base(Region region);


template <typename T, u32 N, u32 Stride> class VolBlock;
template <typename T, u32 N, u32 Rows, u32 Stride> class VolMatrix;
template <Region region, u32 offset, typename T, u32 count, u32 stride>
class MemoryAddress;


template <typename T> class VolatileCell {
public:
    static_assert(std::is_trivially_copyable<T>(),
                  "cells are copied to and from hardware bit for bit");
    static_assert(sizeof(T) % 2 == 0,
                  "video regions do not support byte sized accesses");

    T read() const
    {
        T result;

        if constexpr (word_access()) {
            const u32 word = *reinterpret_cast<volatile const u32*>(address_);
            std::memcpy(&result, &word, sizeof result);
        } else {
            std::array<u16, sizeof(T) / 2> halfwords;
            auto src = reinterpret_cast<volatile const u16*>(address_);
            for (u32 i = 0; i < halfwords.size(); ++i) {
                halfwords[i] = src[i];
            }
            std::memcpy(&result, halfwords.data(), sizeof result);
        }

        return result;
    }

    void write(const T& value) const
    {
        if constexpr (word_access()) {
            u32 word;
            std::memcpy(&word, &value, sizeof word);
            *reinterpret_cast<volatile u32*>(address_) = word;
        } else {
            std::array<u16, sizeof(T) / 2> halfwords;
            std::memcpy(halfwords.data(), &value, sizeof value);
            auto dest = reinterpret_cast<volatile u16*>(address_);
            for (u32 i = 0; i < halfwords.size(); ++i) {
                dest[i] = halfwords[i];
            }
        }
    }

private:
    static constexpr bool word_access()
    {
        return sizeof(T) == 4 and alignof(T) == 4;
    }

    explicit VolatileCell(u8* address) : address_(address)
    {
    }

    template <typename, u32, u32> friend class VolBlock;

    template <Region, u32, typename, u32, u32> friend class MemoryAddress;

    u8* address_;
};


template <typename T, u32 N, u32 Stride = sizeof(T)> class VolBlock {
public:
    static_assert(N > 0);
    static_assert(Stride >= sizeof(T) and Stride % alignof(T) == 0,
                  "invalid stride");

    using Cell = VolatileCell<T>;

    static constexpr u32 length()
    {
        return N;
    }

    // Bounds checked. Out of range offsets yield nullopt, they never wrap.
    std::optional<Cell> index(u32 offset) const
    {
        if (offset >= N) {
            return {};
        }
        return cell(offset);
    }

    template <u32 offset> Cell at() const
    {
        static_assert(offset < N, "offset out of range");
        return cell(offset);
    }

    // Writes src[0], src[1], ... to consecutive cells starting at offset,
    // stopping at whichever comes first: the end of src, or the end of the
    // block. Returns the number of cells written.
    u32 write_slice_at_offset(u32 offset, const T* src, u32 count) const
    {
        if (offset >= N) {
            return 0;
        }

        const u32 written = std::min(count, N - offset);

        for (u32 i = 0; i < written; ++i) {
            cell(offset + i).write(src[i]);
        }

        return written;
    }

    u32 write_slice(const T* src, u32 count) const
    {
        return write_slice_at_offset(0, src, count);
    }

    // Reads up to count cells into dest, with the same truncation rules as
    // write_slice_at_offset.
    u32 read_slice_at_offset(u32 offset, T* dest, u32 count) const
    {
        if (offset >= N) {
            return 0;
        }

        const u32 read = std::min(count, N - offset);

        for (u32 i = 0; i < read; ++i) {
            dest[i] = cell(offset + i).read();
        }

        return read;
    }

    void fill(const T& value) const
    {
        for (u32 i = 0; i < N; ++i) {
            cell(i).write(value);
        }
    }

private:
    Cell cell(u32 offset) const
    {
        return Cell(base_ + offset * Stride);
    }

    explicit VolBlock(u8* base) : base_(base)
    {
    }

    template <typename, u32, u32, u32> friend class VolMatrix;

    template <Region, u32, typename, u32, u32> friend class MemoryAddress;

    u8* base_;
};


// Rows equally sized blocks, laid out back to back. Screen blocks and char
// blocks are matrices.
template <typename T, u32 N, u32 Rows, u32 Stride = sizeof(T)>
class VolMatrix {
public:
    using Row = VolBlock<T, N, Stride>;

    static constexpr u32 rows()
    {
        return Rows;
    }

    std::optional<Row> row(u32 index) const
    {
        if (index >= Rows) {
            return {};
        }
        return Row(base_ + index * N * Stride);
    }

private:
    explicit VolMatrix(u8* base) : base_(base)
    {
    }

    template <Region, u32, typename, u32, u32> friend class MemoryAddress;

    u8* base_;
};


template <Region region,
          u32 offset,
          typename T,
          u32 count = 1,
          u32 stride = sizeof(T)>
class MemoryAddress {
public:
    static_assert(count > 0);
    static_assert(offset % alignof(T) == 0 and offset % 2 == 0,
                  "misaligned hardware address");
    static_assert(stride >= sizeof(T) and stride % alignof(T) == 0,
                  "invalid stride");
    static_assert(offset + (count - 1) * stride + sizeof(T) <=
                      region_size(region),
                  "address range exceeds its region");

    static VolatileCell<T> cell()
    {
        static_assert(count == 1, "use block() for multi element addresses");
        return VolatileCell<T>(region_base(region) + offset);
    }

    static VolBlock<T, count, stride> block()
    {
        return VolBlock<T, count, stride>(region_base(region) + offset);
    }

    template <u32 rows> static VolMatrix<T, count / rows, rows, stride> matrix()
    {
        static_assert(count % rows == 0, "rows must evenly divide the range");
        return VolMatrix<T, count / rows, rows, stride>(region_base(region) +
                                                          offset);
    }

    MemoryAddress() = delete;
};
