#pragma once

#include "bitvector.hpp"
#include "syncGate.hpp"
#include "tile.hpp"
#include <optional>


// Sprite dimensions in tiles, width first. The hardware encodes these as a
// shape (square, horizontal, vertical) and a size, in that order here:
// shape = value / 4, size = value % 4.
enum class Shape : u8 {
    _1x1,
    _2x2,
    _4x4,
    _8x8,
    _2x1,
    _4x1,
    _4x2,
    _8x4,
    _1x2,
    _1x4,
    _2x4,
    _4x8,
};


constexpr TileSize shape_tiles(Shape shape)
{
    constexpr TileSize table[] = {{1, 1},
                                  {2, 2},
                                  {4, 4},
                                  {8, 8},
                                  {2, 1},
                                  {4, 1},
                                  {4, 2},
                                  {8, 4},
                                  {1, 2},
                                  {1, 4},
                                  {2, 4},
                                  {4, 8}};
    return table[static_cast<u8>(shape)];
}


constexpr u32 shape_tile_count(Shape shape)
{
    return u32(shape_tiles(shape).x) * shape_tiles(shape).y;
}


enum class ObjectMode : u8 { normal, alpha_blend, window };


////////////////////////////////////////////////////////////////////////////////
// ObjectAttributes
//
// The three attribute halfwords of an oam entry.
//
// attr0: y (0-7), object mode (8-9), graphics mode (10-11), mosaic (12),
//        8bpp (13), shape (14-15)
// attr1: x (0-8), horizontal flip (12), vertical flip (13), size (14-15)
// attr2: tile (0-9), priority (10-11), palette bank (12-15)
//
// Affine objects are not supported, object mode 0b10 hides the entry.
//
////////////////////////////////////////////////////////////////////////////////


class ObjectAttributes {
public:
    constexpr ObjectAttributes() : attr0_(0), attr1_(0), attr2_(0)
    {
    }

    static constexpr ObjectAttributes hidden_entry()
    {
        ObjectAttributes result;
        result.attr0_ = attr0_hidden;
        return result;
    }

    void set_x(s16 x)
    {
        attr1_ = (attr1_ & ~0x01ff) | (x & 0x01ff);
    }

    void set_y(s16 y)
    {
        attr0_ = (attr0_ & ~0x00ff) | (y & 0x00ff);
    }

    void set_position(s16 x, s16 y)
    {
        set_x(x);
        set_y(y);
    }

    void set_shape(Shape shape)
    {
        const u16 value = static_cast<u8>(shape);
        attr0_ = (attr0_ & ~0xc000) | ((value / 4) << 14);
        attr1_ = (attr1_ & ~0xc000) | ((value % 4) << 14);
    }

    void set_mode(ObjectMode mode)
    {
        attr0_ = (attr0_ & ~0x0c00) | (static_cast<u16>(mode) << 10);
    }

    void set_mosaic(bool enabled)
    {
        attr0_ = enabled ? (attr0_ | 0x1000) : (attr0_ & ~0x1000);
    }

    void set_color_mode(ColorMode mode)
    {
        attr0_ = mode == ColorMode::bit8 ? (attr0_ | 0x2000)
                                         : (attr0_ & ~0x2000);
    }

    void set_flip(bool horizontal, bool vertical)
    {
        attr1_ = (attr1_ & ~0x3000) | (horizontal << 12) | (vertical << 13);
    }

    void set_tile(u16 tile)
    {
        attr2_ = (attr2_ & ~0x03ff) | (tile & 0x03ff);
    }

    void set_priority(u8 priority)
    {
        attr2_ = (attr2_ & ~0x0c00) | ((priority & 0x3) << 10);
    }

    void set_palette_bank(u8 bank)
    {
        attr2_ = (attr2_ & ~0xf000) | ((bank & 0xf) << 12);
    }

    void set_hidden(bool hidden)
    {
        attr0_ = (attr0_ & ~attr0_mode_mask) | (hidden ? attr0_hidden : 0);
    }

    // Decoded as the hardware does: x is nine bits, y eight.
    u16 x() const
    {
        return attr1_ & 0x01ff;
    }

    u16 y() const
    {
        return attr0_ & 0x00ff;
    }

    Shape shape() const
    {
        return static_cast<Shape>((attr0_ >> 14) * 4 + (attr1_ >> 14));
    }

    ObjectMode mode() const
    {
        return static_cast<ObjectMode>((attr0_ >> 10) & 0x3);
    }

    u16 tile() const
    {
        return attr2_ & 0x03ff;
    }

    u8 priority() const
    {
        return (attr2_ >> 10) & 0x3;
    }

    u8 palette_bank() const
    {
        return attr2_ >> 12;
    }

    bool hidden() const
    {
        return (attr0_ & attr0_mode_mask) == attr0_hidden;
    }

    u16 attr0() const
    {
        return attr0_;
    }

    u16 attr1() const
    {
        return attr1_;
    }

    u16 attr2() const
    {
        return attr2_;
    }

    bool operator==(const ObjectAttributes& other) const
    {
        return attr0_ == other.attr0_ and attr1_ == other.attr1_ and
               attr2_ == other.attr2_;
    }

private:
    static constexpr u16 attr0_mode_mask = 0x0300;
    static constexpr u16 attr0_hidden = 0x0200;

    u16 attr0_;
    u16 attr1_;
    u16 attr2_;
};


static_assert(sizeof(ObjectAttributes) == 6);


class ObjectAllocator;


// Exclusive ownership of one oam slot. Move only. Destroying a live handle
// releases the slot without a blanking window: the slot becomes free at once,
// and its entry is hidden by the next ObjectAllocator::flush(). A handle must
// not outlive the allocator that issued it.
class ObjectHandle {
public:
    ObjectHandle(ObjectHandle&& other) noexcept;
    ObjectHandle& operator=(ObjectHandle&& other) noexcept;

    ObjectHandle(const ObjectHandle&) = delete;
    ObjectHandle& operator=(const ObjectHandle&) = delete;

    ~ObjectHandle();

    u8 index() const
    {
        return index_;
    }

private:
    ObjectHandle(ObjectAllocator& owner, u8 index)
        : owner_(&owner), index_(index)
    {
    }

    friend class ObjectAllocator;

    ObjectAllocator* owner_;
    u8 index_;
};


////////////////////////////////////////////////////////////////////////////////
// ObjectAllocator
//
// Shares the 128 hardware sprite slots among whoever needs one. The occupancy
// bitmap is the only record of which slots are taken. A shadow copy of every
// slot's attributes mirrors the last values written to oam.
//
////////////////////////////////////////////////////////////////////////////////


class ObjectAllocator {
public:
    static constexpr u32 capacity = 128;

    ObjectAllocator() = default;

    ObjectAllocator(const ObjectAllocator&) = delete;
    ObjectAllocator& operator=(const ObjectAllocator&) = delete;

    // Claims the lowest free slot. Nullopt when all 128 slots are taken.
    std::optional<ObjectHandle> acquire();

    // Frees the slot, and hides its entry immediately. Oam is locked during
    // hblank unless DISPCNT's hblank interval free bit is set, so oam writes
    // take a vblank.
    void release(ObjectHandle&& handle, const VBlank& vblank);

    void write_attributes(const ObjectHandle& handle,
                          const ObjectAttributes& attributes,
                          const VBlank& vblank);

    const ObjectAttributes& attributes(const ObjectHandle& handle) const
    {
        return shadow_[handle.index()];
    }

    // Hides entries of slots released through handle destruction. Returns the
    // number of entries written.
    u32 flush(const VBlank& vblank);

    // Hides all 128 entries. Slot ownership is unaffected.
    void reset(const VBlank& vblank);

    bool is_allocated(u8 index) const
    {
        return index < capacity and occupied_.get(index);
    }

    u32 allocated_count() const
    {
        return occupied_.count();
    }

    u32 pending_hide_count() const
    {
        return pending_hide_.count();
    }

private:
    friend class ObjectHandle;

    void release_deferred(u8 index);

    void hide(u8 index);

    Bitvector<capacity> occupied_;
    Bitvector<capacity> pending_hide_;
    std::array<ObjectAttributes, capacity> shadow_{};
};
