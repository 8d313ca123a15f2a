#pragma once

#include "object.hpp"
#include "uniqueId.hpp"


// Pixel data for one sprite, shape sized, with the identity of its definition
// site. Sprite tile memory is keyed by that identity, a sprite that is already
// loaded is never uploaded twice.
template <ColorMode mode> class Sprite {
public:
    Sprite(const TileBitmap<mode>* tiles, u32 count, Shape shape, UniqueId id)
        : tiles_(tiles), count_(count), shape_(shape), id_(id)
    {
    }

    const TileBitmap<mode>* tiles() const
    {
        return tiles_;
    }

    // Tiles supplied by the definition. A sprite with fewer tiles than its
    // shape needs cannot be loaded.
    u32 count() const
    {
        return count_;
    }

    Shape shape() const
    {
        return shape_;
    }

    UniqueId id() const
    {
        return id_;
    }

    u32 tile_count() const
    {
        return shape_tile_count(shape_);
    }

    // Space needed in sprite tile memory, in 32 byte units.
    u16 units() const
    {
        return tile_count() * tile_units<mode>();
    }

private:
    const TileBitmap<mode>* tiles_;
    u32 count_;
    Shape shape_;
    UniqueId id_;
};


// A strip of equally shaped animation frames, loaded as one block.
template <ColorMode mode> class SpriteSheet {
public:
    SpriteSheet(const TileBitmap<mode>* tiles,
                u32 count,
                Shape shape,
                UniqueId id)
        : tiles_(tiles), count_(count), shape_(shape), id_(id)
    {
    }

    const TileBitmap<mode>* tiles() const
    {
        return tiles_;
    }

    u32 count() const
    {
        return count_;
    }

    Shape shape() const
    {
        return shape_;
    }

    UniqueId id() const
    {
        return id_;
    }

    u32 frame_count() const
    {
        return count_ / shape_tile_count(shape_);
    }

    u16 units_per_frame() const
    {
        return shape_tile_count(shape_) * tile_units<mode>();
    }

    u16 units() const
    {
        return frame_count() * units_per_frame();
    }

    // Tile index of a frame, for ObjectAttributes::set_tile, given the base
    // returned when the sheet was loaded.
    u16 frame_tile(u16 base, u32 frame) const
    {
        if (frame_count() == 0) {
            return base;
        }
        return base + (frame % frame_count()) * units_per_frame();
    }

private:
    const TileBitmap<mode>* tiles_;
    u32 count_;
    Shape shape_;
    UniqueId id_;
};


template <ColorMode mode, std::size_t count>
Sprite<mode> make_sprite(const std::array<TileBitmap<mode>, count>& tiles,
                         Shape shape,
                         UniqueId id)
{
    return Sprite<mode>(tiles.data(), count, shape, id);
}


template <ColorMode mode, std::size_t count>
SpriteSheet<mode>
make_sprite_sheet(const std::array<TileBitmap<mode>, count>& tiles,
                  Shape shape,
                  UniqueId id)
{
    return SpriteSheet<mode>(tiles.data(), count, shape, id);
}


#define VGATE_SPRITE(TILES, SHAPE) make_sprite(TILES, SHAPE, VGATE_UNIQUE_ID())

#define VGATE_SPRITE_SHEET(TILES, SHAPE)                                       \
    make_sprite_sheet(TILES, SHAPE, VGATE_UNIQUE_ID())
