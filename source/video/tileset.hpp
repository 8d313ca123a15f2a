#pragma once

#include "tile.hpp"
#include "uniqueId.hpp"


// An immutable, program lifetime array of tile bitmaps, and the identity of
// the site that defined it. Two tilesets with identical pixels defined in two
// places have distinct ids.
template <ColorMode mode> class Tileset {
public:
    using Bitmap = TileBitmap<mode>;

    Tileset(const Bitmap* tiles, u32 count, UniqueId id)
        : tiles_(tiles), count_(count), id_(id)
    {
    }

    const Bitmap* tiles() const
    {
        return tiles_;
    }

    u32 count() const
    {
        return count_;
    }

    UniqueId id() const
    {
        return id_;
    }

    static constexpr ColorMode color_mode()
    {
        return mode;
    }

private:
    const Bitmap* tiles_;
    u32 count_;
    UniqueId id_;
};


template <ColorMode mode> UniqueId identity_of(const Tileset<mode>& tileset)
{
    return tileset.id();
}


template <ColorMode mode, std::size_t count>
Tileset<mode> make_tileset(const std::array<TileBitmap<mode>, count>& tiles,
                           UniqueId id)
{
    return Tileset<mode>(tiles.data(), count, id);
}


template <ColorMode mode, std::size_t count>
Tileset<mode> make_tileset(const TileBitmap<mode> (&tiles)[count], UniqueId id)
{
    return Tileset<mode>(tiles, count, id);
}


#define VGATE_TILESET(TILES) make_tileset(TILES, VGATE_UNIQUE_ID())
