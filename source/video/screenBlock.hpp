#pragma once

#include "drawable.hpp"
#include "syncGate.hpp"
#include "volatile.hpp"
#include <optional>


// Text maps span one, two, or four 2KiB screen blocks. Multi block maps are
// laid out as 32x32 quadrants: left to right, then top to bottom.
enum class TextSize : u8 { _32x32, _64x32, _32x64, _64x64 };


// Affine maps use one byte per entry, and span a fraction of a screen block up
// to eight screen blocks.
enum class AffineSize : u8 { _16x16, _32x32, _64x64, _128x128 };


constexpr TileSize tile_size(TextSize size)
{
    switch (size) {
    case TextSize::_32x32:
        return {32, 32};

    case TextSize::_64x32:
        return {64, 32};

    case TextSize::_32x64:
        return {32, 64};

    case TextSize::_64x64:
        return {64, 64};
    }
    return {};
}


constexpr u16 side_length(AffineSize size)
{
    return 16 << static_cast<u8>(size);
}


constexpr u32 screen_blocks_spanned(TextSize size)
{
    const auto sz = tile_size(size);
    return (sz.x / 32) * (sz.y / 32);
}


constexpr u32 screen_blocks_spanned(AffineSize size)
{
    const u32 bytes = u32(side_length(size)) * side_length(size);
    return (bytes + 0x7ff) / 0x800;
}


// Shared draw and clear logic for both map formats. Derived provides the
// clipping writers: write_run(TilePos, const Tile*, u32) for horizontal runs,
// and write_cell(TilePos, Tile) for single entries. Both return the number of
// entries actually written, which counts the work done inside the blanking
// window.
template <typename Derived> class MapWriter {
public:
    template <typename D>
    u32 draw(const D& drawable, TilePos at, const VBlank&) const
    {
        u32 written = 0;

        if constexpr (D::shape == DrawShape::region) {
            const auto size = drawable.size();
            for (u16 y = 0; y < size.y; ++y) {
                written += derived().write_run(translate(at, TilePos{0, s16(y)}),
                                               drawable.tiles() + y * size.x,
                                               size.x);
            }
        } else if constexpr (D::shape == DrawShape::line) {
            drawable.for_each_line(
                [&](TilePos start, const Tile* tiles, u32 count) {
                    written +=
                        derived().write_run(translate(at, start), tiles, count);
                });
        } else {
            drawable.for_each_tile([&](Tile tile, TilePos pos) {
                written += derived().write_cell(translate(at, pos), tile);
            });
        }

        return written;
    }

    // Writes empty entries over everything that drawing the same drawable at
    // the same position would cover.
    template <typename D>
    u32 clear(const D& drawable, TilePos at, const VBlank&) const
    {
        u32 written = 0;

        auto write_empty = [&](TilePos start, const Tile* tiles, u32 count) {
            written += derived().write_run(start, tiles, count);
        };

        if constexpr (D::shape == DrawShape::region) {
            const auto size = drawable.size();
            for (u16 y = 0; y < size.y; ++y) {
                detail::emit_empty_run(
                    at.x, s16(at.y + y), size.x, write_empty);
            }
        } else if constexpr (D::shape == DrawShape::line) {
            drawable.for_each_line([&](TilePos start, const Tile*, u32 count) {
                const auto pos = translate(at, start);
                detail::emit_empty_run(pos.x, pos.y, count, write_empty);
            });
        } else {
            drawable.for_each_tile([&](Tile, TilePos pos) {
                written +=
                    derived().write_cell(translate(at, pos), Tile::empty());
            });
        }

        return written;
    }

    // Single entry writes are small enough for an hblank.
    bool set_tile(Tile tile, TilePos pos, const Blank&) const
    {
        return derived().write_cell(pos, tile);
    }

private:
    static TilePos translate(TilePos at, TilePos pos)
    {
        return {s16(at.x + pos.x), s16(at.y + pos.y)};
    }

    const Derived& derived() const
    {
        return static_cast<const Derived&>(*this);
    }
};


////////////////////////////////////////////////////////////////////////////////
// ScreenBlock
////////////////////////////////////////////////////////////////////////////////


class ScreenBlock : public MapWriter<ScreenBlock> {
public:
    static constexpr u32 count = 32;
    static constexpr u32 entries = 1024;

    // Nullopt if the map would extend past the last screen block.
    static std::optional<ScreenBlock> open(u8 base,
                                           TextSize size = TextSize::_32x32);

    u8 base() const
    {
        return base_;
    }

    TextSize text_size() const
    {
        return size_;
    }

    TileSize size() const
    {
        return tile_size(size_);
    }

    std::optional<Tile> get_tile(TilePos pos) const;

    // Writes tile to every entry of the map.
    u32 fill(Tile tile, const VBlank&) const;

private:
    friend class MapWriter<ScreenBlock>;

    ScreenBlock(u8 base, TextSize size) : base_(base), size_(size)
    {
    }

    u32 write_run(TilePos start, const Tile* tiles, u32 count) const;

    u32 write_cell(TilePos pos, Tile tile) const;

    u8 base_;
    TextSize size_;
};


////////////////////////////////////////////////////////////////////////////////
// AffineScreenBlock
//
// One byte per entry, the tile index, row major. Video memory has no byte
// wide write path, so adjacent even/odd entries are written together as a
// halfword, and a lone entry is merged into its halfword with a read, modify,
// write.
//
////////////////////////////////////////////////////////////////////////////////


class AffineScreenBlock : public MapWriter<AffineScreenBlock> {
public:
    static std::optional<AffineScreenBlock> open(u8 base, AffineSize size);

    u8 base() const
    {
        return base_;
    }

    AffineSize affine_size() const
    {
        return size_;
    }

    TileSize size() const
    {
        return {side_length(size_), side_length(size_)};
    }

    std::optional<u8> get_tile(TilePos pos) const;

private:
    friend class MapWriter<AffineScreenBlock>;

    AffineScreenBlock(u8 base, AffineSize size) : base_(base), size_(size)
    {
    }

    u32 write_run(TilePos start, const Tile* tiles, u32 count) const;

    u32 write_cell(TilePos pos, Tile tile) const;

    void write_byte(u32 byte_offset, u8 value) const;

    u8 base_;
    AffineSize size_;
};
