#pragma once

#include "tile.hpp"
#include <utility>


////////////////////////////////////////////////////////////////////////////////
//
// Drawables
//
// Anything that can be written into a tile map. A drawable declares one of
// three traversal shapes, and the map writer picks its strategy from the shape
// at compile time:
//
// region: size() and tiles(), a contiguous row major block of entries. Rows
//         are written as slices.
//
// line:   for_each_line(f), calling f(TilePos start, const Tile* tiles,
//         u32 count) for horizontal runs. Runs are written as slices.
//
// tile:   for_each_tile(f), calling f(Tile tile, TilePos pos). Each entry is
//         written individually.
//
// Positions are relative to wherever the drawable is placed.
//
////////////////////////////////////////////////////////////////////////////////


enum class DrawShape : u8 { region, line, tile };


class TileGrid {
public:
    static constexpr DrawShape shape = DrawShape::region;

    TileGrid(const Tile* tiles, TileSize size) : tiles_(tiles), size_(size)
    {
    }

    TileSize size() const
    {
        return size_;
    }

    const Tile* tiles() const
    {
        return tiles_;
    }

private:
    const Tile* tiles_;
    TileSize size_;
};


// Ascii text, mapped onto a font whose first glyph (the space character) is
// font_base. A newline starts a new row at column zero. Characters without a
// glyph are drawn as spaces.
class Text {
public:
    static constexpr DrawShape shape = DrawShape::line;

    static constexpr u32 chunk_size = 32;

    explicit Text(const char* str, u16 font_base = 0, u8 palette = 0)
        : str_(str), font_base_(font_base), palette_(palette)
    {
    }

    template <typename F> void for_each_line(F&& emit) const
    {
        std::array<Tile, chunk_size> chunk;
        u32 used = 0;
        TilePos start;
        s16 x = 0;
        s16 y = 0;

        for (const char* c = str_; *c not_eq '\0'; ++c) {
            if (*c == '\n') {
                if (used) {
                    emit(start, chunk.data(), used);
                    used = 0;
                }
                x = 0;
                ++y;
                continue;
            }

            if (used == 0) {
                start = {x, y};
            }

            chunk[used++] = glyph(*c);
            ++x;

            if (used == chunk_size) {
                emit(start, chunk.data(), used);
                used = 0;
            }
        }

        if (used) {
            emit(start, chunk.data(), used);
        }
    }

    Tile glyph(char c) const
    {
        u8 code = c;
        if (code < 0x20 or code > 0x7e) {
            code = ' ';
        }
        return Tile(font_base_ + (code - 0x20)).with_palette(palette_);
    }

private:
    const char* str_;
    u16 font_base_;
    u8 palette_;
};


namespace detail {

constexpr std::array<Tile, 32> empty_run{};

template <typename F> void emit_empty_run(s16 x, s16 y, u16 length, F&& emit)
{
    while (length) {
        const u16 count = length < empty_run.size() ? length : empty_run.size();
        emit(TilePos{x, y}, empty_run.data(), count);
        x += count;
        length -= count;
    }
}

} // namespace detail


class EmptyLine {
public:
    static constexpr DrawShape shape = DrawShape::line;

    explicit EmptyLine(u16 length) : length_(length)
    {
    }

    template <typename F> void for_each_line(F&& emit) const
    {
        detail::emit_empty_run(0, 0, length_, emit);
    }

private:
    u16 length_;
};


class EmptyRect {
public:
    static constexpr DrawShape shape = DrawShape::line;

    explicit EmptyRect(TileSize size) : size_(size)
    {
    }

    template <typename F> void for_each_line(F&& emit) const
    {
        for (u16 y = 0; y < size_.y; ++y) {
            detail::emit_empty_run(0, y, size_.x, emit);
        }
    }

private:
    TileSize size_;
};


// A rectangular picture stored as a block of consecutive tiles in a tileset
// that is tileset_width tiles wide, starting at first_tile.
class Image {
public:
    static constexpr DrawShape shape = DrawShape::tile;

    Image(u16 first_tile, u16 tileset_width, TileSize size, u8 palette = 0)
        : first_tile_(first_tile), tileset_width_(tileset_width), size_(size),
          palette_(palette)
    {
    }

    template <typename F> void for_each_tile(F&& f) const
    {
        for (u16 y = 0; y < size_.y; ++y) {
            for (u16 x = 0; x < size_.x; ++x) {
                const Tile tile(first_tile_ + y * tileset_width_ + x);
                f(tile.with_palette(palette_), TilePos{s16(x), s16(y)});
            }
        }
    }

    TileSize size() const
    {
        return size_;
    }

private:
    u16 first_tile_;
    u16 tileset_width_;
    TileSize size_;
    u8 palette_;
};


// Visits every entry of any drawable, whatever its shape.
template <typename D, typename F> void for_each_tile_of(const D& drawable, F&& f)
{
    if constexpr (D::shape == DrawShape::region) {
        const auto size = drawable.size();
        const Tile* tiles = drawable.tiles();
        for (u16 y = 0; y < size.y; ++y) {
            for (u16 x = 0; x < size.x; ++x) {
                f(tiles[y * size.x + x], TilePos{s16(x), s16(y)});
            }
        }
    } else if constexpr (D::shape == DrawShape::line) {
        drawable.for_each_line(
            [&f](TilePos start, const Tile* tiles, u32 count) {
                for (u32 i = 0; i < count; ++i) {
                    f(tiles[i], TilePos{s16(start.x + i), start.y});
                }
            });
    } else {
        drawable.for_each_tile(f);
    }
}


// The part of another drawable that falls within a window, moved so that the
// window's top left corner lands at the origin. Useful for showing a section
// of a larger picture. Holds its own copy of the inner drawable, which is
// only a view of the tile data.
template <typename D> class Windowed {
public:
    static constexpr DrawShape shape = DrawShape::tile;

    Windowed(D inner, TilePos origin, TileSize size)
        : inner_(std::move(inner)), origin_(origin), size_(size)
    {
    }

    template <typename F> void for_each_tile(F&& f) const
    {
        for_each_tile_of(inner_, [&](Tile tile, TilePos pos) {
            const s32 x = pos.x - origin_.x;
            const s32 y = pos.y - origin_.y;
            if (x >= 0 and y >= 0 and x < size_.x and y < size_.y) {
                f(tile, TilePos{s16(x), s16(y)});
            }
        });
    }

private:
    D inner_;
    TilePos origin_;
    TileSize size_;
};
