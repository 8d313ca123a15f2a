#include "screenBlock.hpp"


// Screen blocks overlap the background char blocks: block n starts at
// n * 2KiB.
using ScreenBlocks = MemoryAddress<Region::vram, 0x0, Tile, 1024 * 32>;
using MapMemory = MemoryAddress<Region::vram, 0x0, u16, 0x10000 / 2>;


static constexpr u32 screen_block_bytes = 0x800;


std::optional<ScreenBlock> ScreenBlock::open(u8 base, TextSize size)
{
    if (base + screen_blocks_spanned(size) > count) {
        return {};
    }
    return ScreenBlock(base, size);
}


static bool in_bounds(TilePos pos, TileSize size)
{
    return pos.x >= 0 and pos.y >= 0 and pos.x < size.x and pos.y < size.y;
}


u32 ScreenBlock::write_run(TilePos start, const Tile* tiles, u32 count) const
{
    const auto sz = size();

    if (start.y < 0 or start.y >= sz.y) {
        return 0;
    }

    s32 x = start.x;
    u32 skip = 0;

    if (x < 0) {
        if (u32(-x) >= count) {
            return 0;
        }
        skip = -x;
        x = 0;
    }

    const auto blocks = ScreenBlocks::matrix<ScreenBlock::count>();

    u32 written = 0;

    // Runs are split where they cross from one 32 column quadrant into the
    // next, the quadrants are not adjacent in memory.
    while (skip < count and x < sz.x) {
        const u32 column = x % 32;
        const u32 run =
            std::min({count - skip, 32 - column, u32(sz.x - x)});

        const u32 block = base_ + x / 32 + (start.y / 32) * (sz.x / 32);
        const u32 offset = (start.y % 32) * 32 + column;

        if (auto row = blocks.row(block)) {
            written += row->write_slice_at_offset(offset, tiles + skip, run);
        }

        skip += run;
        x += run;
    }

    return written;
}


u32 ScreenBlock::write_cell(TilePos pos, Tile tile) const
{
    return write_run(pos, &tile, 1);
}


std::optional<Tile> ScreenBlock::get_tile(TilePos pos) const
{
    const auto sz = size();

    if (not in_bounds(pos, sz)) {
        return {};
    }

    const u32 block = base_ + pos.x / 32 + (pos.y / 32) * (sz.x / 32);
    const u32 offset = (pos.y % 32) * 32 + pos.x % 32;

    if (auto row = ScreenBlocks::matrix<ScreenBlock::count>().row(block)) {
        if (auto cell = row->index(offset)) {
            return cell->read();
        }
    }

    return {};
}


u32 ScreenBlock::fill(Tile tile, const VBlank&) const
{
    const auto blocks = ScreenBlocks::matrix<ScreenBlock::count>();

    u32 written = 0;

    for (u32 i = 0; i < screen_blocks_spanned(size_); ++i) {
        if (auto row = blocks.row(base_ + i)) {
            row->fill(tile);
            written += row->length();
        }
    }

    return written;
}


std::optional<AffineScreenBlock> AffineScreenBlock::open(u8 base,
                                                         AffineSize size)
{
    if (base + screen_blocks_spanned(size) > ScreenBlock::count) {
        return {};
    }
    return AffineScreenBlock(base, size);
}


void AffineScreenBlock::write_byte(u32 byte_offset, u8 value) const
{
    if (auto cell = MapMemory::block().index(byte_offset / 2)) {
        const u16 prev = cell->read();
        if (byte_offset % 2) {
            cell->write(u16((prev & 0x00ff) | (value << 8)));
        } else {
            cell->write(u16((prev & 0xff00) | value));
        }
    }
}


u32 AffineScreenBlock::write_run(TilePos start,
                                 const Tile* tiles,
                                 u32 count) const
{
    const s32 side = side_length(size_);

    if (start.y < 0 or start.y >= side) {
        return 0;
    }

    s32 x = start.x;
    u32 skip = 0;

    if (x < 0) {
        if (u32(-x) >= count) {
            return 0;
        }
        skip = -x;
        x = 0;
    }

    if (x >= side) {
        return 0;
    }

    const u32 length = std::min(count - skip, u32(side - x));
    const auto memory = MapMemory::block();

    u32 byte = base_ * screen_block_bytes + start.y * side + x;

    for (u32 i = 0; i < length;) {
        const u8 tile = tiles[skip + i].index();

        if (byte % 2 == 0 and i + 1 < length) {
            const u8 next = tiles[skip + i + 1].index();
            if (auto cell = memory.index(byte / 2)) {
                cell->write(u16(tile | (next << 8)));
            }
            i += 2;
            byte += 2;
        } else {
            write_byte(byte, tile);
            i += 1;
            byte += 1;
        }
    }

    return length;
}


u32 AffineScreenBlock::write_cell(TilePos pos, Tile tile) const
{
    return write_run(pos, &tile, 1);
}


std::optional<u8> AffineScreenBlock::get_tile(TilePos pos) const
{
    if (not in_bounds(pos, size())) {
        return {};
    }

    const u32 byte =
        base_ * screen_block_bytes + pos.y * side_length(size_) + pos.x;

    if (auto cell = MapMemory::block().index(byte / 2)) {
        const u16 pair = cell->read();
        return u8(byte % 2 ? pair >> 8 : pair & 0xff);
    }

    return {};
}
