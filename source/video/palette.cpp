#include "palette.hpp"
#include "volatile.hpp"


using BgPalette = MemoryAddress<Region::palette, 0x000, Color, palette_colors>;
using ObjPalette = MemoryAddress<Region::palette, 0x200, Color, palette_colors>;


u32 load_palette(const Color* colors, u32 count, const VBlank&)
{
    return BgPalette::block().write_slice(colors, count);
}


u32 load_object_palette(u32 offset,
                        const Color* colors,
                        u32 count,
                        const VBlank&)
{
    return ObjPalette::block().write_slice_at_offset(offset, colors, count);
}


bool load_palette_bank(u8 bank, const Palette16& colors, const VBlank&)
{
    if (bank >= palette_colors / palette_bank_colors) {
        return false;
    }

    BgPalette::block().write_slice_at_offset(
        bank * palette_bank_colors, colors.data(), colors.size());

    return true;
}


bool load_object_palette_bank(u8 bank, const Palette16& colors, const VBlank&)
{
    if (bank >= palette_colors / palette_bank_colors) {
        return false;
    }

    ObjPalette::block().write_slice_at_offset(
        bank * palette_bank_colors, colors.data(), colors.size());

    return true;
}


Color read_palette(u32 index)
{
    if (auto cell = BgPalette::block().index(index)) {
        return cell->read();
    }
    return {};
}


Color read_object_palette(u32 index)
{
    if (auto cell = ObjPalette::block().index(index)) {
        return cell->read();
    }
    return {};
}
