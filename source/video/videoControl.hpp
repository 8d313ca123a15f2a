#pragma once

#include "layer.hpp"
#include "sprite.hpp"
#include "spriteBlocks.hpp"
#include "syncGate.hpp"
#include "tileset.hpp"
#include "volatile.hpp"


class Platform;


// Text: four text layers. Mixed: bg0 and bg1 text, bg2 affine. Affine: bg2
// and bg3 affine.
enum class Mode : u8 { text = 0, mixed = 1, affine = 2 };


enum class ObjectMapping : u8 { two_dimensional, one_dimensional };


namespace detail {

// Copies whole tile bitmaps into a halfword block, starting at a halfword
// offset. Stops at the first tile that does not fit entirely. Returns the
// number of tiles copied.
template <typename Block, ColorMode mode>
u32 upload_tiles(const Block& block,
                 u32 offset,
                 const TileBitmap<mode>* tiles,
                 u32 count)
{
    constexpr u32 halfwords = TileBitmap<mode>::halfwords;

    for (u32 i = 0; i < count; ++i) {
        if (offset + halfwords > Block::length()) {
            return i;
        }
        block.write_slice_at_offset(offset, tiles[i].data_.data(), halfwords);
        offset += halfwords;
    }

    return count;
}

} // namespace detail


////////////////////////////////////////////////////////////////////////////////
// VideoControl
//
// Display control, and the bookkeeping for what currently lives in background
// and sprite tile memory. Tilesets and sprites are tracked by identity: loading
// one that is already resident costs nothing.
//
////////////////////////////////////////////////////////////////////////////////


class VideoControl {
public:
    static constexpr u32 char_blocks = 4;
    static constexpr u32 char_block_bytes = 0x4000;

    // Sprite tile memory, in 32 byte units.
    static constexpr u16 object_tile_units = 1024;

    using BgTileMemory =
        MemoryAddress<Region::vram, 0x0, u16, char_blocks * char_block_bytes / 2>;
    using ObjTileMemory = MemoryAddress<Region::vram, 0x10000, u16, 0x8000 / 2>;

    VideoControl(Platform& pfrm);

    VideoControl(const VideoControl&) = delete;

    // Mode 0, every layer and objects disabled, forced blank off.
    void reset_display_control();

    // Layers that the new mode does not provide are disabled.
    void enter_mode(Mode mode);

    Mode mode() const;

    bool layer_available(Layer layer) const;

    // Both return false if the current mode lacks the layer.
    bool enable_layer(Layer layer);
    bool disable_layer(Layer layer);

    bool layer_enabled(Layer layer) const;

    // Nullopt if the current mode lacks the layer.
    std::optional<LayerHandle> layer(Layer layer) const;

    void enable_objects();
    void disable_objects();
    bool objects_enabled() const;

    void set_object_mapping(ObjectMapping mapping);

    void set_forced_blank(bool enabled);

    // Copies a tileset into background tile memory, starting at char block
    // cbb, and spilling into the following char blocks if it is larger than
    // one. Skips the copy when the same tileset (by identity) is already
    // resident at cbb. Returns false if the tileset does not fit.
    template <ColorMode mode>
    bool load_tileset(u8 cbb, const Tileset<mode>& tileset, const VBlank&)
    {
        if (cbb >= char_blocks) {
            return false;
        }

        if (is_resident(cbb, tileset)) {
            return true;
        }

        const u32 bytes = tileset.count() * sizeof(TileBitmap<mode>);
        const u32 start = cbb * char_block_bytes;

        if (start + bytes > char_blocks * char_block_bytes) {
            report_tileset_overflow(cbb, tileset.count());
            return false;
        }

        detail::upload_tiles(
            BgTileMemory::block(), start / 2, tileset.tiles(), tileset.count());

        const u8 span = (bytes + char_block_bytes - 1) / char_block_bytes;
        mark_resident(cbb, span ? span : 1, tileset.id());

        return true;
    }

    template <ColorMode mode>
    bool is_resident(u8 cbb, const Tileset<mode>& tileset) const
    {
        return cbb < char_blocks and resident_[cbb].id_ and
               *resident_[cbb].id_ == tileset.id();
    }

    // For after something other than load_tileset wrote to tile memory.
    void forget_tilesets();

    // Returns the sprite's first tile index, for ObjectAttributes::set_tile.
    template <ColorMode mode>
    std::optional<u16> load_sprite(const Sprite<mode>& sprite, const VBlank&)
    {
        if (auto existing = sprite_blocks_.find(sprite.id())) {
            return existing;
        }

        return upload_sprite(sprite.id(),
                             sprite.units(),
                             sprite.tiles(),
                             sprite.count(),
                             sprite.tile_count());
    }

    template <ColorMode mode> bool unload_sprite(const Sprite<mode>& sprite)
    {
        return sprite_blocks_.remove(sprite.id());
    }

    // Reuses prev's tile memory for next. Both must occupy the same number of
    // tiles, and prev must be loaded.
    template <ColorMode mode>
    std::optional<u16> replace_sprite(const Sprite<mode>& prev,
                                      const Sprite<mode>& next,
                                      const VBlank&)
    {
        if (next.count() < next.tile_count()) {
            return {};
        }

        const auto offset =
            sprite_blocks_.replace_id(prev.id(), next.id(), next.units());

        if (offset) {
            detail::upload_tiles(ObjTileMemory::block(),
                                 *offset * 16,
                                 next.tiles(),
                                 next.tile_count());
        }

        return offset;
    }

    // Returns the first tile of the sheet. See SpriteSheet::frame_tile.
    template <ColorMode mode>
    std::optional<u16> load_sprite_sheet(const SpriteSheet<mode>& sheet,
                                         const VBlank&)
    {
        if (auto existing = sprite_blocks_.find(sheet.id())) {
            return existing;
        }

        const u32 tiles = sheet.frame_count() * shape_tile_count(sheet.shape());

        return upload_sprite(
            sheet.id(), sheet.units(), sheet.tiles(), sheet.count(), tiles);
    }

    template <ColorMode mode>
    bool unload_sprite_sheet(const SpriteSheet<mode>& sheet)
    {
        return sprite_blocks_.remove(sheet.id());
    }

    u16 sprite_memory_end() const
    {
        return sprite_blocks_.end();
    }

private:
    struct Residency {
        std::optional<UniqueId> id_;
        u8 span_ = 0;
    };

    template <ColorMode mode>
    std::optional<u16> upload_sprite(UniqueId id,
                                     u16 units,
                                     const TileBitmap<mode>* tiles,
                                     u32 available,
                                     u32 needed)
    {
        if (available < needed or needed == 0) {
            report_sprite_failure("sprite definition has too few tiles");
            return {};
        }

        const auto offset = sprite_blocks_.insert_sized(id, units);
        if (not offset) {
            report_sprite_failure("sprite memory exhausted");
            return {};
        }

        detail::upload_tiles(ObjTileMemory::block(), *offset * 16, tiles, needed);

        return offset;
    }

    void mark_resident(u8 cbb, u8 span, UniqueId id);

    void report_tileset_overflow(u8 cbb, u32 count);

    void report_sprite_failure(const char* reason);

    void modify_dispcnt(u16 clear_bits, u16 set_bits);

    Platform& pfrm_;
    std::array<Residency, char_blocks> resident_;
    SpriteBlocks<UniqueId, 128> sprite_blocks_;
};
