#pragma once

#include "screenBlock.hpp"
#include "tile.hpp"


enum class Layer : u8 { bg0, bg1, bg2, bg3 };


// 8.8 fixed point 2x2 matrix, mapping screen space to map space.
struct AffineTransform {
    s16 pa = 0x100;
    s16 pb = 0;
    s16 pc = 0;
    s16 pd = 0x100;
};


////////////////////////////////////////////////////////////////////////////////
// LayerHandle
//
// Cached copy of a background control register. Setters modify the cache, and
// the register is written when the handle is committed or destroyed. Scroll
// and transform registers are written immediately.
//
////////////////////////////////////////////////////////////////////////////////


class LayerHandle {
public:
    LayerHandle(LayerHandle&& other);
    LayerHandle& operator=(LayerHandle&&) = delete;
    LayerHandle(const LayerHandle&) = delete;

    ~LayerHandle();

    Layer layer() const
    {
        return layer_;
    }

    void commit();

    u16 control() const
    {
        return control_;
    }

    // Setters return the previous value.

    u8 set_priority(u8 priority);
    u8 set_cbb(u8 cbb);
    u8 set_sbb(u8 sbb);
    ColorMode set_color_mode(ColorMode mode);
    bool set_mosaic(bool enabled);
    TextSize set_text_size(TextSize size);
    AffineSize set_affine_size(AffineSize size);
    bool set_affine_wrap(bool enabled);

    u8 priority() const;
    u8 cbb() const;
    u8 sbb() const;
    ColorMode color_mode() const;

    void set_offset(u16 x, u16 y);

    // Affine layers (bg2, bg3) only, returns false for the others.
    bool set_affine_offset(Fixed8 x, Fixed8 y);
    bool set_transform(const AffineTransform& transform);

    // The map selected by the cached sbb and size bits.
    std::optional<ScreenBlock> text_map() const;
    std::optional<AffineScreenBlock> affine_map() const;

private:
    explicit LayerHandle(Layer layer);

    u16 replace_bits(u16 mask, u16 shift, u16 value);

    bool is_affine_capable() const
    {
        return layer_ == Layer::bg2 or layer_ == Layer::bg3;
    }

    friend class VideoControl;

    Layer layer_;
    u16 control_;
    bool live_ = true;
};
