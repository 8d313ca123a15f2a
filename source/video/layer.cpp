#include "layer.hpp"
#include "memoryMap.hpp"


namespace bgcnt {
constexpr u16 priority_mask = 0x0003;
constexpr u16 priority_shift = 0;
constexpr u16 cbb_mask = 0x000c;
constexpr u16 cbb_shift = 2;
constexpr u16 mosaic_mask = 0x0040;
constexpr u16 mosaic_shift = 6;
constexpr u16 color_mode_mask = 0x0080;
constexpr u16 color_mode_shift = 7;
constexpr u16 sbb_mask = 0x1f00;
constexpr u16 sbb_shift = 8;
constexpr u16 affine_wrap_mask = 0x2000;
constexpr u16 affine_wrap_shift = 13;
constexpr u16 size_mask = 0xc000;
constexpr u16 size_shift = 14;
} // namespace bgcnt


LayerHandle::LayerHandle(Layer layer) : layer_(layer), control_(0)
{
    if (auto cell = hw::BgCnt::block().index(static_cast<u32>(layer))) {
        control_ = cell->read();
    }
}


LayerHandle::LayerHandle(LayerHandle&& other)
    : layer_(other.layer_), control_(other.control_), live_(other.live_)
{
    other.live_ = false;
}


LayerHandle::~LayerHandle()
{
    if (live_) {
        commit();
    }
}


void LayerHandle::commit()
{
    if (auto cell = hw::BgCnt::block().index(static_cast<u32>(layer_))) {
        cell->write(control_);
    }
}


u16 LayerHandle::replace_bits(u16 mask, u16 shift, u16 value)
{
    const u16 prev = (control_ & mask) >> shift;
    control_ = (control_ & ~mask) | ((value << shift) & mask);
    return prev;
}


u8 LayerHandle::set_priority(u8 priority)
{
    return replace_bits(bgcnt::priority_mask, bgcnt::priority_shift, priority);
}


u8 LayerHandle::set_cbb(u8 cbb)
{
    return replace_bits(bgcnt::cbb_mask, bgcnt::cbb_shift, cbb);
}


u8 LayerHandle::set_sbb(u8 sbb)
{
    return replace_bits(bgcnt::sbb_mask, bgcnt::sbb_shift, sbb);
}


ColorMode LayerHandle::set_color_mode(ColorMode mode)
{
    return static_cast<ColorMode>(replace_bits(bgcnt::color_mode_mask,
                                               bgcnt::color_mode_shift,
                                               static_cast<u16>(mode)));
}


bool LayerHandle::set_mosaic(bool enabled)
{
    return replace_bits(bgcnt::mosaic_mask, bgcnt::mosaic_shift, enabled);
}


TextSize LayerHandle::set_text_size(TextSize size)
{
    return static_cast<TextSize>(replace_bits(
        bgcnt::size_mask, bgcnt::size_shift, static_cast<u16>(size)));
}


AffineSize LayerHandle::set_affine_size(AffineSize size)
{
    return static_cast<AffineSize>(replace_bits(
        bgcnt::size_mask, bgcnt::size_shift, static_cast<u16>(size)));
}


bool LayerHandle::set_affine_wrap(bool enabled)
{
    return replace_bits(
        bgcnt::affine_wrap_mask, bgcnt::affine_wrap_shift, enabled);
}


u8 LayerHandle::priority() const
{
    return (control_ & bgcnt::priority_mask) >> bgcnt::priority_shift;
}


u8 LayerHandle::cbb() const
{
    return (control_ & bgcnt::cbb_mask) >> bgcnt::cbb_shift;
}


u8 LayerHandle::sbb() const
{
    return (control_ & bgcnt::sbb_mask) >> bgcnt::sbb_shift;
}


ColorMode LayerHandle::color_mode() const
{
    return static_cast<ColorMode>((control_ & bgcnt::color_mode_mask) >>
                                  bgcnt::color_mode_shift);
}


void LayerHandle::set_offset(u16 x, u16 y)
{
    const auto offsets = hw::BgOffset::block();
    const u32 index = static_cast<u32>(layer_) * 2;

    if (auto h = offsets.index(index)) {
        h->write(x);
    }
    if (auto v = offsets.index(index + 1)) {
        v->write(y);
    }
}


bool LayerHandle::set_affine_offset(Fixed8 x, Fixed8 y)
{
    if (not is_affine_capable()) {
        return false;
    }

    const std::array<s32, 2> reference{x, y};

    if (layer_ == Layer::bg2) {
        hw::Bg2Reference::block().write_slice(reference.data(), 2);
    } else {
        hw::Bg3Reference::block().write_slice(reference.data(), 2);
    }

    return true;
}


bool LayerHandle::set_transform(const AffineTransform& transform)
{
    if (not is_affine_capable()) {
        return false;
    }

    const std::array<s16, 4> params{
        transform.pa, transform.pb, transform.pc, transform.pd};

    if (layer_ == Layer::bg2) {
        hw::Bg2Transform::block().write_slice(params.data(), params.size());
    } else {
        hw::Bg3Transform::block().write_slice(params.data(), params.size());
    }

    return true;
}


std::optional<ScreenBlock> LayerHandle::text_map() const
{
    const auto size = static_cast<TextSize>((control_ & bgcnt::size_mask) >>
                                            bgcnt::size_shift);
    return ScreenBlock::open(sbb(), size);
}


std::optional<AffineScreenBlock> LayerHandle::affine_map() const
{
    if (not is_affine_capable()) {
        return {};
    }

    const auto size = static_cast<AffineSize>(
        (control_ & bgcnt::size_mask) >> bgcnt::size_shift);
    return AffineScreenBlock::open(sbb(), size);
}
