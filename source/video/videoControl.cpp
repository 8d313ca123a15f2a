#include "videoControl.hpp"
#include "memoryMap.hpp"
#include "platform/platform.hpp"
#include "util.hpp"


VideoControl::VideoControl(Platform& pfrm)
    : pfrm_(pfrm), sprite_blocks_(object_tile_units)
{
}


void VideoControl::modify_dispcnt(u16 clear_bits, u16 set_bits)
{
    auto dispcnt = hw::DispCnt::cell();
    dispcnt.write(u16((dispcnt.read() & ~clear_bits) | set_bits));
}


void VideoControl::reset_display_control()
{
    hw::DispCnt::cell().write(0);
}


Mode VideoControl::mode() const
{
    return static_cast<Mode>(hw::DispCnt::cell().read() &
                             hw::dispcnt::mode_mask);
}


static bool mode_has_layer(Mode mode, Layer layer)
{
    switch (mode) {
    case Mode::text:
        return true;

    case Mode::mixed:
        return layer not_eq Layer::bg3;

    case Mode::affine:
        return layer == Layer::bg2 or layer == Layer::bg3;
    }
    return false;
}


static u16 layer_bit(Layer layer)
{
    return hw::dispcnt::bg0_enable << static_cast<u8>(layer);
}


void VideoControl::enter_mode(Mode mode)
{
    u16 disable = 0;

    for (u8 i = 0; i < 4; ++i) {
        const auto l = static_cast<Layer>(i);
        if (not mode_has_layer(mode, l)) {
            disable |= layer_bit(l);
        }
    }

    modify_dispcnt(hw::dispcnt::mode_mask | disable, static_cast<u16>(mode));
}


bool VideoControl::layer_available(Layer layer) const
{
    return mode_has_layer(mode(), layer);
}


bool VideoControl::enable_layer(Layer layer)
{
    if (not layer_available(layer)) {
        return false;
    }

    modify_dispcnt(0, layer_bit(layer));
    return true;
}


bool VideoControl::disable_layer(Layer layer)
{
    if (not layer_available(layer)) {
        return false;
    }

    modify_dispcnt(layer_bit(layer), 0);
    return true;
}


bool VideoControl::layer_enabled(Layer layer) const
{
    return hw::DispCnt::cell().read() & layer_bit(layer);
}


std::optional<LayerHandle> VideoControl::layer(Layer layer) const
{
    if (not layer_available(layer)) {
        return {};
    }
    return LayerHandle(layer);
}


void VideoControl::enable_objects()
{
    modify_dispcnt(0, hw::dispcnt::obj_enable);
}


void VideoControl::disable_objects()
{
    modify_dispcnt(hw::dispcnt::obj_enable, 0);
}


bool VideoControl::objects_enabled() const
{
    return hw::DispCnt::cell().read() & hw::dispcnt::obj_enable;
}


void VideoControl::set_object_mapping(ObjectMapping mapping)
{
    if (mapping == ObjectMapping::one_dimensional) {
        modify_dispcnt(0, hw::dispcnt::obj_1d_mapping);
    } else {
        modify_dispcnt(hw::dispcnt::obj_1d_mapping, 0);
    }
}


void VideoControl::set_forced_blank(bool enabled)
{
    if (enabled) {
        modify_dispcnt(0, hw::dispcnt::forced_blank);
    } else {
        modify_dispcnt(hw::dispcnt::forced_blank, 0);
    }
}


void VideoControl::forget_tilesets()
{
    for (auto& r : resident_) {
        r = Residency{};
    }
}


void VideoControl::mark_resident(u8 cbb, u8 span, UniqueId id)
{
    // Anything overlapping the newly written char blocks has been overwritten,
    // at least in part.
    for (u8 i = 0; i < char_blocks; ++i) {
        auto& r = resident_[i];
        if (r.id_ and i < cbb + span and cbb < i + r.span_) {
            r = Residency{};
        }
    }

    resident_[cbb].id_ = id;
    resident_[cbb].span_ = span;
}


COLD void VideoControl::report_tileset_overflow(u8 cbb, u32 count)
{
    StringBuffer<80> msg("video: tileset of ");
    msg += to_string<10>(count);
    msg += " tiles does not fit at cbb ";
    msg += to_string<10>(cbb);
    warning(pfrm_, msg.c_str());
}


COLD void VideoControl::report_sprite_failure(const char* reason)
{
    StringBuffer<80> msg("video: cannot load sprite, ");
    msg += reason;
    warning(pfrm_, msg.c_str());
}
