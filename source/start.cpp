#include "conf.hpp"
#include "frameLoop.hpp"
#include "memory/buffer.hpp"
#include "platform/platform.hpp"
#include "util.hpp"
#include "video/memoryMap.hpp"
#include "video/palette.hpp"
#include "video/videoControl.hpp"
#include <climits>


// Demo: sprites fired outward from the center of the screen, each claiming an
// oam slot for as long as it stays on screen, with a text readout of the frame
// counter and slot usage on bg0.


static constexpr u8 hud_sbb = 30;
static constexpr u8 font_cbb = 0;
static constexpr u16 hud_width = 30;


// Placeholder glyphs for the printable ascii range. Each glyph draws its
// character code as a column of bars, which is enough to tell glyphs apart in
// a vram viewer.
static constexpr std::array<TileBitmap<ColorMode::bit4>, 95> make_font()
{
    std::array<TileBitmap<ColorMode::bit4>, 95> font{};

    for (u32 i = 1; i < font.size(); ++i) {
        const u32 code = i + 0x20;
        for (u32 row = 0; row < 8; ++row) {
            const bool bar = code & (1 << (row % 7));
            // Two halfwords per row, four pixels each.
            font[i].data_[row * 2] = bar ? 0x1111 : 0x0000;
            font[i].data_[row * 2 + 1] = bar ? 0x0011 : 0x0000;
        }
    }

    return font;
}


static constexpr auto font_tiles = make_font();


READ_ONLY_DATA
static constexpr std::array<TileBitmap<ColorMode::bit4>, 1> bullet_tiles{{
    {{0x0000,
      0x0000,
      0x1100,
      0x0011,
      0x2210,
      0x0122,
      0x2210,
      0x0122,
      0x2210,
      0x0122,
      0x2210,
      0x0122,
      0x1100,
      0x0011,
      0x0000,
      0x0000}},
}};


static constexpr Palette16 demo_palette{Color::from_hex(0x000010),
                                        Color::from_hex(0xf03808),
                                        Color::from_hex(0xfef7ee)};


static constexpr std::array<Vec2<s16>, 8> directions{{
    {1, 0},
    {1, 1},
    {0, 1},
    {-1, 1},
    {-1, 0},
    {-1, -1},
    {0, -1},
    {1, -1},
}};


class Demo : public FrameClient {
public:
    Demo(Platform& pfrm, VideoControl& video, ObjectAllocator& objects);

    void logic(Platform& pfrm, ConsoleState& state, const Keypad& keys) override;

    void draw(Platform& pfrm,
              const ConsoleState& state,
              const VBlank& vblank) override;

    u32 spawn_failures() const
    {
        return spawn_failures_;
    }

private:
    struct Bullet {
        ObjectHandle handle_;
        Vec2<s16> position_;
        Vec2<s16> velocity_;
    };

    void load_assets(Platform& pfrm, const VBlank& vblank);

    void spawn(Platform& pfrm);

    VideoControl& video_;
    ObjectAllocator& objects_;
    Buffer<Bullet, ObjectAllocator::capacity> bullets_;

    Sprite<ColorMode::bit4> bullet_sprite_;
    Tileset<ColorMode::bit4> font_;
    std::optional<u16> bullet_tile_;

    u32 spawn_interval_;
    u32 report_interval_;
    s16 speed_;
    u32 spawned_ = 0;
    u32 spawn_failures_ = 0;
    bool loaded_ = false;

    StringBuffer<hud_width> hud_;
};


Demo::Demo(Platform& pfrm, VideoControl& video, ObjectAllocator& objects)
    : video_(video), objects_(objects),
      bullet_sprite_(VGATE_SPRITE(bullet_tiles, Shape::_1x1)),
      font_(VGATE_TILESET(font_tiles))
{
    Conf conf(pfrm);

    spawn_interval_ = conf.value_or("demo", "spawn_interval", 4, 1, 3600);
    report_interval_ = conf.value_or("demo", "report_interval", 60, 1, 3600);
    speed_ = conf.value_or("demo", "bullet_speed", 2, 1, 16);

    video_.reset_display_control();
    video_.enter_mode(Mode::text);
    video_.set_object_mapping(ObjectMapping::one_dimensional);
    video_.enable_objects();
    video_.enable_layer(Layer::bg0);

    if (auto layer = video_.layer(Layer::bg0)) {
        layer->set_priority(3);
        layer->set_cbb(font_cbb);
        layer->set_sbb(hud_sbb);
        layer->set_color_mode(ColorMode::bit4);
        layer->set_text_size(TextSize::_32x32);
        layer->set_offset(0, 0);
    }
}


void Demo::spawn(Platform& pfrm)
{
    auto handle = objects_.acquire();
    if (not handle) {
        if (spawn_failures_++ == 0) {
            warning(pfrm, "demo: out of object slots");
        }
        return;
    }

    const auto dir = directions[spawned_++ % directions.size()];

    bullets_.push_back(Bullet{std::move(*handle),
                              {hw::screen_width / 2 - 4,
                               hw::screen_height / 2 - 4},
                              {s16(dir.x * speed_), s16(dir.y * speed_)}});
}


void Demo::logic(Platform& pfrm, ConsoleState& state, const Keypad& keys)
{
    if (keys.down_transition<Key::action_1>()) {
        // Destroying the handles releases their slots, the entries are hidden
        // at the next vblank.
        bullets_.clear();
    }

    state.every(0, spawn_interval_, [&] { spawn(pfrm); });

    for (auto it = bullets_.begin(); it not_eq bullets_.end();) {
        it->position_.x += it->velocity_.x;
        it->position_.y += it->velocity_.y;

        const auto& pos = it->position_;
        if (pos.x < -8 or pos.y < -8 or pos.x > hw::screen_width or
            pos.y > hw::screen_height) {
            it = bullets_.erase(it);
        } else {
            ++it;
        }
    }

    hud_ = "FRAME ";
    hud_ += to_string<10>(state.frame());
    hud_ += " OBJ ";
    hud_ += to_string<10>(objects_.allocated_count());

    state.every(0, report_interval_, [&] {
        StringBuffer<80> msg("demo: frame ");
        msg += to_string<10>(state.frame());
        msg += ", objects ";
        msg += to_string<10>(objects_.allocated_count());
        msg += ", spawn failures ";
        msg += to_string<10>(spawn_failures_);
        info(pfrm, msg.c_str());
    });
}


void Demo::load_assets(Platform& pfrm, const VBlank& vblank)
{
    load_palette_bank(0, demo_palette, vblank);
    load_object_palette_bank(0, demo_palette, vblank);

    if (not video_.load_tileset(font_cbb, font_, vblank)) {
        error(pfrm, "demo: failed to load font");
    }

    if (auto hud = ScreenBlock::open(hud_sbb)) {
        hud->fill(Tile::empty(), vblank);
    }

    bullet_tile_ = video_.load_sprite(bullet_sprite_, vblank);
    if (not bullet_tile_) {
        error(pfrm, "demo: failed to load bullet sprite");
    }

    loaded_ = true;
}


void Demo::draw(Platform& pfrm, const ConsoleState&, const VBlank& vblank)
{
    if (not loaded_) {
        load_assets(pfrm, vblank);
    }

    for (auto& bullet : bullets_) {
        ObjectAttributes attrs;
        attrs.set_shape(Shape::_1x1);
        attrs.set_position(bullet.position_.x, bullet.position_.y);
        attrs.set_tile(bullet_tile_ ? *bullet_tile_ : 0);
        attrs.set_priority(1);
        objects_.write_attributes(bullet.handle_, attrs, vblank);
    }

    if (auto hud = ScreenBlock::open(hud_sbb)) {
        hud->draw(EmptyLine(hud_width), {1, 1}, vblank);
        hud->draw(Text(hud_.c_str()), {1, 1}, vblank);
    }
}


void start(Platform& pfrm, u32 frame_limit)
{
    Conf conf(pfrm);

    if (frame_limit == 0) {
        frame_limit = conf.value_or("demo", "frames", 0, 0, INT_MAX);
    }

    ObjectAllocator objects;
    VideoControl video(pfrm);
    FrameDriver driver(pfrm, objects);
    Demo demo(pfrm, video, objects);

    driver.start();

    const u32 frames = driver.run(demo, frame_limit);

    StringBuffer<80> msg("demo: ran ");
    msg += to_string<10>(frames);
    msg += " frames, ";
    msg += to_string<10>(driver.gate().overrun_count());
    msg += " blanking overruns";
    info(pfrm, msg.c_str());
}
