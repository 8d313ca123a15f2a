#include <catch2/catch.hpp>

#include "console_fixture.hpp"
#include "video/object.hpp"

#include <cstring>
#include <type_traits>
#include <utility>
#include <vector>


namespace {

template <typename Token, typename = void>
struct releases_with : std::false_type {
};

template <typename Token>
struct releases_with<
    Token,
    std::void_t<decltype(std::declval<ObjectAllocator&>().release(
        std::declval<ObjectHandle&&>(),
        std::declval<const Token&>()))>> : std::true_type {
};

template <typename Token, typename = void>
struct writes_attributes_with : std::false_type {
};

template <typename Token>
struct writes_attributes_with<
    Token,
    std::void_t<decltype(std::declval<ObjectAllocator&>().write_attributes(
        std::declval<const ObjectHandle&>(),
        std::declval<const ObjectAttributes&>(),
        std::declval<const Token&>()))>> : std::true_type {
};


// The three attribute halfwords of an oam entry.
std::array<u16, 3> oam_entry(u8 index)
{
    std::array<u16, 3> attrs;
    std::memcpy(attrs.data(),
                SimulatedDisplay::instance().region(Region::oam) + index * 8,
                sizeof attrs);
    return attrs;
}

} // namespace


TEST_CASE("ObjectAttributes encoding")
{
    ObjectAttributes attrs;

    SECTION("position wraps to the hardware's field widths")
    {
        attrs.set_position(-8, -8);
        CHECK(attrs.x() == 0x1f8);
        CHECK(attrs.y() == 0xf8);

        attrs.set_position(100, 50);
        CHECK(attrs.x() == 100);
        CHECK(attrs.y() == 50);
    }

    SECTION("shape and size are split across attr0 and attr1")
    {
        attrs.set_shape(Shape::_4x2);
        CHECK(attrs.shape() == Shape::_4x2);
        CHECK((attrs.attr0() >> 14) == 1);
        CHECK((attrs.attr1() >> 14) == 2);

        attrs.set_shape(Shape::_1x4);
        CHECK((attrs.attr0() >> 14) == 2);
        CHECK((attrs.attr1() >> 14) == 1);
    }

    SECTION("setters leave the other fields alone")
    {
        attrs.set_tile(0x3ff);
        attrs.set_priority(2);
        attrs.set_palette_bank(0xa);
        attrs.set_flip(true, false);
        attrs.set_x(0x1ff);

        CHECK(attrs.tile() == 0x3ff);
        CHECK(attrs.priority() == 2);
        CHECK(attrs.palette_bank() == 0xa);
        CHECK(attrs.x() == 0x1ff);
        CHECK((attrs.attr1() & (1 << 12)));
        CHECK_FALSE((attrs.attr1() & (1 << 13)));

        attrs.set_tile(5);
        CHECK(attrs.tile() == 5);
        CHECK(attrs.priority() == 2);
    }

    SECTION("hidden")
    {
        CHECK_FALSE(attrs.hidden());
        CHECK(ObjectAttributes::hidden_entry().hidden());

        attrs.set_y(20);
        attrs.set_hidden(true);
        CHECK(attrs.hidden());
        CHECK(attrs.y() == 20);

        attrs.set_hidden(false);
        CHECK_FALSE(attrs.hidden());
        CHECK(attrs.mode() == ObjectMode::normal);
    }

    SECTION("mode, mosaic and color depth")
    {
        attrs.set_mode(ObjectMode::alpha_blend);
        attrs.set_mosaic(true);
        attrs.set_color_mode(ColorMode::bit8);
        CHECK(attrs.mode() == ObjectMode::alpha_blend);
        CHECK(attrs.attr0() == ((1 << 10) | (1 << 12) | (1 << 13)));
    }

    CHECK(shape_tile_count(Shape::_8x8) == 64);
    CHECK(shape_tile_count(Shape::_2x4) == 8);
    CHECK(shape_tiles(Shape::_8x4) == TileSize{8, 4});
}


TEST_CASE_METHOD(console_fixture, "ObjectAllocator")
{
    ObjectAllocator objects;

    SECTION("acquire hands out the lowest free slot")
    {
        auto a = objects.acquire();
        auto b = objects.acquire();
        auto c = objects.acquire();
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(c);
        CHECK(a->index() == 0);
        CHECK(b->index() == 1);
        CHECK(c->index() == 2);
        CHECK(objects.allocated_count() == 3);
    }

    SECTION("every slot can be taken, and no more")
    {
        std::vector<ObjectHandle> handles;
        for (u32 i = 0; i < ObjectAllocator::capacity; ++i) {
            auto h = objects.acquire();
            REQUIRE(h);
            CHECK(h->index() == i);
            handles.push_back(std::move(*h));
        }

        CHECK_FALSE(objects.acquire().has_value());
        CHECK(objects.allocated_count() == ObjectAllocator::capacity);
    }

    SECTION("release hides the entry and frees the slot")
    {
        auto vblank = gate.vblank();

        auto a = objects.acquire();
        auto b = objects.acquire();
        REQUIRE(a);
        REQUIRE(b);

        ObjectAttributes attrs;
        attrs.set_position(16, 32);
        attrs.set_tile(4);
        objects.write_attributes(*a, attrs, vblank);

        CHECK(oam_entry(0)[0] == attrs.attr0());
        CHECK(oam_entry(0)[2] == 4);

        objects.release(std::move(*a), vblank);

        CHECK_FALSE(objects.is_allocated(0));
        CHECK(objects.is_allocated(1));
        CHECK(objects.pending_hide_count() == 0);
        CHECK((oam_entry(0)[0] & 0x0300) == 0x0200);
        CHECK(objects.attributes(*b) == ObjectAttributes());

        auto c = objects.acquire();
        REQUIRE(c);
        CHECK(c->index() == 0);
    }

    SECTION("handles move without throwing")
    {
        CHECK(std::is_nothrow_move_constructible<ObjectHandle>::value);
        CHECK(std::is_nothrow_move_assignable<ObjectHandle>::value);
    }

    SECTION("oam writes need a vblank")
    {
        CHECK(releases_with<VBlank>::value);
        CHECK(writes_attributes_with<VBlank>::value);

        // Oam is locked during hblank, DISPCNT never frees it.
        CHECK_FALSE(releases_with<HBlank>::value);
        CHECK_FALSE(writes_attributes_with<HBlank>::value);
        CHECK_FALSE(releases_with<Blank>::value);
        CHECK_FALSE(writes_attributes_with<Blank>::value);
    }

    SECTION("write_attributes only touches its own entry")
    {
        auto vblank = gate.vblank();

        auto a = objects.acquire();
        auto b = objects.acquire();
        REQUIRE(a);
        REQUIRE(b);

        ObjectAttributes attrs;
        attrs.set_position(1, 2);
        objects.write_attributes(*b, attrs, vblank);

        CHECK(oam_entry(1)[0] == attrs.attr0());
        CHECK(oam_entry(1)[1] == attrs.attr1());
        CHECK(oam_entry(0)[0] == 0);
        CHECK(oam_entry(2)[0] == 0);
        CHECK(objects.attributes(*b) == attrs);
    }

    SECTION("attribute writes leave the affine parameter halfword alone")
    {
        auto vblank = gate.vblank();

        auto* oam = SimulatedDisplay::instance().region(Region::oam);
        const u16 param = 0x1234;
        std::memcpy(oam + 6, &param, sizeof param);

        auto a = objects.acquire();
        REQUIRE(a);
        objects.write_attributes(*a, ObjectAttributes::hidden_entry(), vblank);

        u16 after;
        std::memcpy(&after, oam + 6, sizeof after);
        CHECK(after == 0x1234);
    }

    SECTION("dropping a handle defers the hide until flush")
    {
        auto vblank = gate.vblank();

        {
            auto a = objects.acquire();
            REQUIRE(a);
            ObjectAttributes attrs;
            attrs.set_position(8, 8);
            objects.write_attributes(*a, attrs, vblank);
        }

        CHECK_FALSE(objects.is_allocated(0));
        CHECK(objects.pending_hide_count() == 1);
        CHECK((oam_entry(0)[0] & 0x0300) == 0);

        CHECK(objects.flush(vblank) == 1);
        CHECK(objects.pending_hide_count() == 0);
        CHECK((oam_entry(0)[0] & 0x0300) == 0x0200);
        CHECK(objects.flush(vblank) == 0);
    }

    SECTION("a new owner's write cancels a pending hide")
    {
        auto vblank = gate.vblank();

        {
            auto a = objects.acquire();
            REQUIRE(a);
        }

        auto b = objects.acquire();
        REQUIRE(b);
        CHECK(b->index() == 0);

        ObjectAttributes attrs;
        attrs.set_position(3, 3);
        objects.write_attributes(*b, attrs, vblank);

        CHECK(objects.flush(vblank) == 0);
        CHECK_FALSE(objects.attributes(*b).hidden());
    }

    SECTION("move assignment releases the overwritten slot")
    {
        auto a = objects.acquire();
        auto b = objects.acquire();
        REQUIRE(a);
        REQUIRE(b);

        *a = std::move(*b);
        CHECK(a->index() == 1);
        CHECK_FALSE(objects.is_allocated(0));
        CHECK(objects.is_allocated(1));
        CHECK(objects.allocated_count() == 1);
    }

    SECTION("reset hides every entry without freeing slots")
    {
        auto vblank = gate.vblank();
        auto a = objects.acquire();
        REQUIRE(a);

        objects.reset(vblank);

        for (u8 i = 0; i < ObjectAllocator::capacity; ++i) {
            REQUIRE((oam_entry(i)[0] & 0x0300) == 0x0200);
        }
        CHECK(objects.is_allocated(0));
    }

    CHECK_FALSE(objects.is_allocated(200));
}
