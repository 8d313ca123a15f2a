#include <catch2/catch.hpp>

#include "console_fixture.hpp"
#include "video/palette.hpp"

#include <vector>


TEST_CASE("Color")
{
    const auto c = Color::from_hex(0xff8000);
    CHECK(c.r() == 31);
    CHECK(c.g() == 16);
    CHECK(c.b() == 0);
    CHECK(c.bgr_hex_555() == (31 | (16 << 5)));

    CHECK(Color::from_bgr_hex_555(0x7fff) == Color(31, 31, 31));
    CHECK(Color(40, 0, 0).r() == (40 & 0x1f));
}


TEST_CASE_METHOD(console_fixture, "Palette loading")
{
    auto vblank = gate.vblank();

    SECTION("background palette")
    {
        const std::array<Color, 3> colors{
            Color(1, 2, 3), Color(4, 5, 6), Color(7, 8, 9)};

        CHECK(load_palette(colors.data(), colors.size(), vblank) == 3);
        CHECK(read_palette(0) == colors[0]);
        CHECK(read_palette(2) == colors[2]);
        CHECK(read_palette(3) == Color());
        CHECK(read_object_palette(0) == Color());
    }

    SECTION("object palette at an offset")
    {
        const std::array<Color, 2> colors{Color(31, 0, 0), Color(0, 31, 0)};

        CHECK(load_object_palette(10, colors.data(), colors.size(), vblank) ==
              2);
        CHECK(read_object_palette(9) == Color());
        CHECK(read_object_palette(10) == colors[0]);
        CHECK(read_object_palette(11) == colors[1]);
        CHECK(read_palette(10) == Color());
    }

    SECTION("the object palette is truncated at its last entry")
    {
        const std::vector<Color> colors(8, Color(3, 3, 3));

        CHECK(load_object_palette(252, colors.data(), colors.size(), vblank) ==
              4);
        CHECK(read_object_palette(252) == Color(3, 3, 3));
        CHECK(read_object_palette(255) == Color(3, 3, 3));

        CHECK(load_object_palette(256, colors.data(), colors.size(), vblank) ==
              0);
    }

    SECTION("the background palette stops at 256 entries")
    {
        const std::vector<Color> colors(300, Color(1, 1, 1));
        CHECK(load_palette(colors.data(), colors.size(), vblank) == 256);
        CHECK(read_object_palette(0) == Color());
    }

    SECTION("banks")
    {
        Palette16 bank;
        bank.fill(Color(5, 5, 5));

        CHECK(load_palette_bank(3, bank, vblank));
        CHECK(read_palette(47) == Color());
        CHECK(read_palette(48) == Color(5, 5, 5));
        CHECK(read_palette(63) == Color(5, 5, 5));
        CHECK(read_palette(64) == Color());

        CHECK(load_object_palette_bank(15, bank, vblank));
        CHECK(read_object_palette(255) == Color(5, 5, 5));

        CHECK_FALSE(load_palette_bank(16, bank, vblank));
        CHECK_FALSE(load_object_palette_bank(16, bank, vblank));
    }

    CHECK(read_palette(1000) == Color());
}
