#include <catch2/catch.hpp>

#include "bitvector.hpp"


TEST_CASE("Bitvector")
{
    Bitvector<20> bits;

    CHECK(bits.size() == 20);
    CHECK_FALSE(bits.any());
    CHECK(bits.count() == 0);
    CHECK(bits.first_clear() == 0);

    SECTION("set and get")
    {
        bits.set(3, true);
        bits.set(17, true);
        CHECK(bits.get(3));
        CHECK(bits[17]);
        CHECK_FALSE(bits.get(4));
        CHECK(bits.count() == 2);
        CHECK(bits.any());

        bits.set(3, false);
        CHECK_FALSE(bits.get(3));
        CHECK(bits.count() == 1);

        bits.clear();
        CHECK_FALSE(bits.any());
    }

    SECTION("first_clear skips full bytes")
    {
        for (u32 i = 0; i < 11; ++i) {
            bits.set(i, true);
        }
        CHECK(bits.first_clear() == 11);

        bits.set(5, false);
        CHECK(bits.first_clear() == 5);
    }

    SECTION("first_clear ignores the padding past the last bit")
    {
        for (u32 i = 0; i < 20; ++i) {
            bits.set(i, true);
        }
        CHECK_FALSE(bits.first_clear().has_value());
        CHECK(bits.count() == 20);
    }
}


TEST_CASE("Bitvector with a whole number of bytes")
{
    Bitvector<128> bits;

    for (u32 i = 0; i < 128; ++i) {
        REQUIRE(bits.first_clear() == i);
        bits.set(i, true);
    }

    CHECK_FALSE(bits.first_clear().has_value());
}
