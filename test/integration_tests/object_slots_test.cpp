#include <catch2/catch.hpp>

#include "console_fixture.hpp"
#include "video/object.hpp"

#include <cstring>
#include <optional>
#include <vector>


namespace {

std::array<u8, 6> oam_bytes(u8 index)
{
    std::array<u8, 6> bytes;
    std::memcpy(bytes.data(),
                SimulatedDisplay::instance().region(Region::oam) + index * 8,
                bytes.size());
    return bytes;
}

ObjectAttributes attributes_for(u8 index)
{
    ObjectAttributes attrs;
    attrs.set_position(index % 30 * 8, index / 30 * 16);
    attrs.set_shape(Shape::_2x2);
    attrs.set_tile(index);
    return attrs;
}

} // namespace


TEST_CASE_METHOD(console_fixture, "Filling every object slot, then reusing one")
{
    ObjectAllocator objects;

    std::vector<std::optional<ObjectHandle>> handles;

    {
        auto vblank = gate.vblank();
        objects.reset(vblank);

        for (u32 i = 0; i < ObjectAllocator::capacity; ++i) {
            auto handle = objects.acquire();
            REQUIRE(handle);
            CHECK(handle->index() == i);
            objects.write_attributes(*handle, attributes_for(i), vblank);
            handles.emplace_back(std::move(*handle));
        }
    }

    CHECK(objects.allocated_count() == ObjectAllocator::capacity);
    CHECK_FALSE(objects.acquire().has_value());

    std::vector<std::array<u8, 6>> before;
    for (u32 i = 0; i < ObjectAllocator::capacity; ++i) {
        before.push_back(oam_bytes(i));
    }

    {
        auto vblank = gate.vblank();
        objects.release(std::move(*handles[3]), vblank);
        handles[3].reset();
    }

    CHECK_FALSE(objects.is_allocated(3));
    CHECK(objects.attributes(*handles[4]) == attributes_for(4));

    {
        auto vblank = gate.vblank();

        auto handle = objects.acquire();
        REQUIRE(handle);
        CHECK(handle->index() == 3);

        ObjectAttributes attrs;
        attrs.set_position(200, 100);
        attrs.set_tile(99);
        objects.write_attributes(*handle, attrs, vblank);

        handles[3].emplace(std::move(*handle));
    }

    CHECK(objects.allocated_count() == ObjectAllocator::capacity);
    CHECK_FALSE(objects.acquire().has_value());

    for (u32 i = 0; i < ObjectAllocator::capacity; ++i) {
        if (i == 3) {
            CHECK(oam_bytes(i) not_eq before[i]);
            CHECK(objects.attributes(*handles[i]).tile() == 99);
        } else {
            REQUIRE(oam_bytes(i) == before[i]);
        }
    }

    CHECK(gate.overrun_count() == 0);
}


TEST_CASE_METHOD(console_fixture, "Released slots are hidden before they can show")
{
    ObjectAllocator objects;

    auto vblank = gate.vblank();

    auto a = objects.acquire();
    REQUIRE(a);
    objects.write_attributes(*a, attributes_for(0), vblank);
    CHECK_FALSE(objects.attributes(*a).hidden());

    objects.release(std::move(*a), vblank);

    ObjectAttributes in_oam;
    const auto bytes = oam_bytes(0);
    std::memcpy(&in_oam, bytes.data(), sizeof in_oam);
    CHECK(in_oam.hidden());

    auto b = objects.acquire();
    REQUIRE(b);
    CHECK(b->index() == 0);
}
