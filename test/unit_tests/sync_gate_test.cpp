#include <catch2/catch.hpp>

#include "console_fixture.hpp"
#include "video/memoryMap.hpp"

#include <array>
#include <cstring>
#include <type_traits>
#include <utility>


TEST_CASE_METHOD(console_fixture, "SyncGate classifies the scan position")
{
    SECTION("start of a visible line")
    {
        display.seek(0, 0);
        CHECK(gate.current() == Window::visible);
    }

    SECTION("last visible cycle of a line")
    {
        display.seek(159, hw::hblank_start_cycle - 1);
        CHECK(gate.current() == Window::visible);
    }

    SECTION("first hblank cycle")
    {
        display.seek(42, hw::hblank_start_cycle);
        CHECK(gate.current() == Window::hblank);
    }

    SECTION("last cycle of the last visible line")
    {
        display.seek(159, hw::cycles_per_line - 1);
        CHECK(gate.current() == Window::hblank);
    }

    SECTION("first line of vblank")
    {
        display.seek(160, 0);
        CHECK(gate.current() == Window::vblank);
    }

    SECTION("hblank within vblank lines is still vblank")
    {
        display.seek(200, hw::hblank_start_cycle);
        CHECK(gate.current() == Window::vblank);
    }

    SECTION("last line of the frame, after the vblank flag drops")
    {
        display.seek(227, 0);
        CHECK(gate.current() == Window::vblank);
    }
}


TEST_CASE_METHOD(console_fixture, "SyncGate::wait_for")
{
    SECTION("vblank from the top of the frame")
    {
        gate.wait_for(Window::vblank);
        CHECK(gate.current() == Window::vblank);
        CHECK(display.line() == hw::visible_lines);
        CHECK(display.frame() == 0);
    }

    SECTION("vblank from inside vblank waits for the next one")
    {
        display.seek(200, 0);
        gate.wait_for(Window::vblank);
        CHECK(display.line() == hw::visible_lines);
        CHECK(display.frame() == 1);
    }

    SECTION("hblank from inside hblank waits for the next line's")
    {
        display.seek(10, 1000);
        gate.wait_for(Window::hblank);
        CHECK(gate.current() == Window::hblank);
        CHECK(display.line() == 11);
        CHECK(display.cycle() >= hw::hblank_start_cycle);
    }

    SECTION("vblank is never granted early, wherever the wait starts")
    {
        const std::array<std::pair<u16, u16>, 6> starts{{{0, 0},
                                                         {80, 500},
                                                         {159, 959},
                                                         {159, 960},
                                                         {159, 1231},
                                                         {227, 1200}}};

        for (auto& start : starts) {
            display.seek(start.first, start.second);
            gate.wait_for(Window::vblank);
            CHECK(display.line() >= hw::visible_lines);
            CHECK(display.line() < hw::visible_lines + 1);
            CHECK(gate.current() == Window::vblank);
        }
    }

    SECTION("visible from vblank")
    {
        display.seek(170, 0);
        gate.wait_for(Window::visible);
        CHECK(gate.current() == Window::visible);
        CHECK(display.line() == 0);
    }
}


TEST_CASE_METHOD(console_fixture, "SimulatedDisplay stepping")
{
    SECTION("a whole-line step is clamped, and hblank is still reached")
    {
        CHECK(display.set_step(hw::cycles_per_line) ==
              SimulatedDisplay::max_step);

        display.seek(10, 0);
        gate.wait_for(Window::hblank);
        CHECK(gate.current() == Window::hblank);
        CHECK(display.line() == 10);
    }

    SECTION("a whole-frame step is clamped, and vblank is still reached")
    {
        display.set_step(hw::cycles_per_frame);
        gate.wait_for(Window::vblank);
        CHECK(display.line() == hw::visible_lines);
        CHECK(display.frame() == 0);
    }

    SECTION("a zero step still moves")
    {
        CHECK(display.set_step(0) == 1);
        display.poll();
        CHECK(display.cycle() == 1);
    }

    SECTION("a cycle source is capped like the fixed step")
    {
        display.set_cycle_source([]() -> u32 { return hw::cycles_per_line; });

        display.seek(10, 0);
        display.poll();
        CHECK(display.cycle() == SimulatedDisplay::max_step);

        gate.wait_for(Window::hblank);
        CHECK(display.line() == 10);
    }

    SECTION("a huge advance counts whole frames without wrapping")
    {
        display.seek(100, 0);

        const u32 cycles = 0xffffffff;
        const u64 position = u64(100) * hw::cycles_per_line + cycles;
        const u64 in_frame = position % hw::cycles_per_frame;

        display.advance(cycles);

        CHECK(display.frame() == position / hw::cycles_per_frame);
        CHECK(display.line() == in_frame / hw::cycles_per_line);
        CHECK(display.cycle() == in_frame % hw::cycles_per_line);
    }
}


TEST_CASE_METHOD(console_fixture, "Blank tokens")
{
    SECTION("a vblank token records where it was granted")
    {
        auto vblank = gate.vblank();
        CHECK(vblank.window() == Window::vblank);
        CHECK(vblank.line() == hw::visible_lines);
    }

    SECTION("an hblank token")
    {
        display.seek(20, 0);
        auto hblank = gate.hblank();
        CHECK(hblank.window() == Window::hblank);
        CHECK(hblank.line() == 20);
    }

    SECTION("closing inside the window is not an overrun")
    {
        {
            auto vblank = gate.vblank();
            display.advance(hw::cycles_per_line * 30);
        }
        CHECK(gate.overrun_count() == 0);
    }

    SECTION("closing after vblank has ended is an overrun")
    {
        gate.report_overruns(false);
        {
            auto vblank = gate.vblank();
            display.advance(hw::cycles_per_line * 70);
            CHECK(gate.current() == Window::visible);
        }
        CHECK(gate.overrun_count() == 1);
    }

    SECTION("an hblank token is only good for its own line")
    {
        gate.report_overruns(false);
        display.seek(30, 0);
        {
            auto hblank = gate.hblank();
            display.advance(hw::cycles_per_line);
            CHECK(gate.current() == Window::hblank);
        }
        CHECK(gate.overrun_count() == 1);
    }

    SECTION("moving a token transfers the check")
    {
        gate.report_overruns(false);
        {
            auto vblank = gate.vblank();
            auto moved = std::move(vblank);
            display.advance(hw::cycles_per_line * 70);
        }
        CHECK(gate.overrun_count() == 1);
    }

    SECTION("tokens move without throwing")
    {
        CHECK(std::is_nothrow_move_constructible<VBlank>::value);
        CHECK(std::is_nothrow_move_constructible<HBlank>::value);
    }
}


TEST_CASE("window_name")
{
    CHECK(std::strcmp(window_name(Window::visible), "visible") == 0);
    CHECK(std::strcmp(window_name(Window::hblank), "hblank") == 0);
    CHECK(std::strcmp(window_name(Window::vblank), "vblank") == 0);
}
