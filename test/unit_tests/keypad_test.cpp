#include <catch2/catch.hpp>

#include "console_fixture.hpp"
#include "keypad.hpp"


TEST_CASE_METHOD(console_fixture, "Keypad")
{
    Keypad keys;

    SECTION("nothing pressed")
    {
        keys.poll();
        CHECK(keys.pressed_mask() == 0);
        CHECK_FALSE(keys.any_pressed<Key::action_1, Key::start>());
    }

    SECTION("keys are read active low")
    {
        display.set_pressed_keys(key_mask(Key::action_1) | key_mask(Key::up));
        keys.poll();

        CHECK(keys.pressed<Key::action_1>());
        CHECK(keys.pressed<Key::up>());
        CHECK_FALSE(keys.pressed<Key::down>());
        CHECK(keys.all_pressed<Key::action_1, Key::up>());
        CHECK_FALSE(keys.all_pressed<Key::action_1, Key::down>());
        CHECK(keys.any_pressed<Key::down, Key::up>());
        CHECK(keys.pressed_mask() == (key_mask(Key::action_1) |
                                      key_mask(Key::up)));
    }

    SECTION("transitions")
    {
        display.set_pressed_keys(key_mask(Key::alt_1));
        keys.poll();
        CHECK(keys.down_transition<Key::alt_1>());
        CHECK_FALSE(keys.up_transition<Key::alt_1>());

        keys.poll();
        CHECK_FALSE(keys.down_transition<Key::alt_1>());
        CHECK(keys.pressed<Key::alt_1>());

        display.set_pressed_keys(0);
        keys.poll();
        CHECK(keys.up_transition<Key::alt_1>());
        CHECK_FALSE(keys.pressed<Key::alt_1>());
    }
}
