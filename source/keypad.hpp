#pragma once

#include "number/numeric.hpp"
#include <array>


// In KEYINPUT bit order.
enum class Key : u8 {
    action_1, // A
    action_2, // B
    select,
    start,
    right,
    left,
    up,
    down,
    alt_2, // R
    alt_1, // L
    count
};


constexpr u16 key_mask(Key k)
{
    return 1 << static_cast<u8>(k);
}


// Snapshot of the keypad, taken once per frame by poll(). Also remembers the
// previous snapshot, for detecting transitions.
class Keypad {
private:
    using KeyStates = std::array<bool, int(Key::count)>;

public:
    Keypad();

    void poll();

    template <Key... k> bool all_pressed() const
    {
        return (... and states_[int(k)]);
    }

    template <Key... k> bool any_pressed() const
    {
        return (... or states_[int(k)]);
    }

    template <Key k> bool pressed() const
    {
        return states_[int(k)];
    }

    template <Key... k> bool down_transition() const
    {
        return (... or down_transition_helper<k>());
    }

    template <Key k> bool up_transition() const
    {
        return not states_[int(k)] and prev_[int(k)];
    }

    // One bit per pressed key, in KEYINPUT order.
    u16 pressed_mask() const;

private:
    template <Key k> bool down_transition_helper() const
    {
        return states_[int(k)] and not prev_[int(k)];
    }

    KeyStates prev_;
    KeyStates states_;
};
