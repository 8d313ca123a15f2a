#include "keypad.hpp"
#include "video/memoryMap.hpp"
#include <algorithm>


Keypad::Keypad()
{
    prev_.fill(false);
    states_.fill(false);
}


void Keypad::poll()
{
    std::copy(std::begin(states_), std::end(states_), std::begin(prev_));

    // Active low: a cleared bit is a pressed key.
    const u16 keys = ~hw::KeyInput::cell().read();

    for (int i = 0; i < int(Key::count); ++i) {
        states_[i] = keys & (1 << i);
    }
}


u16 Keypad::pressed_mask() const
{
    u16 mask = 0;
    for (int i = 0; i < int(Key::count); ++i) {
        if (states_[i]) {
            mask |= 1 << i;
        }
    }
    return mask;
}
