#include "platform/platform.hpp"
#include "simulatedDisplay.hpp"


#include "SFML/System.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <popl/popl.hpp>
#include <string>


void start(Platform&, u32 frame_limit);


// The console's cpu clock, 2^24 Hz.
static constexpr u64 cycles_per_second = 16777216;


int main(int argc, char** argv)
{
    popl::OptionParser op("Allowed options");
    auto help_option =
        op.add<popl::Switch>("h", "help", "produce help message");
    auto config_option = op.add<popl::Value<std::string>>(
        "c", "config", "ini configuration file", "vgate.ini");
    auto frames_option = op.add<popl::Value<int>>(
        "f", "frames", "number of frames to run, overrides demo.frames", 0);
    auto realtime_option = op.add<popl::Switch>(
        "r", "realtime", "advance the simulated display with the wall clock");

    try {
        op.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n' << op.help() << '\n';
        return EXIT_FAILURE;
    }

    if (help_option->is_set()) {
        std::cout << op.help() << '\n';
        return EXIT_SUCCESS;
    }

    Platform pf(config_option->value().c_str());

    sf::Clock clock;

    if (realtime_option->is_set()) {
        // The display never moves more than max_step per poll, so after a
        // long sleep the simulation falls behind the wall clock.
        SimulatedDisplay::instance().set_cycle_source([&clock]() -> u32 {
            sf::sleep(sf::microseconds(10));
            const u64 elapsed = clock.restart().asMicroseconds();
            return u32(std::min<u64>(elapsed * cycles_per_second / 1000000,
                                     SimulatedDisplay::max_step));
        });
        info(pf, "desktop: pacing the display with the wall clock");
    }

    const int frames = frames_option->value();
    start(pf, frames > 0 ? frames : 0);

    return EXIT_SUCCESS;
}
