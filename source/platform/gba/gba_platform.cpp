////////////////////////////////////////////////////////////////////////////////
//
//
// Gameboy Advance Platform
//
//
////////////////////////////////////////////////////////////////////////////////


#include "conf.hpp"
#include "platform/platform.hpp"
#include "video/volatile.hpp"
#include "string.hpp"
#include <algorithm>
#include <array>

#include <gba_interrupt.h>
#include <gba_systemcalls.h>


Platform::DeviceName Platform::device_name() const
{
    return "GameboyAdvance";
}


u8* region_base(Region region)
{
    switch (region) {
    case Region::io:
        return reinterpret_cast<u8*>(0x04000000);

    case Region::palette:
        return reinterpret_cast<u8*>(0x05000000);

    case Region::vram:
        return reinterpret_cast<u8*>(0x06000000);

    case Region::oam:
        return reinterpret_cast<u8*>(0x07000000);
    }
    return nullptr;
}


////////////////////////////////////////////////////////////////////////////////
// Logger
////////////////////////////////////////////////////////////////////////////////


static Severity log_threshold = Severity::warning;


void Platform::Logger::set_threshold(Severity severity)
{
    log_threshold = severity;
}


Severity Platform::Logger::threshold() const
{
    return log_threshold;
}


// Debug output registers of the mGBA emulator. Harmless on hardware, where
// nothing is mapped at these addresses.
static void mgba_log(const char* msg)
{
    *reinterpret_cast<volatile u16*>(0x4FFF780) = 0xC0DE;

    int max_characters_per_line = 256;
    auto reg_debug_string = reinterpret_cast<char*>(0x4FFF600);
    int characters_left = str_len(msg);

    while (characters_left > 0) {
        volatile u16& reg_debug_flags = *reinterpret_cast<u16*>(0x4FFF700);

        int characters_to_write =
            std::min(characters_left, max_characters_per_line);
        __builtin_memcpy(reg_debug_string, msg, characters_to_write);
        reg_debug_flags = 2 | 0x100;
        msg += characters_to_write;
        characters_left -= characters_to_write;
    }
}


void Platform::Logger::log(Severity level, const char* msg)
{
    if (static_cast<int>(level) < static_cast<int>(::log_threshold)) {
        return;
    }

    std::array<char, 256> buffer;

    buffer[1] = ':';

    switch (level) {
    case Severity::debug:
        buffer[0] = 'd';
        break;

    case Severity::info:
        buffer[0] = 'i';
        break;

    case Severity::warning:
        buffer[0] = 'w';
        break;

    case Severity::error:
        buffer[0] = 'E';
        break;

    case Severity::fatal:
        buffer[0] = 'f';
        break;

    case Severity::count:
        return;
    }

    const auto msg_size = str_len(msg);

    u32 i;
    constexpr u32 prefix_size = 2;

    for (i = 0; i < std::min(msg_size, u32(buffer.size() - (prefix_size + 1)));
         ++i) {
        buffer[i + prefix_size] = msg[i];
    }
    buffer[i + prefix_size] = '\0';

    mgba_log(buffer.data());
}


Platform::Logger::Logger()
{
}


////////////////////////////////////////////////////////////////////////////////
// Platform
////////////////////////////////////////////////////////////////////////////////


Platform::Platform(const char*)
{
    irqInit();
    irqEnable(IRQ_VBLANK);

    Conf conf(*this);

    const auto severity = conf.get("logging", "severity");
    if (auto name = std::get_if<Conf::String>(&severity)) {
        if (*name == "debug") {
            logger().set_threshold(Severity::debug);
        } else if (*name == "info") {
            logger().set_threshold(Severity::info);
        } else if (*name == "error") {
            logger().set_threshold(Severity::error);
        }
    }

    info(*this, "platform: GameboyAdvance ready");
}


Platform::~Platform()
{
}


void Platform::fatal(const char* msg)
{
    logger().log(Severity::fatal, msg);

    irqDisable(IRQ_VBLANK);

    SoftReset(ROM_RESTART), __builtin_unreachable();
}


const char* Platform::config_data() const
{
    return default_conf;
}


bool Platform::is_running() const
{
    return true;
}


void Platform::poll_scanline()
{
}


void Platform::wait_vblank_interrupt()
{
    VBlankIntrWait();
}
