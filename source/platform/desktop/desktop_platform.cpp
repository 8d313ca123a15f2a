#include "conf.hpp"
#include "platform/platform.hpp"
#include "simulatedDisplay.hpp"


////////////////////////////////////////////////////////////////////////////////
//
//
// Desktop Platform
//
//
////////////////////////////////////////////////////////////////////////////////


#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>


Platform::DeviceName Platform::device_name() const
{
    return "Desktop";
}


u8* region_base(Region region)
{
    return SimulatedDisplay::instance().region(region);
}


////////////////////////////////////////////////////////////////////////////////
// Logger
////////////////////////////////////////////////////////////////////////////////


static const char* const logfile_name = "logfile.txt";
static std::ofstream logfile_out(logfile_name);


static Severity log_threshold = Severity::info;


void Platform::Logger::set_threshold(Severity severity)
{
    log_threshold = severity;
}


Severity Platform::Logger::threshold() const
{
    return log_threshold;
}


void Platform::Logger::log(Severity level, const char* msg)
{
    if (static_cast<int>(level) < static_cast<int>(::log_threshold)) {
        return;
    }

    auto write_msg = [&](std::ostream& target) {
        target << '[' <<
            [&] {
                switch (level) {
                case Severity::debug:
                    return "debug";
                default:
                case Severity::info:
                    return "info";
                case Severity::warning:
                    return "warning";
                case Severity::error:
                    return "error";
                case Severity::fatal:
                    return "fatal";
                }
            }() << "] "
               << msg << '\n';

        if (level >= Severity::warning) {
            target << std::flush;
        }
    };

    write_msg(logfile_out);
    write_msg(std::cout);
}


Platform::Logger::Logger()
{
}


////////////////////////////////////////////////////////////////////////////////
// Platform
////////////////////////////////////////////////////////////////////////////////


static std::string config_text;


static std::optional<Severity> parse_severity(const Conf::String& name)
{
    if (name == "debug") {
        return Severity::debug;
    } else if (name == "info") {
        return Severity::info;
    } else if (name == "warning") {
        return Severity::warning;
    } else if (name == "error") {
        return Severity::error;
    }
    return {};
}


Platform::Platform(const char* config_path)
{
    bool loaded = false;

    if (config_path) {
        std::ifstream file(config_path);
        if (file) {
            std::stringstream buffer;
            buffer << file.rdbuf();
            config_text = buffer.str();
            loaded = true;
        }
    }

    if (not loaded) {
        config_text = default_conf;
    }

    Conf conf(*this);

    const auto severity = conf.get("logging", "severity");
    if (auto name = std::get_if<Conf::String>(&severity)) {
        if (auto level = parse_severity(*name)) {
            logger().set_threshold(*level);
        } else {
            warning(*this, "conf: unrecognized logging.severity");
        }
    }

    const int step =
        conf.value_or<Conf::Integer>("simulator", "cycles_per_poll", 64);
    const u32 used = SimulatedDisplay::instance().set_step(step > 0 ? step : 0);
    if (step < 0 or u32(step) not_eq used) {
        StringBuffer<96> msg("conf: simulator.cycles_per_poll out of range");
        msg += ", using ";
        msg += to_string<10>(used);
        warning(*this, msg.c_str());
    }

    if (config_path and not loaded) {
        StringBuffer<96> msg("failed to read ");
        msg += config_path;
        msg += ", using built-in configuration";
        warning(*this, msg.c_str());
    }

    StringBuffer<64> msg("platform: ");
    msg += device_name();
    msg += " ready";
    info(*this, msg.c_str());
}


Platform::~Platform()
{
}


void Platform::fatal(const char* msg)
{
    logger().log(Severity::fatal, msg);
    exit(1);
}


const char* Platform::config_data() const
{
    return config_text.c_str();
}


bool Platform::is_running() const
{
    return true;
}


void Platform::poll_scanline()
{
    SimulatedDisplay::instance().poll();
}


void Platform::wait_vblank_interrupt()
{
    // No interrupt to halt on. The scanline polling that follows does the
    // waiting.
}
