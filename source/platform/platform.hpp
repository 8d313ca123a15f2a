#pragma once


#include "number/numeric.hpp"
#include "string.hpp"


// Anything platform specific should be declared here. There are two
// implementations: platform/gba, which runs on the console, and
// platform/desktop, which backs the hardware registers with a simulated
// display so that the video layer can run (and be tested) on a host machine.


enum class Severity { debug, info, warning, error, fatal, count };


////////////////////////////////////////////////////////////////////////////////
// Platform
////////////////////////////////////////////////////////////////////////////////


class Platform {
public:
    class Logger;

    // The desktop implementation reads its configuration from config_path,
    // falling back to the built-in defaults when the file cannot be read. On
    // the console, the configuration is always the built-in one.
    explicit Platform(const char* config_path = nullptr);

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    ~Platform();

    using DeviceName = StringBuffer<23>;
    DeviceName device_name() const;

    inline Logger& logger()
    {
        return logger_;
    }

    // On the console, fatal() performs a soft reset via the BIOS. When
    // running as a process within an OS, it exits instead. In any event,
    // fatal() does not return.
    [[noreturn]] void fatal(const char* msg);

    // Ini formatted text, see conf.hpp.
    const char* config_data() const;

    bool is_running() const;

    // Called by loops that busy-wait on the scanline counter. On hardware there
    // is nothing to do, the counter advances on its own. The desktop
    // implementation advances its simulated display.
    void poll_scanline();

    // Halt until the next vertical blank interrupt. Returns immediately if the
    // platform has no interrupt to wait on, callers must still poll the
    // scanline counter afterwards.
    void wait_vblank_interrupt();


    ////////////////////////////////////////////////////////////////////////////
    // Logger
    ////////////////////////////////////////////////////////////////////////////


    class Logger {
    public:
        void log(Severity severity, const char* msg);

        void set_threshold(Severity severity);

        Severity threshold() const;

    private:
        Logger();

        friend class Platform;
    };


private:
    Logger logger_;
};


#ifdef __VGATE_ENABLE_LOGS
inline void debug(Platform& pf, const char* msg)
{
    pf.logger().log(Severity::debug, msg);
}
inline void info(Platform& pf, const char* msg)
{
    pf.logger().log(Severity::info, msg);
}
inline void warning(Platform& pf, const char* msg)
{
    pf.logger().log(Severity::warning, msg);
}
inline void error(Platform& pf, const char* msg)
{
    pf.logger().log(Severity::error, msg);
}
#else
inline void debug(Platform&, const char*)
{
}
inline void info(Platform&, const char*)
{
}
inline void warning(Platform&, const char*)
{
}
inline void error(Platform&, const char*)
{
}
#endif // __VGATE_ENABLE_LOGS
