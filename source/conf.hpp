#pragma once

#include "string.hpp"
#include <variant>


class Platform;


// Built-in configuration, used by the console build and whenever the desktop
// build cannot read its ini file.
extern const char* const default_conf;


class Conf {
public:
    Conf(Platform& pfrm) : pfrm_(pfrm)
    {
    }

    using Bool = bool;
    using Integer = int;
    using String = StringBuffer<31>;
    using Value = std::variant<std::monostate, Bool, Integer, String>;

    // Values spelled "true" or "false" are read as Bool, optionally signed
    // digit strings as Integer, anything else as String. A missing key yields
    // std::monostate.
    Value get(const char* section, const char* key);

    template <typename T> T expect(const char* section, const char* key)
    {
        const auto v = get(section, key);

        if (auto val = std::get_if<T>(&v)) {
            return *val;
        } else {
            fatal(section, key);
        }
    }

    template <typename T>
    T value_or(const char* section, const char* key, T fallback)
    {
        const auto v = get(section, key);

        if (auto val = std::get_if<T>(&v)) {
            return *val;
        } else {
            return fallback;
        }
    }

    // As above, and also falls back, with a warning, when the value lies
    // outside [min, max].
    Integer value_or(const char* section,
                     const char* key,
                     Integer fallback,
                     Integer min,
                     Integer max);

private:
    [[noreturn]] void fatal(const char* section, const char* key);

    Platform& pfrm_;
};
