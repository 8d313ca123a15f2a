#include "conf.hpp"
#include "platform/platform.hpp"
#include "util.hpp"
#include <climits>
#include <optional>


static bool is_whitespace(char c)
{
    return c == ' ' or c == '\n' or c == '\r' or c == '\t';
}


static bool is_ascii_num(char c)
{
    return c > 47 and c < 58;
}


// Nullopt when the digits do not fit in an int.
static std::optional<int> conf_atoi(const char* string)
{
    long long result = 0;
    unsigned int digit;
    int sign;

    // The parser only passes in trimmed strings, no need to skip blanks.

    if (*string == '-') {
        sign = 1;
        string += 1;
    } else {
        sign = 0;
        if (*string == '+') {
            string += 1;
        }
    }

    const long long limit = sign ? -(long long)INT_MIN : INT_MAX;

    for (;; string += 1) {
        digit = *string - '0';
        if (digit > 9) {
            break;
        }
        result = (10 * result) + digit;
        if (result > limit) {
            return {};
        }
    }

    if (sign) {
        return int(-result);
    }
    return int(result);
}


// A non-conforming ini parser. Each lookup rescans the text from the start, and
// uses no more than a few bytes of stack.
static Conf::String get_conf(const char* data, const char* section, const char* key)
{
    const int section_len = str_len(section);
    const int key_len = str_len(key);

    enum State {
        seek_section,
        match_section,
        seek_key,
        read_value
    } state = State::seek_section;

    Conf::String result;

#define EAT_LINE()                                                             \
    while (true) {                                                             \
        if (*data == '\0') {                                                   \
            return result;                                                     \
        }                                                                      \
        if (*data == '\n') {                                                   \
            goto TOP;                                                          \
        }                                                                      \
        ++data;                                                                \
    }

    while (*data not_eq '\0') {
    TOP:
        switch (state) {
        case State::seek_section:
            if (*data == '#') {
                EAT_LINE();
            }
            if (*data == '[') {
                state = State::match_section;
            }
            ++data;
            break;

        case State::match_section: {
            for (int i = 0; i < section_len; ++i) {
                if (data[i] == '\0') {
                    return result;
                }
                if (data[i] == ']') {
                    state = State::seek_section;
                    data += i;
                    goto TOP;
                }
                if (data[i] not_eq section[i]) {
                    state = State::seek_section;
                    goto TOP;
                }
            }
            data += section_len;
            bool matched = true;
            while (true) {
                if (*data == '\0') {
                    return result;
                }
                if (*data == ']') {
                    ++data;
                    break;
                } else if (not is_whitespace(*data)) {
                    // Longer section name sharing our prefix.
                    matched = false;
                }
                ++data;
            }
            state = matched ? State::seek_key : State::seek_section;
            break;
        }

        case State::seek_key: {
            while (true) {
                if (*data == '\0' or *data == '[') {
                    return result;
                }
                if (*data == '#') {
                    EAT_LINE();
                }
                if (not is_whitespace(*data)) {
                    break;
                }
                ++data;
            }
            for (int i = 0; i < key_len; ++i) {
                if (data[i] == '\0') {
                    return result;
                }
                if (key[i] not_eq data[i]) {
                    while (true) {
                        if (*data == '\0') {
                            return result;
                        }
                        if (*data == '\n') {
                            state = State::seek_key;
                            ++data;
                            goto TOP;
                        }
                        ++data;
                    }
                }
            }
            data += key_len;
            while (true) {
                if (*data == '\0') {
                    return result;
                }
                if (*data == '=') {
                    ++data;
                    break;
                } else if (not is_whitespace(*data)) {
                    while (true) {
                        if (*data == '\0') {
                            return result;
                        }
                        if (*data == '\n') {
                            state = State::seek_key;
                            ++data;
                            goto TOP;
                        }
                        ++data;
                    }
                }
                ++data;
            }
            state = State::read_value;
            break;
        }

        case State::read_value: {
            while (*data == ' ' or *data == '\t') {
                ++data;
            }
            while (true) {
                if (*data == '\0' or *data == '#') {
                    return result;
                }
                if (is_whitespace(*data)) {
                    return result;
                }
                result.push_back(*data);
                ++data;
            }
            break;
        }
        }
    }
    return result;
}


Conf::Value Conf::get(const char* section, const char* key)
{
    auto buf = get_conf(pfrm_.config_data(), section, key);

    if (buf.empty()) {
        return {};
    }

    if (buf == "true") {
        return true;
    } else if (buf == "false") {
        return false;
    }

    const bool is_numeric = [&buf] {
        auto it = buf.begin();
        if (*it == '-' or *it == '+') {
            ++it;
            if (it == buf.end()) {
                return false;
            }
        }
        for (; it not_eq buf.end(); ++it) {
            if (not is_ascii_num(*it)) {
                return false;
            }
        }
        return true;
    }();

    if (is_numeric) {
        if (auto num = conf_atoi(buf.c_str())) {
            return *num;
        }
    }

    return buf;
}


Conf::Integer Conf::value_or(const char* section,
                             const char* key,
                             Integer fallback,
                             Integer min,
                             Integer max)
{
    const auto v = get(section, key);

    if (auto val = std::get_if<Integer>(&v)) {
        if (*val >= min and *val <= max) {
            return *val;
        }
    }

    if (not std::holds_alternative<std::monostate>(v)) {
        StringBuffer<96> msg("conf: ");
        msg += section;
        msg += ".";
        msg += key;
        msg += " is not an integer from ";
        msg += to_string<12>(min);
        msg += " to ";
        msg += to_string<12>(max);
        warning(pfrm_, msg.c_str());
    }

    return fallback;
}


COLD void Conf::fatal(const char* section, const char* key)
{
    StringBuffer<64> err;
    err += "conf: missing or mistyped ";
    err += section;
    err += ".";
    err += key;

    pfrm_.fatal(err.c_str());
}


const char* const default_conf = "# Built-in defaults\n"
                                 "[logging]\n"
                                 "severity = info\n"
                                 "[sync]\n"
                                 "report_overruns = true\n"
                                 "[simulator]\n"
                                 "cycles_per_poll = 64\n"
                                 "[demo]\n"
                                 "frames = 600\n"
                                 "spawn_interval = 4\n"
                                 "bullet_speed = 2\n"
                                 "report_interval = 60\n";
