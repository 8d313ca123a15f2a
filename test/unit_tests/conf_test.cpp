#include <catch2/catch.hpp>

#include "conf.hpp"
#include "platform/platform.hpp"

#include <climits>
#include <fstream>


namespace {

const char* const test_ini = "conf_test.ini";

void write_ini(const char* text)
{
    std::ofstream out(test_ini);
    out << text;
}

} // namespace


TEST_CASE("Conf reads ini text")
{
    write_ini("# leading comment\n"
              "[logging]\n"
              "severity=error\n"
              "\n"
              "[demo_extra]\n"
              "frames=1\n"
              "[demo]\n"
              "  frames = 240   \n"
              "offset=-12\n"
              "name=bullets # trailing comment\n"
              "# frames_total=9\n"
              "enabled=true\n"
              "paused=false\n"
              "frames_total=77\n"
              "signed=+5\n"
              "dash=-\n"
              "largest=2147483647\n"
              "smallest=-2147483648\n"
              "past_largest=2147483648\n"
              "huge=99999999999999\n"
              "[other]\n"
              "frames=3\n");

    Platform pfrm(test_ini);
    Conf conf(pfrm);

    SECTION("integers")
    {
        CHECK(conf.expect<Conf::Integer>("demo", "frames") == 240);
        CHECK(conf.expect<Conf::Integer>("demo", "offset") == -12);
        CHECK(conf.expect<Conf::Integer>("demo", "signed") == 5);
        CHECK(conf.expect<Conf::Integer>("other", "frames") == 3);
    }

    SECTION("a section sharing a prefix is a different section")
    {
        CHECK(conf.expect<Conf::Integer>("demo_extra", "frames") == 1);
    }

    SECTION("a key sharing a prefix is a different key")
    {
        CHECK(conf.expect<Conf::Integer>("demo", "frames_total") == 77);
    }

    SECTION("booleans")
    {
        CHECK(conf.expect<Conf::Bool>("demo", "enabled"));
        CHECK_FALSE(conf.expect<Conf::Bool>("demo", "paused"));
    }

    SECTION("strings")
    {
        const auto name = conf.expect<Conf::String>("demo", "name");
        CHECK(name == "bullets");

        const auto dash = conf.get("demo", "dash");
        REQUIRE(std::holds_alternative<Conf::String>(dash));
        CHECK(std::get<Conf::String>(dash) == "-");
    }

    SECTION("missing values")
    {
        CHECK(std::holds_alternative<std::monostate>(
            conf.get("demo", "missing")));
        CHECK(std::holds_alternative<std::monostate>(
            conf.get("absent", "frames")));
        CHECK(std::holds_alternative<std::monostate>(
            conf.get("logging", "frames")));
    }

    SECTION("value_or")
    {
        CHECK(conf.value_or<Conf::Integer>("demo", "missing", 9) == 9);
        CHECK(conf.value_or<Conf::Integer>("demo", "name", 9) == 9);
        CHECK(conf.value_or<Conf::Integer>("demo", "frames", 9) == 240);
        CHECK(conf.value_or<Conf::Bool>("demo", "frames", true));
    }

    SECTION("integers that do not fit in an int are strings")
    {
        CHECK(conf.expect<Conf::Integer>("demo", "largest") == INT_MAX);
        CHECK(conf.expect<Conf::Integer>("demo", "smallest") == INT_MIN);

        const auto past = conf.get("demo", "past_largest");
        REQUIRE(std::holds_alternative<Conf::String>(past));
        CHECK(std::get<Conf::String>(past) == "2147483648");

        CHECK(std::holds_alternative<Conf::String>(conf.get("demo", "huge")));
    }

    SECTION("value_or with a range")
    {
        CHECK(conf.value_or("demo", "frames", 9, 1, 1000) == 240);
        CHECK(conf.value_or("demo", "frames", 9, 1, 100) == 9);
        CHECK(conf.value_or("demo", "offset", 4, 1, 16) == 4);
        CHECK(conf.value_or("demo", "offset", 4, -12, 0) == -12);
        CHECK(conf.value_or("demo", "huge", 4, 1, 16) == 4);
        CHECK(conf.value_or("demo", "name", 4, 1, 16) == 4);
        CHECK(conf.value_or("demo", "missing", 4, 1, 16) == 4);
    }

    SECTION("the platform applies the logging threshold")
    {
        CHECK(pfrm.logger().threshold() == Severity::error);
    }
}


TEST_CASE("Conf falls back to the built-in defaults")
{
    Platform pfrm("no/such/file.ini");
    pfrm.logger().set_threshold(Severity::error);

    Conf conf(pfrm);

    CHECK(conf.expect<Conf::Integer>("demo", "frames") == 600);
    CHECK(conf.expect<Conf::Integer>("simulator", "cycles_per_poll") == 64);
    CHECK(conf.expect<Conf::Bool>("sync", "report_overruns"));
    CHECK(conf.expect<Conf::String>("logging", "severity") == "info");
}
