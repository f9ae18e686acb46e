#include "debug/PrintChanges.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace FS;

namespace {

struct Settings {
    int         volume = 1;
    std::string theme  = "light";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Settings, volume, theme)

struct SetVolume {
    int volume = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SetVolume, volume)

struct Flag {
    bool on = false;
    friend auto operator==(Flag const&, Flag const&) -> bool = default;
};

struct Toggle {};
struct Noop {};
using FlagAction = std::variant<Toggle, Noop>;

struct Handle {
    std::vector<int> writes;
};
struct Write {};

} // namespace

TEST_SUITE("debug.print_changes") {
    TEST_CASE("Encodable state is reported as a patch") {
        std::vector<std::string>         reports;
        Reducer<Settings, SetVolume> const reducer = [](Settings& settings, SetVolume const& action) -> Effect<SetVolume> {
            settings.volume = action.volume;
            return Effect<SetVolume>::none();
        };
        auto printed = printChanges(reducer, [&](std::string const& report) { reports.push_back(report); });

        Settings settings;
        printed.reduce(settings, SetVolume{3});
        CHECK(settings.volume == 3);
        REQUIRE(reports.size() == 1);
        CHECK(reports[0].starts_with("received action: {\"volume\":3}"));
        CHECK(reports[0].find("state patch:") != std::string::npos);
        CHECK(reports[0].find("/volume") != std::string::npos);
        CHECK(reports[0].find("/theme") == std::string::npos);

        printed.reduce(settings, SetVolume{3});
        REQUIRE(reports.size() == 2);
        CHECK(reports[1].ends_with("(no state changes)"));
    }

    TEST_CASE("Equatable state is reported as changed or unchanged") {
        std::vector<std::string>   reports;
        Reducer<Flag, FlagAction> const reducer = [](Flag& flag, FlagAction const& action) -> Effect<FlagAction> {
            if (std::holds_alternative<Toggle>(action))
                flag.on = !flag.on;
            return Effect<FlagAction>::none();
        };
        auto printed = printChanges(reducer, [&](std::string const& report) { reports.push_back(report); });

        Flag flag;
        printed.reduce(flag, Toggle{});
        printed.reduce(flag, Noop{});
        REQUIRE(reports.size() == 2);
        CHECK(reports[0] == "received action: case 0\n  state changed");
        CHECK(reports[1] == "received action: case 1\n  (no state changes)");
    }

    TEST_CASE("Other states only report the action") {
        std::vector<std::string>   reports;
        Reducer<Handle, Write> const reducer = [](Handle& handle, Write const&) -> Effect<Write> {
            handle.writes.push_back(1);
            return Effect<Write>::send(Write{});
        };
        auto printed = printChanges(reducer, [&](std::string const& report) { reports.push_back(report); });

        Handle handle;
        auto   effect = printed.reduce(handle, Write{});
        CHECK(handle.writes.size() == 1);
        CHECK(effect.items().size() == 1);
        REQUIRE(reports.size() == 1);
        CHECK(reports[0] == "received action: (opaque action)");
    }
}
