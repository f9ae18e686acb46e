#ifdef FS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value)
        : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            original = std::string(existing);
        if (value)
            setenv(this->key.c_str(), value, 1);
        else
            unsetenv(this->key.c_str());
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original)
            setenv(key.c_str(), original->c_str(), 1);
        else
            unsetenv(key.c_str());
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

struct BaselineEnv {
    EnvGuard enabled{"FEATURESPACE_LOG_ENABLED", nullptr};
    EnvGuard log{"FEATURESPACE_LOG", nullptr};
    EnvGuard clearSkips{"FEATURESPACE_LOG_CLEAR_DEFAULT_SKIPS", nullptr};
    EnvGuard enableTags{"FEATURESPACE_LOG_ENABLE_TAGS", nullptr};
    EnvGuard skipTags{"FEATURESPACE_LOG_SKIP_TAGS", nullptr};
};

// Runs `fn` with a fresh logger while stderr is captured. The logger is
// flushed and joined before the capture ends.
auto captureStderr(std::function<void(FS::TaggedLogger&)> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    {
        FS::TaggedLogger logger{FS::LogConfig::FromEnvironment()};
        fn(logger);
        logger.flush();
    }
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

    TEST_CASE("logging_disabled_by_default_drops_messages") {
        BaselineEnv env;
        auto output = captureStderr([](FS::TaggedLogger& logger) { logger.record("should not appear", std::source_location::current(), {"TestTag"}); });
        CHECK(output.empty());
    }

    TEST_CASE("environment_flag_enables_logging") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");

        auto output = captureStderr([](FS::TaggedLogger& logger) { logger.record("hello log", std::source_location::current(), {"TestTag"}); });

        CHECK(output.find("[TestTag]") != std::string::npos);
        CHECK(output.find("hello log") != std::string::npos);
        CHECK(output.find("test_TaggedLogger.cpp") != std::string::npos);
    }

    TEST_CASE("FEATURESPACE_LOG_env_enables_logging") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG", "on");

        auto output = captureStderr([](FS::TaggedLogger& logger) { logger.record("env enabled", std::source_location::current(), {"EnvTag"}); });
        CHECK(output.find("env enabled") != std::string::npos);
    }

    TEST_CASE("default_skip_list_filters_runtime_noise") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");

        auto skipped = captureStderr([](FS::TaggedLogger& logger) {
            logger.record("observer fired", std::source_location::current(), {"Observation"});
            logger.record("identity retired", std::source_location::current(), {"Identity"});
        });
        CHECK(skipped.empty());
    }

    TEST_CASE("clear_default_skips_allows_runtime_noise") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");
        EnvGuard    clearSkips("FEATURESPACE_LOG_CLEAR_DEFAULT_SKIPS", "1");

        auto output = captureStderr([](FS::TaggedLogger& logger) { logger.record("observer fired", std::source_location::current(), {"Observation"}); });
        CHECK(output.find("observer fired") != std::string::npos);
    }

    TEST_CASE("skip_tags_env_extends_skip_list") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");
        EnvGuard    skip("FEATURESPACE_LOG_SKIP_TAGS", "Routing, Store");

        auto output = captureStderr([](FS::TaggedLogger& logger) {
            logger.record("dropped action", std::source_location::current(), {"Routing"});
            logger.record("store closed", std::source_location::current(), {"Store"});
            logger.record("scope discarded", std::source_location::current(), {"CaseScope"});
        });
        CHECK(output.find("dropped action") == std::string::npos);
        CHECK(output.find("store closed") == std::string::npos);
        CHECK(output.find("scope discarded") != std::string::npos);
    }

    TEST_CASE("enabled_tags_gate_output") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");
        EnvGuard    enableTags("FEATURESPACE_LOG_ENABLE_TAGS", "Focus");

        auto output = captureStderr([](FS::TaggedLogger& logger) {
            logger.record("keep me", std::source_location::current(), {"Focus"});
            logger.record("drop me", std::source_location::current(), {"Focus", "Other"});
        });
        CHECK(output.find("keep me") != std::string::npos);
        CHECK(output.find("drop me") == std::string::npos);
    }

    TEST_CASE("thread_names_appear_in_output") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");

        auto output = captureStderr([](FS::TaggedLogger& logger) {
            logger.setThreadName("Reducer");
            logger.record("named", std::source_location::current(), {"Store"});
        });
        CHECK(output.find("[Reducer]") != std::string::npos);
    }

    TEST_CASE("runtime_toggle_overrides_environment") {
        BaselineEnv env;
        EnvGuard    enable("FEATURESPACE_LOG_ENABLED", "1");

        auto output = captureStderr([](FS::TaggedLogger& logger) {
            CHECK(logger.loggingEnabled());
            logger.setLoggingEnabled(false);
            logger.record("muted", std::source_location::current(), {"Store"});
        });
        CHECK(output.empty());
    }

    TEST_CASE("config_filters_without_the_environment") {
        FS::LogConfig config;
        CHECK_FALSE(config.enabled);
        CHECK(config.admits({"Store"}));
        CHECK_FALSE(config.admits({"Store", "Observation"}));

        config.onlyTags = {"Routing"};
        CHECK(config.admits({"Routing"}));
        CHECK_FALSE(config.admits({"Routing", "Store"}));

        config.enabled = true;
        auto output = captureStderr([&](FS::TaggedLogger&) {
            FS::TaggedLogger configured{config};
            configured.record("routed", std::source_location::current(), {"Routing"});
            configured.record("stored", std::source_location::current(), {"Store"});
            configured.flush();
        });
        CHECK(output.find("routed") != std::string::npos);
        CHECK(output.find("stored") == std::string::npos);
    }
}
#endif // FS_LOG_DEBUG
