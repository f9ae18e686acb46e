#ifdef FS_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace FS {

/**
 * Which diagnostics reach stderr.
 *
 * FromEnvironment reads:
 *   FEATURESPACE_LOG / FEATURESPACE_LOG_ENABLED   enable output ("0", "off" or "false" disables)
 *   FEATURESPACE_LOG_ENABLE_TAGS                  comma list; a record is kept only if all
 *                                                 of its tags are listed
 *   FEATURESPACE_LOG_SKIP_TAGS                    comma list added to the skip set
 *   FEATURESPACE_LOG_CLEAR_DEFAULT_SKIPS          start from an empty skip set
 */
struct LogConfig {
    bool                  enabled = false;
    std::set<std::string> skipTags{"Observation", "Identity", "TaskPool", "Task"};
    std::set<std::string> onlyTags;

    static auto FromEnvironment() -> LogConfig;

    [[nodiscard]] auto admits(std::vector<std::string> const& tags) const -> bool;
};

struct LogRecord {
    std::chrono::system_clock::time_point at;
    std::vector<std::string>              tags;
    std::string                           text;
    std::string                           thread;
    std::source_location                  where;
};

/**
 * Tag filtered diagnostics written to stderr by a background writer thread.
 *
 * Filtering happens on the logging thread; admitted records are batched and
 * formatted by the writer, so a transition that logs never waits on I/O.
 */
class TaggedLogger {
public:
    explicit TaggedLogger(LogConfig config = LogConfig::FromEnvironment());
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    auto record(std::string text, std::source_location const& where, std::initializer_list<std::string_view> tags) -> void;

    // Names the calling thread in every record it logs afterwards.
    auto setThreadName(std::string name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    // Blocks until every admitted record has been written.
    auto flush() -> void;

    // Held while anything is written to the console.
    static std::mutex outputMutex;

private:
    auto writerLoop() -> void;

    LogConfig         config_;
    std::atomic<bool> enabled_;

    std::mutex              mutex_;
    std::condition_variable wake_;
    std::condition_variable written_;
    std::vector<LogRecord>  pending_;
    std::size_t             unwritten_ = 0;
    bool                    stopping_  = false;
    std::thread             writer_;
};

auto logger() -> TaggedLogger&;
auto set_thread_name(std::string const& name) -> void;
auto set_logging_enabled(bool enabled) -> void;

} // namespace FS

#define fs_log(message, ...) ::FS::logger().record(message, std::source_location::current(), {__VA_ARGS__})

#else
#define fs_log(message, ...) ((void)0)
#endif // FS_LOG_DEBUG
