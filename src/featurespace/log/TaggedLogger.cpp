#ifdef FS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <utility>

namespace FS {

namespace {

thread_local std::string currentThreadName;
std::atomic<int>         unnamedThreads{0};

auto threadName() -> std::string const& {
    if (currentThreadName.empty())
        currentThreadName = "Thread " + std::to_string(unnamedThreads++);
    return currentThreadName;
}

auto parseTagList(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto const comma = list.find(',');
        auto       item  = list.substr(0, comma);
        list             = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
        auto const first = item.find_first_not_of(' ');
        if (first == std::string_view::npos)
            continue;
        item = item.substr(first, item.find_last_not_of(' ') - first + 1);
        tags.emplace(item);
    }
    return tags;
}

auto readSwitch(char const* name) -> std::optional<bool> {
    char const* raw = std::getenv(name);
    if (raw == nullptr)
        return std::nullopt;
    std::string_view const value{raw};
    return value != "0" && value != "off" && value != "false";
}

// "dir/file.cpp" out of a full source path.
auto sourceTail(std::string_view path) -> std::string_view {
    auto const last = path.rfind('/');
    if (last == std::string_view::npos || last == 0)
        return path;
    auto const previous = path.rfind('/', last - 1);
    return previous == std::string_view::npos ? path : path.substr(previous + 1);
}

auto format(LogRecord const& record) -> std::string {
    auto const time   = std::chrono::system_clock::to_time_t(record.at);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.at.time_since_epoch()).count() % 1000;
    std::tm    local{};
    localtime_r(&time, &local);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(millis));

    std::string line = stamp;
    line += " [";
    for (std::size_t i = 0; i < record.tags.size(); ++i) {
        if (i != 0)
            line += "][";
        line += record.tags[i];
    }
    line += "] [" + record.thread + "] ";
    line += std::string(sourceTail(record.where.file_name())) + ":" + std::to_string(record.where.line()) + " ";
    line += record.text;
    line += '\n';
    return line;
}

} // namespace

auto LogConfig::FromEnvironment() -> LogConfig {
    LogConfig config;
    if (auto on = readSwitch("FEATURESPACE_LOG_ENABLED"))
        config.enabled = *on;
    else if (auto legacy = readSwitch("FEATURESPACE_LOG"))
        config.enabled = *legacy;

    if (readSwitch("FEATURESPACE_LOG_CLEAR_DEFAULT_SKIPS").value_or(false))
        config.skipTags.clear();
    if (char const* skip = std::getenv("FEATURESPACE_LOG_SKIP_TAGS"))
        config.skipTags.merge(parseTagList(skip));
    if (char const* only = std::getenv("FEATURESPACE_LOG_ENABLE_TAGS"))
        config.onlyTags = parseTagList(only);
    return config;
}

auto LogConfig::admits(std::vector<std::string> const& tags) const -> bool {
    return std::none_of(tags.begin(), tags.end(), [this](std::string const& tag) {
        return this->skipTags.contains(tag) || (!this->onlyTags.empty() && !this->onlyTags.contains(tag));
    });
}

std::mutex TaggedLogger::outputMutex;

auto logger() -> TaggedLogger& {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger(LogConfig config)
    : config_(std::move(config)), enabled_(config_.enabled) {
    this->writer_ = std::thread(&TaggedLogger::writerLoop, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->stopping_ = true;
    }
    this->wake_.notify_one();
    this->writer_.join();
}

auto TaggedLogger::record(std::string text, std::source_location const& where, std::initializer_list<std::string_view> tags) -> void {
    if (!this->enabled_.load(std::memory_order_relaxed))
        return;
    LogRecord entry{std::chrono::system_clock::now(), {tags.begin(), tags.end()}, std::move(text), threadName(), where};
    if (!this->config_.admits(entry.tags))
        return;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->pending_.push_back(std::move(entry));
        ++this->unwritten_;
    }
    this->wake_.notify_one();
}

auto TaggedLogger::setThreadName(std::string name) -> void {
    currentThreadName = std::move(name);
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return this->enabled_.load(std::memory_order_relaxed);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->mutex_);
    this->written_.wait(lock, [this] { return this->unwritten_ == 0; });
}

auto TaggedLogger::writerLoop() -> void {
    std::vector<LogRecord> batch;
    std::unique_lock<std::mutex> lock(this->mutex_);
    for (;;) {
        this->wake_.wait(lock, [this] { return !this->pending_.empty() || this->stopping_; });
        if (this->pending_.empty())
            return;
        batch.swap(this->pending_);
        lock.unlock();

        std::string text;
        for (auto const& entry : batch)
            text += format(entry);
        {
            std::lock_guard<std::mutex> output(outputMutex);
            std::cerr << text << std::flush;
        }
        auto const count = batch.size();
        batch.clear();

        lock.lock();
        this->unwritten_ -= count;
        this->written_.notify_all();
    }
}

auto set_thread_name(std::string const& name) -> void {
    logger().setThreadName(name);
}

auto set_logging_enabled(bool enabled) -> void {
    logger().setLoggingEnabled(enabled);
}

} // namespace FS
#endif // FS_LOG_DEBUG
