#ifdef SM_LOG_DEBUG
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace SM {

/**
 * TaggedLogger: queued debug log written to stderr by a worker thread.
 *
 * Lines read `timestamp [tag][tag] [thread] [dir/file:line] message`. A message
 * carrying any skip tag is dropped when it is written, so the skip list can be
 * changed while messages are queued. Animation code runs on the host's tick
 * thread; flush() lets a tick loop or a test wait until its messages are out.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    [[nodiscard]] auto isEnabled() const -> bool;

    // Blocks until every message queued so far has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable queued;
    std::condition_variable drained;
    std::size_t             writing = 0;
    bool                    running = true;
    bool                    enabled = false;
    std::thread             worker;

    // Per-track start/stop traffic; STYLEMOTION_LOG_SKIP replaces the list.
    std::set<std::string> skipTags{"Tween"};
    mutable std::mutex    tagsMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::size_t                                      unnamedThreads = 0;
    mutable std::mutex                               threadNamesMutex;

    auto        drain() -> void;
    auto        write(const LogMessage& msg) const -> void;
    auto        threadNameFor(const std::thread::id& id) -> std::string;
    static auto shortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->isEnabled())
        return;

    auto entry = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                            .tags       = {std::string(std::forward<Tags>(tags))...},
                            .message    = message,
                            .threadName = threadNameFor(std::this_thread::get_id()),
                            .location   = location};

    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(entry));
    this->queued.notify_one();
}

#define sm_log(message, ...) ::SM::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

// Applies STYLEMOTION_LOG (on unless "0") and STYLEMOTION_LOG_SKIP (comma-separated
// tags, empty to skip nothing) to the shared logger. Returns whether logging is on.
auto configure_logging_from_env() -> bool;

// Splits a comma-separated tag list, trimming spaces and dropping empty entries.
auto parse_tag_list(std::string_view list) -> std::set<std::string>;

} // namespace SM

#else
#define sm_log(message, ...) ((void)0)
#endif // SM_LOG_DEBUG
