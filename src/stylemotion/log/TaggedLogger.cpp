#ifdef SM_LOG_DEBUG
#include "utils/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SM {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->worker = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
    }
    this->queued.notify_one();
    if (this->worker.joinable()) {
        this->worker.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->enabled = on;
}

auto TaggedLogger::isEnabled() const -> bool {
    std::lock_guard<std::mutex> lock(this->queueMutex);
    return this->enabled;
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->skipTags = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->messageQueue.empty() && this->writing == 0; });
}

auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->queued.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (this->messageQueue.empty()) {
            this->drained.notify_all();
            return;
        }

        auto msg = std::move(this->messageQueue.front());
        this->messageQueue.pop();
        ++this->writing;
        lock.unlock();
        this->write(msg);
        lock.lock();
        --this->writing;
        if (this->messageQueue.empty()) {
            this->drained.notify_all();
        }
    }
}

auto TaggedLogger::shortPath(const char* filepath) -> std::string {
    std::filesystem::path p{filepath};
    if (!p.has_parent_path()) {
        return p.filename().string();
    }
    return (p.parent_path().filename() / p.filename()).string();
}

auto TaggedLogger::write(const LogMessage& msg) const -> void {
    {
        std::lock_guard<std::mutex> lock(this->tagsMutex);
        for (auto const& tag : msg.tags)
            if (this->skipTags.contains(tag))
                return;
    }

    auto const time   = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count()
         << ' ';
    for (auto const& tag : msg.tags)
        line << '[' << tag << ']';
    line << " [" << msg.threadName << "] [" << shortPath(msg.location.file_name()) << ':' << msg.location.line()
         << "] " << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadNameFor(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(this->unnamedThreads++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

auto parse_tag_list(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto const comma = list.find(',');
        auto       tag   = list.substr(0, comma);
        list             = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);

        auto const first = tag.find_first_not_of(' ');
        if (first == std::string_view::npos) {
            continue;
        }
        tag = tag.substr(first, tag.find_last_not_of(' ') - first + 1);
        tags.emplace(tag);
    }
    return tags;
}

auto configure_logging_from_env() -> bool {
    bool on = false;
    if (const char* value = std::getenv("STYLEMOTION_LOG")) {
        on = std::strcmp(value, "0") != 0;
    }
    if (const char* skip = std::getenv("STYLEMOTION_LOG_SKIP")) {
        logger().setSkipTags(parse_tag_list(skip));
    }
    logger().setLoggingEnabled(on);
    return on;
}

} // namespace SM
#endif // SM_LOG_DEBUG
