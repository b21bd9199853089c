#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <thread>

namespace tradebot {
namespace logging {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "?????";
}

// Pipeline stage a log line belongs to
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Market = 1;
constexpr uint8_t Signal = 2;
constexpr uint8_t Confirmation = 3;
constexpr uint8_t Sizing = 4;
constexpr uint8_t Order = 5;
constexpr uint8_t Position = 6;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Market:
        return "market";
    case LogCategory::Signal:
        return "signal";
    case LogCategory::Confirmation:
        return "confirm";
    case LogCategory::Sizing:
        return "sizing";
    case LogCategory::Order:
        return "order";
    case LogCategory::Position:
        return "position";
    default:
        return "other";
    }
}

/**
 * One log line. Fixed size so the ring never allocates.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // wall clock
    LogLevel level;
    uint8_t category;
    uint16_t reserved;     // padding
    uint32_t thread_id;
    char message[240];     // null-terminated, truncated if longer

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Bounded ring of log entries with one writer and one reader.
 *
 * Sequence numbers grow without wrapping; the slot is seq % Slots. One slot
 * stays free, so Slots - 1 entries fit before writes start failing.
 */
template <size_t Slots = 4096>
class LogRing {
public:
    static_assert(Slots >= 2 && (Slots & (Slots - 1)) == 0, "Slots must be a power of 2");

    bool write(const LogEntry& entry) {
        uint64_t w = write_seq_.load(std::memory_order_relaxed);
        if (w - read_seq_.load(std::memory_order_acquire) >= Slots - 1) {
            return false;
        }
        slots_[w & (Slots - 1)] = entry;
        write_seq_.store(w + 1, std::memory_order_release);
        return true;
    }

    bool read(LogEntry& entry) {
        uint64_t r = read_seq_.load(std::memory_order_relaxed);
        if (r == write_seq_.load(std::memory_order_acquire)) {
            return false;
        }
        entry = slots_[r & (Slots - 1)];
        read_seq_.store(r + 1, std::memory_order_release);
        return true;
    }

    size_t size() const {
        return static_cast<size_t>(write_seq_.load(std::memory_order_acquire) -
                                   read_seq_.load(std::memory_order_acquire));
    }

    static constexpr size_t capacity() { return Slots - 1; }

private:
    alignas(64) std::atomic<uint64_t> write_seq_{0};
    alignas(64) std::atomic<uint64_t> read_seq_{0};
    std::array<LogEntry, Slots> slots_{};
};

/**
 * Async Logger
 *
 * Bot workers, the order monitor and the runner all log from their own
 * threads, so writes go through a short mutex and the ring only ever sees
 * one writer. A background thread drains the ring and does the I/O.
 * Lines that do not fit are counted as dropped, never blocked on.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(&logger, LogCategory::Order, "order %s filled @ %.2f", id, price);
 *   logger.stop();
 *
 * Components take an AsyncLogger* and the macros skip null loggers.
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() = default;
    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;
        consumer_ = std::thread([this]() {
            while (running_.load(std::memory_order_relaxed)) {
                if (flush() == 0) {
                    std::this_thread::sleep_for(std::chrono::microseconds(500));
                }
            }
        });
    }

    /**
     * Join the consumer and write out whatever is still queued.
     */
    void stop() {
        if (!running_.exchange(false))
            return;
        if (consumer_.joinable()) {
            consumer_.join();
        }
        flush();
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (!enabled(level))
            return;

        LogEntry entry;
        entry.timestamp_ns = wall_clock_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = current_thread_id();
        entry.set_message(message);

        bool written;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            written = ring_.write(entry);
        }
        (written ? total_logged_ : dropped_count_).fetch_add(1, std::memory_order_relaxed);
    }

    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (!enabled(level))
            return;
        char text[sizeof(LogEntry::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    bool enabled(LogLevel level) const { return level >= min_level_.load(std::memory_order_relaxed); }
    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Must be set before start()
    void set_output_callback(OutputCallback cb) { output_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return ring_.size(); }

private:
    LogRing<4096> ring_;
    std::mutex write_mutex_;
    std::atomic<bool> running_{false};
    std::thread consumer_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    OutputCallback output_;

    std::atomic<uint64_t> dropped_count_{0};
    std::atomic<uint64_t> total_logged_{0};

    // Reader side only: the consumer thread, or stop() after the join
    size_t flush() {
        size_t n = 0;
        LogEntry entry;
        while (ring_.read(entry)) {
            emit(entry);
            ++n;
        }
        return n;
    }

    void emit(const LogEntry& entry) {
        if (output_) {
            output_(entry);
            return;
        }
        auto ms = static_cast<unsigned long long>(entry.timestamp_ns / 1000000);
        std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", ms / 1000, ms % 1000, level_to_string(entry.level),
                     category_to_string(entry.category), entry.message);
    }

    static uint64_t wall_clock_ns() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                         std::chrono::system_clock::now().time_since_epoch())
                                         .count());
    }

    static uint32_t current_thread_id() {
        static thread_local uint32_t id =
            static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
        return id;
    }
};

// Convenience macros, logger is an AsyncLogger* and may be null
#define LOG_AT(logger, level, cat, msg)                                                                                \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->log(level, cat, msg);                                                                            \
    } while (0)

#define LOG_DEBUG(logger, cat, msg) LOG_AT(logger, tradebot::logging::LogLevel::Debug, cat, msg)
#define LOG_INFO(logger, cat, msg) LOG_AT(logger, tradebot::logging::LogLevel::Info, cat, msg)
#define LOG_WARN(logger, cat, msg) LOG_AT(logger, tradebot::logging::LogLevel::Warn, cat, msg)
#define LOG_ERROR(logger, cat, msg) LOG_AT(logger, tradebot::logging::LogLevel::Error, cat, msg)

#define LOGF_AT(logger, level, cat, fmt, ...)                                                                          \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->logf(level, cat, fmt, ##__VA_ARGS__);                                                            \
    } while (0)

#define LOGF_DEBUG(logger, cat, fmt, ...) LOGF_AT(logger, tradebot::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...) LOGF_AT(logger, tradebot::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...) LOGF_AT(logger, tradebot::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...) LOGF_AT(logger, tradebot::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace tradebot
