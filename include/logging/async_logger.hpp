#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace fbt {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "?????";
    }
}

// Category constants for the backtester
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Data = 1;
constexpr uint8_t Engine = 2;
constexpr uint8_t Metrics = 3;
constexpr uint8_t Sizing = 4;
constexpr uint8_t Sweep = 5;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Data:
        return "data";
    case LogCategory::Engine:
        return "engine";
    case LogCategory::Metrics:
        return "metrics";
    case LogCategory::Sizing:
        return "sizing";
    case LogCategory::Sweep:
        return "sweep";
    default:
        return "other";
    }
}

/**
 * Log Entry - Fixed size, two cache lines
 *
 * Trade open/close lines carry several prices, which do not fit one line.
 * seq counts every accepted and dropped call, so a gap in the output marks
 * lines lost to a full buffer.
 */
struct alignas(64) LogEntry {
    uint64_t wall_time_ns; // 8 bytes
    uint32_t seq;          // 4 bytes
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t length;       // 2 bytes, message length without the terminator
    char message[112];     // 112 bytes (null-terminated)
    // Total: 128 bytes

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
        length = static_cast<uint16_t>(len);
    }
};
static_assert(sizeof(LogEntry) == 128, "LogEntry must be 128 bytes");

/**
 * SPSC ring of log entries
 *
 * One producer (the thread driving a run), one consumer (the logger
 * thread, or the owner calling flush() after stop()). One slot is kept
 * empty to tell full from empty.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next = (head + 1) & MASK;
        if (next == tail_.load(std::memory_order_acquire))
            return false;

        slots_[head] = entry;
        head_.store(next, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire))
            return false;

        entry = slots_[tail];
        tail_.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    size_t size() const {
        return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire) + Capacity) & MASK;
    }

private:
    static constexpr size_t MASK = Capacity - 1;

    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    std::array<LogEntry, Capacity> slots_;
};

/**
 * Async Logger
 *
 * log() only formats into a ring slot; a background thread does the I/O.
 * Owned by the program entry point and handed to library objects by pointer,
 * so one logger serves one producer thread at a time.
 *
 * Without start(), entries wait in the ring until flush(), stop() or the
 * destructor writes them out.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   FBT_LOGF_INFO(logger, Engine, "run: %zu bars", n);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), next_seq_(0), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    // Join the consumer and write out whatever is still queued
    void stop() {
        if (!running_.exchange(false)) {
            flush(); // Never started, or already stopped
            return;
        }

        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }
        flush();
    }

    /**
     * Drain pending entries on the calling thread.
     * Does nothing while the consumer thread is running.
     */
    void flush() {
        if (running_.load())
            return;

        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.wall_time_ns = wall_time_ns();
        entry.seq = next_seq_++;
        entry.level = level;
        entry.category = category;
        entry.set_message(message);

        if (buffer_.try_push(entry)) {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        } else {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // printf-style; output longer than the entry is cut off
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char text[sizeof(LogEntry::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    bool enabled(LogLevel level) const { return level >= min_level_; }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

    // Replaces the stderr writer; set before start()
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }
    bool running() const { return running_.load(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    uint32_t next_seq_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            bool idle = true;
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
                idle = false;
            }
            if (idle) {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
            return;
        }

        // HH:MM:SS.mmm UTC
        uint64_t ms = entry.wall_time_ns / 1000000;
        uint64_t secs = ms / 1000;
        std::fprintf(stderr, "%02llu:%02llu:%02llu.%03llu %s %-7s #%u %s\n",
                     static_cast<unsigned long long>((secs / 3600) % 24),
                     static_cast<unsigned long long>((secs / 60) % 60),
                     static_cast<unsigned long long>(secs % 60),
                     static_cast<unsigned long long>(ms % 1000),
                     level_to_string(entry.level), category_to_string(entry.category), entry.seq, entry.message);
    }

    static uint64_t wall_time_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }
};

} // namespace logging
} // namespace fbt

// Convenience macros
#define FBT_LOG(logger, level, cat, msg) (logger).log(level, fbt::logging::LogCategory::cat, msg)
#define FBT_LOG_DEBUG(logger, cat, msg) FBT_LOG(logger, fbt::logging::LogLevel::Debug, cat, msg)
#define FBT_LOG_INFO(logger, cat, msg) FBT_LOG(logger, fbt::logging::LogLevel::Info, cat, msg)
#define FBT_LOG_WARN(logger, cat, msg) FBT_LOG(logger, fbt::logging::LogLevel::Warn, cat, msg)
#define FBT_LOG_ERROR(logger, cat, msg) FBT_LOG(logger, fbt::logging::LogLevel::Error, cat, msg)

// Printf-style variants
#define FBT_LOGF(logger, level, cat, fmt, ...) \
    (logger).logf(level, fbt::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define FBT_LOGF_DEBUG(logger, cat, fmt, ...) FBT_LOGF(logger, fbt::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define FBT_LOGF_INFO(logger, cat, fmt, ...) FBT_LOGF(logger, fbt::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define FBT_LOGF_WARN(logger, cat, fmt, ...) FBT_LOGF(logger, fbt::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define FBT_LOGF_ERROR(logger, cat, fmt, ...) FBT_LOGF(logger, fbt::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)
