/**
 * @file log_sink.hpp
 * @brief Append-only, order-preserving per-sandbox log buffer
 *
 * Entries are timestamped on append and rendered as "[<ISO-8601>] <text>".
 * Appends never block on readers beyond a short critical section, so a
 * supervisor thread draining a child's pipes is never stalled by a slow
 * log consumer.
 *
 * An optional capacity bounds memory: once full, the oldest entries are
 * discarded. A capacity of zero keeps everything.
 *
 * **Thread Safety**: All methods are thread-safe.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace warden {
namespace core {

/**
 * @struct LogEntry
 * @brief One line captured for a sandbox
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;  ///< Emission time
    std::string text;                                 ///< Message body

    std::string Render() const;
};

/**
 * @struct LogChunk
 * @brief Entries appended since a reader's position
 */
struct LogChunk {
    std::vector<std::string> lines;  ///< Rendered, in emission order
    std::size_t next{0};             ///< Position to pass to the following Since()
    std::size_t dropped{0};          ///< Entries evicted before the reader saw them
};

class LogSink {
public:
    static constexpr int kDefaultTailLines = 100;

    explicit LogSink(std::size_t capacity = 0);

    /// Always succeeds; preserves call order.
    void Append(const std::string& text);

    /**
     * @brief Last @p max_lines rendered entries in emission order
     *
     * Values <= 0 fall back to kDefaultTailLines. Never mutates the buffer.
     */
    std::vector<std::string> Tail(int max_lines = kDefaultTailLines) const;

    /**
     * @brief Entries appended at or after @p position
     *
     * Positions count every append, so a follower keeps its place even
     * after the buffer starts evicting. Start from 0.
     */
    LogChunk Since(std::size_t position) const;

    std::vector<LogEntry> Entries() const;

    /// Entries currently held.
    std::size_t Size() const;

    /// Entries ever appended, including evicted ones.
    std::size_t TotalAppended() const;

    std::size_t Capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
    std::size_t total_appended_{0};
};

} // namespace core
} // namespace warden
