/**
 * @file log_sink.cpp
 * @brief Per-sandbox log buffer implementation
 *
 * @date 2025
 */

#include "warden/core/log_sink.hpp"
#include "warden/utils/string_utils.hpp"

#include <algorithm>

namespace warden {
namespace core {

std::string LogEntry::Render() const {
    return "[" + utils::StringUtils::FormatTimestamp(timestamp) + "] " + text;
}

LogSink::LogSink(std::size_t capacity)
    : capacity_(capacity) {}

void LogSink::Append(const std::string& text) {
    // Timestamp under the lock so timestamps are monotone in buffer order
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(LogEntry{std::chrono::system_clock::now(), text});
    ++total_appended_;

    if (capacity_ > 0 && entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<std::string> LogSink::Tail(int max_lines) const {
    if (max_lines <= 0) {
        max_lines = kDefaultTailLines;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t count = std::min(entries_.size(), static_cast<std::size_t>(max_lines));
    std::vector<std::string> lines;
    lines.reserve(count);
    for (auto it = entries_.end() - static_cast<std::ptrdiff_t>(count); it != entries_.end(); ++it) {
        lines.push_back(it->Render());
    }
    return lines;
}

LogChunk LogSink::Since(std::size_t position) const {
    std::lock_guard<std::mutex> lock(mutex_);

    LogChunk chunk;
    chunk.next = total_appended_;

    std::size_t oldest = total_appended_ - entries_.size();
    if (position < oldest) {
        chunk.dropped = oldest - position;
        position = oldest;
    }
    for (std::size_t i = position - oldest; i < entries_.size(); ++i) {
        chunk.lines.push_back(entries_[i].Render());
    }
    return chunk;
}

std::vector<LogEntry> LogSink::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

std::size_t LogSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t LogSink::TotalAppended() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_appended_;
}

} // namespace core
} // namespace warden
