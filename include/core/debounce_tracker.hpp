#pragma once

#include "core/file_utils.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Tracks files that are still being written
 *
 * A file is ready once two consecutive observations report the same
 * (size, mtime) and the pair has been unchanged for at least the configured
 * window. Any change restarts the window. Not thread-safe; the engine
 * guards it with its own mutex.
 */
class DebounceTracker
{
public:
    using Clock = std::chrono::steady_clock;

    enum class Observation
    {
        STARTED,   // First time this identity is seen
        CHANGED,   // Size or mtime moved; window restarted
        UNCHANGED, // Same stamp, window not yet elapsed
        STABLE     // Same stamp for the whole window
    };

    explicit DebounceTracker(std::chrono::milliseconds stable_for);

    Observation observe(const std::string &identity, const FileMetadata &metadata, Clock::time_point now);

    bool contains(const std::string &identity) const;
    void remove(const std::string &identity);
    void clear();
    size_t size() const { return entries_.size(); }

    // Oldest first observation first; dispatch order follows this
    std::vector<std::string> identitiesInObservationOrder() const;

    std::optional<FileMetadata> lastMetadata(const std::string &identity) const;

    std::chrono::milliseconds window() const { return stable_for_; }

private:
    struct Entry
    {
        FileMetadata metadata;
        Clock::time_point stable_since;
        uint64_t sequence;
    };

    std::chrono::milliseconds stable_for_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_sequence_ = 0;
};
