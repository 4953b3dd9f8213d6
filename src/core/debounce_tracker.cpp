#include "core/debounce_tracker.hpp"
#include <algorithm>

DebounceTracker::DebounceTracker(std::chrono::milliseconds stable_for)
    : stable_for_(stable_for)
{
}

DebounceTracker::Observation DebounceTracker::observe(const std::string &identity, const FileMetadata &metadata,
                                                      Clock::time_point now)
{
    auto it = entries_.find(identity);
    if (it == entries_.end())
    {
        entries_.emplace(identity, Entry{metadata, now, next_sequence_++});
        return Observation::STARTED;
    }

    Entry &entry = it->second;
    if (!entry.metadata.sameContentStamp(metadata))
    {
        entry.metadata = metadata;
        entry.stable_since = now;
        return Observation::CHANGED;
    }

    if (now - entry.stable_since >= stable_for_)
    {
        return Observation::STABLE;
    }
    return Observation::UNCHANGED;
}

bool DebounceTracker::contains(const std::string &identity) const
{
    return entries_.count(identity) > 0;
}

void DebounceTracker::remove(const std::string &identity)
{
    entries_.erase(identity);
}

void DebounceTracker::clear()
{
    entries_.clear();
}

std::vector<std::string> DebounceTracker::identitiesInObservationOrder() const
{
    std::vector<std::pair<uint64_t, std::string>> ordered;
    ordered.reserve(entries_.size());
    for (const auto &entry : entries_)
    {
        ordered.emplace_back(entry.second.sequence, entry.first);
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<std::string> identities;
    identities.reserve(ordered.size());
    for (auto &item : ordered)
    {
        identities.push_back(std::move(item.second));
    }
    return identities;
}

std::optional<FileMetadata> DebounceTracker::lastMetadata(const std::string &identity) const
{
    auto it = entries_.find(identity);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second.metadata;
}
