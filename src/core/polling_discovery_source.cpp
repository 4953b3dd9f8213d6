#include "core/polling_discovery_source.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <vector>

PollingDiscoverySource::PollingDiscoverySource(std::string directory, std::chrono::milliseconds interval, bool recursive)
    : directory_(std::move(directory)), interval_(interval), recursive_(recursive)
{
}

PollingDiscoverySource::~PollingDiscoverySource()
{
    stop();
}

void PollingDiscoverySource::start(CandidateHandler on_candidate, ErrorHandler on_error)
{
    if (running_.load())
    {
        Logger::warn("PollingDiscoverySource is already running");
        return;
    }
    if (poll_thread_.joinable())
    {
        poll_thread_.join();
    }

    on_candidate_ = std::move(on_candidate);
    on_error_ = std::move(on_error);
    previous_snapshot_.clear();
    stop_requested_.store(false);
    running_.store(true);
    poll_thread_ = std::thread(&PollingDiscoverySource::pollLoop, this);

    Logger::info("PollingDiscoverySource started on " + directory_ + " (interval: " +
                 std::to_string(interval_.count()) + "ms, recursive: " + (recursive_ ? "yes" : "no") + ")");
}

void PollingDiscoverySource::stop()
{
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_.store(true);
    }
    wait_cv_.notify_all();

    if (poll_thread_.joinable() && poll_thread_.get_id() != std::this_thread::get_id())
    {
        poll_thread_.join();
        Logger::info("PollingDiscoverySource stopped");
    }
    running_.store(false);
}

bool PollingDiscoverySource::scanOnce(const CandidateHandler &on_candidate, std::string *error_message)
{
    if (!FileUtils::isValidDirectory(directory_))
    {
        if (error_message)
            *error_message = "watched directory is missing or not a directory: " + directory_;
        return false;
    }

    std::map<std::string, FileMetadata> current_snapshot;
    bool listing_failed = false;
    std::string listing_error;

    auto file_stream = FileUtils::listFilesAsObservable(directory_, recursive_);
    file_stream.subscribe(
        [&current_snapshot](const std::string &file_path)
        {
            // Files can vanish between listing and stat
            if (auto metadata = FileUtils::getFileMetadata(file_path))
            {
                current_snapshot.emplace(file_path, *metadata);
            }
        },
        [&listing_failed, &listing_error](const std::exception &error)
        {
            listing_failed = true;
            listing_error = error.what();
        },
        nullptr);

    if (listing_failed)
    {
        if (error_message)
            *error_message = listing_error;
        return false;
    }

    std::vector<const FileMetadata *> changed;
    for (const auto &entry : current_snapshot)
    {
        auto previous = previous_snapshot_.find(entry.first);
        if (previous == previous_snapshot_.end() || !previous->second.sameContentStamp(entry.second))
        {
            changed.push_back(&entry.second);
        }
    }

    // Oldest first, so a backlog is dispatched in arrival order
    std::stable_sort(changed.begin(), changed.end(),
                     [](const FileMetadata *a, const FileMetadata *b)
                     { return a->modification_time_ns < b->modification_time_ns; });

    if (!changed.empty())
    {
        Logger::debug("PollingDiscoverySource: " + std::to_string(changed.size()) + " new or changed files in " + directory_);
    }
    for (const FileMetadata *metadata : changed)
    {
        if (stop_requested_.load())
        {
            break;
        }
        on_candidate(metadata->file_path);
    }

    previous_snapshot_ = std::move(current_snapshot);
    return true;
}

void PollingDiscoverySource::pollLoop()
{
    Logger::debug("PollingDiscoverySource loop started");

    while (!stop_requested_.load())
    {
        std::string error_message;
        bool ok = false;
        try
        {
            ok = scanOnce(on_candidate_, &error_message);
        }
        catch (const std::exception &e)
        {
            error_message = e.what();
        }

        if (!ok)
        {
            Logger::error("PollingDiscoverySource: " + error_message);
            running_.store(false);
            if (on_error_)
            {
                on_error_(DiscoveryError(error_message));
            }
            return;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, interval_, [this]
                          { return stop_requested_.load(); });
    }

    running_.store(false);
    Logger::debug("PollingDiscoverySource loop ended");
}
