#pragma once

#include "core/discovery_source.hpp"
#include "core/file_utils.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Discovers candidates by listing the directory on a fixed interval
 *
 * Each scan is diffed against the previous listing; new paths and paths whose
 * size or mtime changed are emitted. Used for network filesystems and
 * wherever inotify is unavailable.
 */
class PollingDiscoverySource : public DiscoverySource
{
public:
    PollingDiscoverySource(std::string directory, std::chrono::milliseconds interval, bool recursive);
    ~PollingDiscoverySource() override;

    PollingDiscoverySource(const PollingDiscoverySource &) = delete;
    PollingDiscoverySource &operator=(const PollingDiscoverySource &) = delete;

    void start(CandidateHandler on_candidate, ErrorHandler on_error) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }
    std::string name() const override { return "polling"; }

    /**
     * @brief Run one scan on the calling thread and emit the differences
     * @return false if the directory could not be listed
     */
    bool scanOnce(const CandidateHandler &on_candidate, std::string *error_message = nullptr);

private:
    void pollLoop();

    std::string directory_;
    std::chrono::milliseconds interval_;
    bool recursive_;

    std::map<std::string, FileMetadata> previous_snapshot_;

    CandidateHandler on_candidate_;
    ErrorHandler on_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread poll_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};
