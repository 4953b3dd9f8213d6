#pragma once

#include "core/discovery_source.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <sys/types.h>

/**
 * @brief Discovers candidates from Linux inotify notifications
 *
 * Watches are installed before the initial scan, so nothing that arrives
 * during the scan is lost. Bursts of events for one path are coalesced:
 * the first event of a window is emitted immediately and any later ones
 * produce a single trailing emission when the window closes.
 *
 * The thread blocks in poll() on the inotify descriptor and a wake pipe
 * used by stop().
 */
class InotifyDiscoverySource : public DiscoverySource
{
public:
    InotifyDiscoverySource(std::string directory, bool recursive, std::chrono::milliseconds coalesce_window);
    ~InotifyDiscoverySource() override;

    InotifyDiscoverySource(const InotifyDiscoverySource &) = delete;
    InotifyDiscoverySource &operator=(const InotifyDiscoverySource &) = delete;

    /**
     * @throws DiscoveryError if inotify cannot be initialized or the directory cannot be watched
     */
    void start(CandidateHandler on_candidate, ErrorHandler on_error) override;
    void stop() override;
    bool isRunning() const override { return running_.load(); }
    std::string name() const override { return "inotify"; }

    // Check whether this process can create an inotify instance at all
    static bool isSupported();

private:
    struct CoalesceWindow
    {
        std::chrono::steady_clock::time_point closes_at;
        bool dirty = false;
    };

    void watchLoop();
    bool addWatch(const std::string &dir);
    void addWatchesRecursive(const std::string &dir);
    void emitExistingFiles(const std::string &dir);
    void processEventBuffer(const char *buffer, ssize_t length);
    void notePath(const std::string &path);
    void flushWindows();
    int pollTimeoutMillis() const;
    void fail(const std::string &message);
    void closeDescriptors();

    std::string directory_;
    bool recursive_;
    std::chrono::milliseconds coalesce_window_;

    int inotify_fd_{-1};
    int wake_pipe_[2]{-1, -1};
    int root_wd_{-1};

    // Touched only by the watch thread once started
    std::unordered_map<int, std::string> wd_to_path_;
    std::unordered_map<std::string, CoalesceWindow> windows_;
    std::string fatal_error_;

    CandidateHandler on_candidate_;
    ErrorHandler on_error_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread watch_thread_;
    std::mutex lifecycle_mutex_;
};
