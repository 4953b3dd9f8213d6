#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination for the auto_ingest CLI.
 * - SIGINT/SIGTERM/SIGQUIT are installed with sigaction; the handler only
 *   writes the signal number to a self-pipe
 * - A watcher thread reads the pipe and turns it into a shutdown request
 * - The main thread blocks in waitForShutdown() (optionally with a timeout)
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install handlers and start the watcher thread; throws std::runtime_error if the pipe cannot be created
    void installSignalHandlers();

    // Restore the previous handlers and stop the watcher thread
    void uninstallSignalHandlers();

    /**
     * @brief Record the first shutdown request and wake every waiter
     *
     * Safe from any thread, but not from a signal handler. The reason is
     * copied before any state changes, so if that copy throws the request
     * has not been recorded.
     */
    void requestShutdown(const std::string &reason, int signal_number = 0);

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    // Returns true if shutdown was requested before the timeout expired
    bool waitForShutdown(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Clears the shutdown state; used between tests
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void watchPipe();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::mutex install_mutex_;
    bool installed_ = false;
    std::thread watcher_;
    struct sigaction previous_int_{};
    struct sigaction previous_term_{};
    struct sigaction previous_quit_{};

    // Written by the handler; read end owned by the watcher thread
    static int signal_pipe_[2];
};
