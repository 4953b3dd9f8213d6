#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

int ShutdownManager::signal_pipe_[2] = {-1, -1};

namespace
{
    // Sent by uninstallSignalHandlers() to end the watcher thread
    constexpr unsigned char kWatcherExit = 0;
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    uninstallSignalHandlers();
}

void ShutdownManager::installSignalHandlers()
{
    std::lock_guard<std::mutex> lock(install_mutex_);
    if (installed_)
    {
        return;
    }

    if (pipe2(signal_pipe_, O_CLOEXEC) != 0)
    {
        throw std::runtime_error(std::string("ShutdownManager: cannot create signal pipe: ") + std::strerror(errno));
    }

    struct sigaction action{};
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    sigaction(SIGINT, &action, &previous_int_);
    sigaction(SIGTERM, &action, &previous_term_);
    sigaction(SIGQUIT, &action, &previous_quit_);

    watcher_ = std::thread(&ShutdownManager::watchPipe, this);
    installed_ = true;
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::uninstallSignalHandlers()
{
    std::lock_guard<std::mutex> lock(install_mutex_);
    if (!installed_)
    {
        return;
    }

    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
    sigaction(SIGQUIT, &previous_quit_, nullptr);

    unsigned char byte = kWatcherExit;
    ssize_t written = write(signal_pipe_[1], &byte, 1);
    if (written != 1)
    {
        Logger::warn("ShutdownManager: could not wake signal watcher");
    }
    if (watcher_.joinable())
    {
        watcher_.join();
    }

    close(signal_pipe_[0]);
    close(signal_pipe_[1]);
    signal_pipe_[0] = -1;
    signal_pipe_[1] = -1;
    installed_ = false;
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    int saved_errno = errno;
    unsigned char byte = static_cast<unsigned char>(sig);
    if (signal_pipe_[1] >= 0)
    {
        // Nothing useful can be done from a handler if this fails
        ssize_t ignored = write(signal_pipe_[1], &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

void ShutdownManager::watchPipe()
{
    for (;;)
    {
        unsigned char byte = 0;
        ssize_t n = read(signal_pipe_[0], &byte, 1);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0 || byte == kWatcherExit)
        {
            return;
        }
        try
        {
            requestShutdown("Signal received", static_cast<int>(byte));
        }
        catch (const std::exception &)
        {
            // An empty reason needs no allocation
            requestShutdown(std::string(), static_cast<int>(byte));
        }
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number)
{
    std::string reason_copy = reason;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_.swap(reason_copy);
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    // The request already stands; a logging failure must not surface as a failed request
    try
    {
        if (signal_number != 0)
        {
            Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
        }
        else
        {
            Logger::info("ShutdownManager: shutdown requested - " + reason);
        }
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "ShutdownManager: could not log shutdown request: %s\n", e.what());
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdown(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    shutdown_requested_.store(false);
    last_signal_.store(0);
    reason_.clear();
}
