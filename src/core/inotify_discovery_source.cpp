#include "core/inotify_discovery_source.hpp"
#include "core/file_utils.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <vector>

namespace
{
    constexpr uint32_t kFileEventMask = IN_CREATE | IN_MOVED_TO | IN_MODIFY | IN_CLOSE_WRITE;
    constexpr uint32_t kWatchMask = kFileEventMask | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;
    constexpr uint32_t kRootLostMask = IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED | IN_UNMOUNT;

    // Upper bound on a poll() sleep so directory loss without an event is still noticed
    constexpr int kMaxPollMillis = 1000;

    constexpr size_t kEventBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);
}

InotifyDiscoverySource::InotifyDiscoverySource(std::string directory, bool recursive, std::chrono::milliseconds coalesce_window)
    : directory_(std::move(directory)), recursive_(recursive), coalesce_window_(coalesce_window)
{
}

InotifyDiscoverySource::~InotifyDiscoverySource()
{
    stop();
}

bool InotifyDiscoverySource::isSupported()
{
    int fd = inotify_init1(IN_CLOEXEC);
    if (fd < 0)
    {
        return false;
    }
    ::close(fd);
    return true;
}

void InotifyDiscoverySource::start(CandidateHandler on_candidate, ErrorHandler on_error)
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load())
    {
        Logger::warn("InotifyDiscoverySource is already running");
        return;
    }
    if (watch_thread_.joinable())
    {
        watch_thread_.join();
    }
    closeDescriptors();

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0)
    {
        throw DiscoveryError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }
    if (::pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0)
    {
        std::string reason = std::strerror(errno);
        closeDescriptors();
        throw DiscoveryError("cannot create wake pipe: " + reason);
    }

    wd_to_path_.clear();
    windows_.clear();
    fatal_error_.clear();

    if (!addWatch(directory_))
    {
        std::string reason = std::strerror(errno);
        closeDescriptors();
        throw DiscoveryError("cannot watch " + directory_ + ": " + reason);
    }
    root_wd_ = wd_to_path_.begin()->first;
    if (recursive_)
    {
        addWatchesRecursive(directory_);
    }

    on_candidate_ = std::move(on_candidate);
    on_error_ = std::move(on_error);
    stop_requested_.store(false);
    running_.store(true);
    watch_thread_ = std::thread(&InotifyDiscoverySource::watchLoop, this);

    Logger::info("InotifyDiscoverySource started on " + directory_ + " (" + std::to_string(wd_to_path_.size()) +
                 " watches, coalesce window: " + std::to_string(coalesce_window_.count()) + "ms)");
}

void InotifyDiscoverySource::stop()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_requested_.store(true);
    if (wake_pipe_[1] >= 0)
    {
        const char byte = 'x';
        // A full pipe already guarantees a wakeup
        if (::write(wake_pipe_[1], &byte, 1) < 0 && errno != EAGAIN)
        {
            Logger::warn(std::string("InotifyDiscoverySource: wake write failed: ") + std::strerror(errno));
        }
    }

    if (watch_thread_.joinable() && watch_thread_.get_id() != std::this_thread::get_id())
    {
        watch_thread_.join();
        Logger::info("InotifyDiscoverySource stopped");
    }
    running_.store(false);
    if (!watch_thread_.joinable())
    {
        closeDescriptors();
    }
}

void InotifyDiscoverySource::closeDescriptors()
{
    if (inotify_fd_ >= 0)
    {
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
    for (int &fd : wake_pipe_)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
    root_wd_ = -1;
}

bool InotifyDiscoverySource::addWatch(const std::string &dir)
{
    int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
    if (wd < 0)
    {
        return false;
    }
    wd_to_path_[wd] = dir;
    return true;
}

void InotifyDiscoverySource::addWatchesRecursive(const std::string &dir)
{
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec))
        {
            if (!addWatch(it->path().string()))
            {
                Logger::warn("InotifyDiscoverySource: cannot watch subdirectory " + it->path().string() + ": " +
                             std::strerror(errno));
            }
        }
    }
    if (ec)
    {
        Logger::warn("InotifyDiscoverySource: error walking " + dir + ": " + ec.message());
    }
}

void InotifyDiscoverySource::emitExistingFiles(const std::string &dir)
{
    std::vector<FileMetadata> existing;
    auto file_stream = FileUtils::listFilesAsObservable(dir, recursive_);
    file_stream.subscribe(
        [&existing](const std::string &file_path)
        {
            if (auto metadata = FileUtils::getFileMetadata(file_path))
            {
                existing.push_back(*metadata);
            }
        },
        [this, &dir](const std::exception &error)
        {
            if (dir == directory_)
            {
                fatal_error_ = error.what();
            }
        },
        nullptr);

    std::stable_sort(existing.begin(), existing.end(),
                     [](const FileMetadata &a, const FileMetadata &b)
                     { return a.modification_time_ns < b.modification_time_ns; });
    for (const auto &metadata : existing)
    {
        if (stop_requested_.load())
        {
            return;
        }
        on_candidate_(metadata.file_path);
    }
}

void InotifyDiscoverySource::notePath(const std::string &path)
{
    auto now = std::chrono::steady_clock::now();
    if (coalesce_window_.count() <= 0)
    {
        on_candidate_(path);
        return;
    }

    auto it = windows_.find(path);
    if (it == windows_.end() || it->second.closes_at <= now)
    {
        windows_[path] = CoalesceWindow{now + coalesce_window_, false};
        on_candidate_(path);
        return;
    }
    it->second.dirty = true;
}

void InotifyDiscoverySource::flushWindows()
{
    auto now = std::chrono::steady_clock::now();
    for (auto it = windows_.begin(); it != windows_.end();)
    {
        if (it->second.closes_at > now)
        {
            ++it;
            continue;
        }
        if (it->second.dirty)
        {
            std::string path = it->first;
            it = windows_.erase(it);
            on_candidate_(path);
        }
        else
        {
            it = windows_.erase(it);
        }
    }
}

int InotifyDiscoverySource::pollTimeoutMillis() const
{
    int timeout = kMaxPollMillis;
    auto now = std::chrono::steady_clock::now();
    for (const auto &entry : windows_)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(entry.second.closes_at - now).count();
        timeout = std::min<int>(timeout, static_cast<int>(std::max<long long>(remaining, 0)));
    }
    return timeout;
}

void InotifyDiscoverySource::processEventBuffer(const char *buffer, ssize_t length)
{
    for (const char *ptr = buffer; ptr < buffer + length;)
    {
        const auto *event = reinterpret_cast<const struct inotify_event *>(ptr);
        ptr += sizeof(struct inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW)
        {
            Logger::warn("InotifyDiscoverySource: event queue overflowed, rescanning " + directory_);
            emitExistingFiles(directory_);
            continue;
        }

        if (event->wd == root_wd_ && (event->mask & kRootLostMask))
        {
            fatal_error_ = "watched directory was removed, moved or unmounted: " + directory_;
            return;
        }

        auto dir_it = wd_to_path_.find(event->wd);
        if (dir_it == wd_to_path_.end())
        {
            continue;
        }
        if (event->mask & IN_IGNORED)
        {
            wd_to_path_.erase(dir_it);
            continue;
        }
        if (event->len == 0)
        {
            continue;
        }

        std::string path = dir_it->second + "/" + event->name;
        if (event->mask & IN_ISDIR)
        {
            if (recursive_ && (event->mask & (IN_CREATE | IN_MOVED_TO)))
            {
                Logger::debug("InotifyDiscoverySource: new subdirectory " + path);
                if (addWatch(path))
                {
                    addWatchesRecursive(path);
                }
                // Files may have landed before the watch existed
                emitExistingFiles(path);
            }
            continue;
        }

        if (event->mask & kFileEventMask)
        {
            Logger::trace("InotifyDiscoverySource: mask " + std::to_string(event->mask) + " for " + path);
            notePath(path);
        }
    }
}

void InotifyDiscoverySource::fail(const std::string &message)
{
    Logger::error("InotifyDiscoverySource: " + message);
    running_.store(false);
    if (on_error_)
    {
        on_error_(DiscoveryError(message));
    }
}

void InotifyDiscoverySource::watchLoop()
{
    Logger::debug("InotifyDiscoverySource loop started");

    try
    {
        emitExistingFiles(directory_);
        if (!fatal_error_.empty())
        {
            fail(fatal_error_);
            return;
        }

        alignas(struct inotify_event) char buffer[kEventBufferSize];

        while (!stop_requested_.load())
        {
            struct pollfd fds[2];
            fds[0].fd = inotify_fd_;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = wake_pipe_[0];
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            int rc = ::poll(fds, 2, pollTimeoutMillis());
            if (rc < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                fail(std::string("poll failed: ") + std::strerror(errno));
                return;
            }

            if (fds[1].revents & POLLIN)
            {
                char drain[64];
                while (::read(wake_pipe_[0], drain, sizeof(drain)) > 0)
                {
                }
                if (stop_requested_.load())
                {
                    break;
                }
            }

            if (fds[0].revents & POLLIN)
            {
                for (;;)
                {
                    ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
                    if (length <= 0)
                    {
                        if (length < 0 && errno != EAGAIN && errno != EINTR)
                        {
                            fail(std::string("read from inotify failed: ") + std::strerror(errno));
                            return;
                        }
                        break;
                    }
                    processEventBuffer(buffer, length);
                    if (!fatal_error_.empty())
                    {
                        fail(fatal_error_);
                        return;
                    }
                }
            }

            flushWindows();

            if (!FileUtils::isValidDirectory(directory_))
            {
                fail("watched directory is no longer accessible: " + directory_);
                return;
            }
        }
    }
    catch (const std::exception &e)
    {
        fail(std::string("unexpected error: ") + e.what());
        return;
    }

    running_.store(false);
    Logger::debug("InotifyDiscoverySource loop ended");
}
