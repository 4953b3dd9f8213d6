#include "core/watch_engine.hpp"
#include "core/debounce_tracker.hpp"
#include "core/file_utils.hpp"
#include "core/inotify_discovery_source.hpp"
#include "core/path_filter.hpp"
#include "core/polling_discovery_source.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <system_error>
#include <vector>

std::string engineStateToString(EngineState state)
{
    switch (state)
    {
    case EngineState::STOPPED:
        return "stopped";
    case EngineState::RUNNING:
        return "running";
    case EngineState::STOPPING:
        return "stopping";
    }
    return "unknown";
}

namespace
{
    WatchEvent makeEvent(WatchEventType type, const std::string &path, const std::string &message = "")
    {
        return WatchEvent{type, path, message, std::chrono::system_clock::now()};
    }

    ProcessingResult invokeCallback(const ProcessingCallback &callback, const std::string &identity)
    {
        try
        {
            return callback(identity);
        }
        catch (const std::exception &e)
        {
            return ProcessingResult::failure(e.what());
        }
        catch (...)
        {
            return ProcessingResult::failure("processing callback threw a non-standard exception");
        }
    }
}

/**
 * @brief Everything the discovery and dispatch threads touch
 *
 * Members below the mutex are guarded by it. Methods named *Locked expect
 * the caller to hold it.
 */
struct WatchEngine::SharedState
{
    SharedState(WatchConfig cfg, ProcessingCallback cb, std::shared_ptr<WatchEventChannel> channel)
        : config(std::move(cfg)),
          filter(config),
          registry(config.registry_file_path),
          callback(std::move(cb)),
          tracker(config.debounce()),
          events(channel ? std::move(channel) : std::make_shared<WatchEventChannel>())
    {
    }

    const WatchConfig config;
    const PathFilter filter;
    ProcessedRegistry registry;

    mutable std::mutex mutex;
    std::condition_variable wake_cv;
    std::condition_variable done_cv;

    ProcessingCallback callback;
    DebounceTracker tracker;
    std::deque<std::string> queue;
    std::set<std::string> queued;
    std::string in_flight;
    bool paused = false;
    bool stop_requested = false;
    bool abandoned = false;
    bool discovery_failed = false;
    bool dispatch_done = false;

    std::atomic<EngineState> engine_state{EngineState::STOPPED};

    std::shared_ptr<WatchEventChannel> events;

    void publish(const std::vector<WatchEvent> &pending)
    {
        for (const auto &event : pending)
        {
            events->publish(event);
        }
    }

    // Not queued, not in flight, and the registry has nothing but a pending record for it
    bool isDispatchableLocked(const std::string &identity) const
    {
        if (in_flight == identity || queued.count(identity) > 0)
        {
            Logger::trace("Duplicate candidate " + identity + ": already queued or in flight");
            return false;
        }
        auto status = registry.getStatus(identity);
        if (status && *status != FileStatus::PENDING)
        {
            Logger::trace("Duplicate candidate " + identity + ": registry status " + fileStatusToString(*status));
            return false;
        }
        return true;
    }

    void removeFromQueueLocked(const std::string &identity)
    {
        if (queued.erase(identity) > 0)
        {
            queue.erase(std::remove(queue.begin(), queue.end(), identity), queue.end());
        }
    }

    void enqueueLocked(const std::string &identity, const FileMetadata &metadata, std::vector<WatchEvent> &pending)
    {
        tracker.remove(identity);

        RegistryOpResult recorded = registry.recordPending(identity, metadata);
        if (!recorded.success)
        {
            Logger::error("Could not persist pending record for " + identity + ": " + recorded.error_message);
        }

        queue.push_back(identity);
        queued.insert(identity);
        Logger::info("Queued " + identity + " (" + std::to_string(metadata.file_size) + " bytes)");
        pending.push_back(makeEvent(WatchEventType::FILE_QUEUED, identity));
    }

    void observeLocked(const std::string &identity, const FileMetadata &metadata,
                       DebounceTracker::Clock::time_point now, std::vector<WatchEvent> &pending)
    {
        switch (tracker.observe(identity, metadata, now))
        {
        case DebounceTracker::Observation::STARTED:
            Logger::debug("Debouncing " + identity);
            break;
        case DebounceTracker::Observation::CHANGED:
            Logger::trace(identity + " is still changing: " + metadata.toString());
            break;
        case DebounceTracker::Observation::UNCHANGED:
            break;
        case DebounceTracker::Observation::STABLE:
            enqueueLocked(identity, metadata, pending);
            break;
        }
    }

    // Re-stat every file under debounce, oldest observation first
    void refreshDebounceLocked(std::vector<WatchEvent> &pending)
    {
        if (tracker.size() == 0)
        {
            return;
        }
        auto now = DebounceTracker::Clock::now();
        for (const auto &identity : tracker.identitiesInObservationOrder())
        {
            auto metadata = FileUtils::getFileMetadata(identity);
            if (!metadata)
            {
                Logger::debug(identity + " disappeared during debounce; forgetting it");
                tracker.remove(identity);
                continue;
            }
            if (!isDispatchableLocked(identity))
            {
                tracker.remove(identity);
                continue;
            }
            observeLocked(identity, *metadata, now, pending);
        }
    }

    void recordFailureLocked(const std::string &identity, const std::string &error, std::vector<WatchEvent> &pending)
    {
        Logger::error("Processing failed for " + identity + ": " + error);
        RegistryOpResult recorded = registry.recordFailed(identity, error);
        if (!recorded.success)
        {
            Logger::error("Could not persist failure for " + identity + ": " + recorded.error_message);
        }
        pending.push_back(makeEvent(WatchEventType::FILE_FAILED, identity, error));
    }

    // Called with the lock held; releases it around the callback and the event publication
    void dispatchOneLocked(std::unique_lock<std::mutex> &lock, const std::string &identity)
    {
        std::vector<WatchEvent> pending;

        if (!FileUtils::getFileMetadata(identity))
        {
            recordFailureLocked(identity, "path vanished: " + identity + " no longer exists at dispatch", pending);
            lock.unlock();
            publish(pending);
            lock.lock();
            return;
        }

        RegistryOpResult marked = registry.recordInProgress(identity);
        if (!marked.success)
        {
            Logger::error("Could not persist in_progress record for " + identity + ": " + marked.error_message);
        }
        in_flight = identity;
        ProcessingCallback current_callback = callback;
        pending.push_back(makeEvent(WatchEventType::FILE_DISPATCHED, identity));

        lock.unlock();
        publish(pending);
        pending.clear();

        Logger::info("Dispatching " + identity);
        ProcessingResult result = invokeCallback(current_callback, identity);

        lock.lock();
        in_flight.clear();

        if (abandoned)
        {
            Logger::warn("Abandoned callback for " + identity + " returned " +
                         (result.success ? std::string("success") : "failure: " + result.error_message) +
                         "; outcome discarded");
            return;
        }

        auto status = registry.getStatus(identity);
        if (!status || *status != FileStatus::IN_PROGRESS)
        {
            Logger::info(identity + " was marked externally while its callback ran; callback outcome not recorded");
            return;
        }

        if (result.success)
        {
            nlohmann::json payload = result.payload.is_null() ? nlohmann::json::object() : result.payload;
            RegistryOpResult recorded = registry.recordCompleted(identity, payload);
            if (!recorded.success)
            {
                Logger::error("Could not persist completion for " + identity + ": " + recorded.error_message);
            }
            Logger::info("Completed " + identity);
            pending.push_back(makeEvent(WatchEventType::FILE_COMPLETED, identity));
        }
        else
        {
            std::string error = result.error_message.empty() ? "processing failed" : result.error_message;
            if (!FileUtils::getFileMetadata(identity))
            {
                error = "path vanished: " + identity + " (" + error + ")";
            }
            recordFailureLocked(identity, error, pending);
        }

        lock.unlock();
        publish(pending);
        lock.lock();
    }
};

WatchEngine::WatchEngine(WatchConfig config, ProcessingCallback callback,
                         std::unique_ptr<DiscoverySource> source,
                         std::shared_ptr<WatchEventChannel> events)
    : source_(std::move(source)),
      source_injected_(source_ != nullptr)
{
    if (!config.input_directory.empty())
    {
        config.input_directory = FileUtils::normalizePath(config.input_directory);
    }
    state_ = std::make_shared<SharedState>(std::move(config), std::move(callback), std::move(events));
}

WatchEngine::~WatchEngine()
{
    try
    {
        stop(state_->config.stopTimeout());
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Error stopping watch engine: ") + e.what());
    }
}

void WatchEngine::start()
{
    if (started_)
    {
        throw WatchError("Watch engine for " + state_->config.input_directory + " has already been started");
    }

    state_->config.validate();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->callback)
        {
            throw ConfigError("a processing callback is required");
        }
    }
    ensureInputDirectory();

    if (!state_->registry.isLoaded())
    {
        state_->registry.load();
    }
    size_t needs_review = state_->registry.recordsNeedingReview().size();
    if (needs_review > 0)
    {
        Logger::warn(std::to_string(needs_review) + " registry records need review and will not be dispatched");
    }

    state_->engine_state.store(EngineState::RUNNING);
    try
    {
        startSource();
    }
    catch (const std::exception &)
    {
        state_->engine_state.store(EngineState::STOPPED);
        throw;
    }

    started_ = true;
    dispatch_thread_ = std::thread(&WatchEngine::dispatchLoop, state_);

    Logger::info("Watch engine started on " + state_->config.input_directory + " using " + source_->name() +
                 " discovery (debounce " + std::to_string(state_->config.debounce().count()) + "ms)");
    state_->events->publish(WatchEventType::STARTED, state_->config.input_directory, source_->name());
}

void WatchEngine::ensureInputDirectory()
{
    const std::string &dir = state_->config.input_directory;
    if (FileUtils::isValidDirectory(dir))
    {
        return;
    }
    if (fs::exists(dir))
    {
        throw ConfigError("input directory is not a directory: " + dir);
    }
    if (!state_->config.create_input_directory)
    {
        throw ConfigError("input directory does not exist: " + dir);
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        throw ConfigError("could not create input directory " + dir + ": " + ec.message());
    }
    Logger::info("Created input directory " + dir);
}

void WatchEngine::startSource()
{
    const WatchConfig &config = state_->config;
    if (!source_)
    {
        source_ = createDiscoverySource(config);
    }

    std::shared_ptr<SharedState> state = state_;
    DiscoverySource::CandidateHandler on_candidate = [state](const std::string &path)
    {
        handleCandidate(state, path);
    };
    DiscoverySource::ErrorHandler on_error = [state](const std::exception &error)
    {
        handleDiscoveryError(state, error);
    };

    try
    {
        source_->start(on_candidate, on_error);
    }
    catch (const DiscoveryError &e)
    {
        if (config.discovery_mode == DiscoveryMode::EVENTS && !source_injected_)
        {
            throw ConfigError(std::string("inotify watching is unavailable for ") + config.input_directory + ": " + e.what());
        }
        if (source_injected_ || config.discovery_mode != DiscoveryMode::AUTO || source_->name() == "polling")
        {
            throw;
        }
        Logger::warn(std::string("Event-driven discovery failed (") + e.what() + "); falling back to polling");
        source_ = std::make_unique<PollingDiscoverySource>(config.input_directory, config.pollInterval(), config.recursive);
        source_->start(on_candidate, on_error);
    }
}

std::unique_ptr<DiscoverySource> WatchEngine::createDiscoverySource(const WatchConfig &config)
{
    auto polling = [&config]()
    {
        return std::make_unique<PollingDiscoverySource>(config.input_directory, config.pollInterval(), config.recursive);
    };
    auto inotify = [&config]()
    {
        auto window = std::min(config.debounce(), std::chrono::milliseconds(1000));
        return std::make_unique<InotifyDiscoverySource>(config.input_directory, config.recursive, window);
    };

    const bool network = FileUtils::isNetworkFilesystem(config.input_directory);

    switch (config.discovery_mode)
    {
    case DiscoveryMode::POLLING:
        return polling();
    case DiscoveryMode::EVENTS:
        if (!InotifyDiscoverySource::isSupported())
        {
            throw ConfigError("discoveryMode is events but inotify is not available");
        }
        if (network)
        {
            Logger::warn(config.input_directory + " is on a network filesystem; inotify may miss remote changes");
        }
        return inotify();
    case DiscoveryMode::AUTO:
        break;
    }

    if (network)
    {
        Logger::warn(config.input_directory + " is on a network filesystem; using polling discovery");
        return polling();
    }
    if (!InotifyDiscoverySource::isSupported())
    {
        Logger::warn("inotify is not available; using polling discovery");
        return polling();
    }
    return inotify();
}

void WatchEngine::handleCandidate(const std::shared_ptr<SharedState> &state, const std::string &path)
{
    const std::string identity = FileUtils::normalizePath(path);

    PathFilter::Verdict verdict = state->filter.evaluate(identity);
    if (verdict != PathFilter::Verdict::ELIGIBLE)
    {
        Logger::trace("Ignoring " + identity + ": " + PathFilter::verdictToString(verdict));
        return;
    }

    auto metadata = FileUtils::getFileMetadata(identity);
    if (!metadata)
    {
        return;
    }

    std::vector<WatchEvent> pending;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->engine_state.load() != EngineState::RUNNING || state->stop_requested)
        {
            return;
        }
        if (!state->isDispatchableLocked(identity))
        {
            state->tracker.remove(identity);
            return;
        }
        state->observeLocked(identity, *metadata, DebounceTracker::Clock::now(), pending);
    }
    state->wake_cv.notify_all();
    state->publish(pending);
}

void WatchEngine::handleDiscoveryError(const std::shared_ptr<SharedState> &state, const std::exception &error)
{
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stop_requested)
        {
            Logger::debug(std::string("Discovery error during shutdown ignored: ") + error.what());
            return;
        }
        state->discovery_failed = true;
        state->stop_requested = true;
        state->engine_state.store(EngineState::STOPPING);
    }
    Logger::error(std::string("Discovery failed, stopping watch session: ") + error.what());
    state->wake_cv.notify_all();
    state->events->publish(WatchEventType::DISCOVERY_FAILED, state->config.input_directory, error.what());
}

void WatchEngine::dispatchLoop(std::shared_ptr<SharedState> state)
{
    Logger::debug("Dispatch loop started for " + state->config.input_directory);

    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stop_requested)
    {
        std::vector<WatchEvent> pending;
        state->refreshDebounceLocked(pending);

        if (!pending.empty())
        {
            lock.unlock();
            state->publish(pending);
            lock.lock();
            continue;
        }

        if (!state->paused && !state->queue.empty())
        {
            std::string identity = state->queue.front();
            state->queue.pop_front();
            state->queued.erase(identity);
            state->dispatchOneLocked(lock, identity);
            continue;
        }

        state->wake_cv.wait_for(lock, state->config.stabilityCheckInterval());
    }

    state->tracker.clear();
    state->dispatch_done = true;
    const bool report_stopped = state->discovery_failed && !state->abandoned;
    if (state->discovery_failed)
    {
        state->engine_state.store(EngineState::STOPPED);
    }
    lock.unlock();
    state->done_cv.notify_all();

    Logger::debug("Dispatch loop exited for " + state->config.input_directory);
    if (report_stopped)
    {
        Logger::info("Watch engine stopped after a discovery failure");
        state->events->publish(WatchEventType::STOPPED, state->config.input_directory, "discovery failed");
    }
}

StopResult WatchEngine::stop(std::optional<std::chrono::milliseconds> timeout)
{
    StopResult result;
    if (!started_ || stopped_.exchange(true))
    {
        return result;
    }

    const EngineState previous = state_->engine_state.load();
    if (previous == EngineState::RUNNING)
    {
        state_->engine_state.store(EngineState::STOPPING);
    }
    Logger::info("Stopping watch engine for " + state_->config.input_directory);

    if (source_)
    {
        source_->stop();
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stop_requested = true;
    }
    state_->wake_cv.notify_all();

    if (dispatch_thread_.joinable())
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        auto finished = [this]()
        { return state_->dispatch_done; };

        bool done = true;
        if (timeout)
        {
            done = state_->done_cv.wait_for(lock, *timeout, finished);
        }
        else
        {
            state_->done_cv.wait(lock, finished);
        }

        if (!done)
        {
            result.forced = true;
            result.abandoned_path = state_->in_flight;
            state_->abandoned = true;
            if (!result.abandoned_path.empty())
            {
                RegistryOpResult flagged = state_->registry.flagNeedsReview(
                    result.abandoned_path,
                    "processing callback still running after the " + std::to_string(timeout->count()) +
                        "ms stop timeout");
                if (!flagged.success)
                {
                    Logger::error("Could not flag " + result.abandoned_path + " for review: " + flagged.error_message);
                }
            }
            lock.unlock();
            // The thread keeps its own reference to the shared state
            dispatch_thread_.detach();
        }
        else
        {
            lock.unlock();
            dispatch_thread_.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->tracker.clear();
    }
    state_->engine_state.store(EngineState::STOPPED);

    if (result.forced)
    {
        Logger::warn("Forced stop: callback for " +
                     (result.abandoned_path.empty() ? std::string("<none>") : result.abandoned_path) +
                     " abandoned");
        state_->events->publish(WatchEventType::FORCED_STOP, state_->config.input_directory);
        if (!result.abandoned_path.empty())
        {
            state_->events->publish(WatchEventType::CALLBACK_ABANDONED, result.abandoned_path,
                                    "left in_progress and flagged for review");
        }
    }

    // After a discovery failure the dispatch loop has already reported the stop
    if (previous == EngineState::RUNNING)
    {
        Logger::info("Watch engine stopped for " + state_->config.input_directory);
        state_->events->publish(WatchEventType::STOPPED, state_->config.input_directory);
    }
    return result;
}

void WatchEngine::pause()
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->paused)
        {
            return;
        }
        state_->paused = true;
    }
    Logger::info("Dispatch paused; discovery and debounce continue");
    state_->events->publish(WatchEventType::PAUSED);
}

void WatchEngine::resume()
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->paused)
        {
            return;
        }
        state_->paused = false;
    }
    state_->wake_cv.notify_all();
    Logger::info("Dispatch resumed");
    state_->events->publish(WatchEventType::RESUMED);
}

bool WatchEngine::isPaused() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->paused;
}

void WatchEngine::setCallback(ProcessingCallback callback)
{
    if (!callback)
    {
        throw ConfigError("a processing callback is required");
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callback = std::move(callback);
}

RegistryOpResult WatchEngine::markFileAsProcessed(const std::string &path, const nlohmann::json &metadata)
{
    const std::string identity = FileUtils::normalizePath(path);

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->registry.isLoaded())
    {
        return RegistryOpResult(false, "registry not loaded; start the engine first");
    }
    state_->tracker.remove(identity);
    state_->removeFromQueueLocked(identity);
    if (state_->in_flight == identity)
    {
        Logger::info(identity + " marked processed while its callback is running");
    }

    RegistryOpResult result = state_->registry.markProcessed(identity, metadata);
    if (result.success)
    {
        Logger::info("Marked " + identity + " as processed");
    }
    return result;
}

RegistryOpResult WatchEngine::resubmit(const std::string &path)
{
    const std::string identity = FileUtils::normalizePath(path);

    std::vector<WatchEvent> pending;
    RegistryOpResult result;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->registry.isLoaded())
        {
            return RegistryOpResult(false, "registry not loaded; start the engine first");
        }
        if (state_->in_flight == identity || state_->queued.count(identity) > 0)
        {
            return RegistryOpResult(false, identity + " is already queued or in progress");
        }

        result = state_->registry.resetForResubmit(identity);
        if (!result.success)
        {
            return result;
        }

        state_->tracker.remove(identity);
        if (state_->engine_state.load() == EngineState::RUNNING)
        {
            if (auto metadata = FileUtils::getFileMetadata(identity))
            {
                state_->observeLocked(identity, *metadata, DebounceTracker::Clock::now(), pending);
            }
        }
    }
    Logger::info("Resubmitted " + identity);
    state_->wake_cv.notify_all();
    state_->publish(pending);
    return result;
}

size_t WatchEngine::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

std::optional<FileRecord> WatchEngine::getStatus(const std::string &path) const
{
    return state_->registry.getRecord(FileUtils::normalizePath(path));
}

EngineState WatchEngine::getState() const
{
    return state_->engine_state.load();
}

std::string WatchEngine::discoverySourceName() const
{
    return started_ && source_ ? source_->name() : std::string();
}

WatchEventChannel &WatchEngine::events()
{
    return *state_->events;
}

const ProcessedRegistry &WatchEngine::registry() const
{
    return state_->registry;
}
