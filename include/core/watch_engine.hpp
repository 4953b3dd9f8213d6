#pragma once

#include "core/discovery_source.hpp"
#include "core/processed_registry.hpp"
#include "core/processing_result.hpp"
#include "core/watch_config.hpp"
#include "core/watch_event_channel.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

enum class EngineState
{
    STOPPED,
    RUNNING,
    STOPPING
};

std::string engineStateToString(EngineState state);

/**
 * @brief Outcome of WatchEngine::stop()
 */
struct StopResult
{
    bool forced = false;         // The in-flight callback outlived the stop timeout
    std::string abandoned_path;  // Identity of that callback's file, if any
};

/**
 * @brief Turns a watched directory into an exactly-once work queue
 *
 * Candidates from a DiscoverySource are filtered, deduplicated against the
 * ProcessedRegistry and debounced until their size and mtime settle, then
 * handed one at a time to the processing callback on a dedicated dispatch
 * thread. Every state change is persisted before it is acted upon.
 *
 * An engine is single-use: once stopped it cannot be started again. Build a
 * new one against the same registry file instead.
 */
class WatchEngine
{
public:
    /**
     * @param config Validated at start()
     * @param callback Processing logic; must be set
     * @param source Discovery source to use instead of the one chosen from config.discovery_mode
     * @param events Channel to publish status on; a private one is created if null
     */
    WatchEngine(WatchConfig config, ProcessingCallback callback,
                std::unique_ptr<DiscoverySource> source = nullptr,
                std::shared_ptr<WatchEventChannel> events = nullptr);
    ~WatchEngine();

    WatchEngine(const WatchEngine &) = delete;
    WatchEngine &operator=(const WatchEngine &) = delete;

    /**
     * @brief Stopped -> Running
     * @throws ConfigError for an invalid config, missing directory or unusable discovery mode
     * @throws RegistryCorruptionError if the persisted registry cannot be parsed
     * @throws WatchError if the engine has already been started
     */
    void start();

    /**
     * @brief Running -> Stopping -> Stopped
     *
     * Waits for the in-flight callback. With a timeout, a callback that is
     * still running when it expires is abandoned: its record stays
     * in_progress and is flagged for review, and its eventual outcome is
     * discarded.
     */
    StopResult stop(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void pause();
    void resume();
    bool isPaused() const;

    // Takes effect from the next dispatch
    void setCallback(ProcessingCallback callback);

    RegistryOpResult markFileAsProcessed(const std::string &path, const nlohmann::json &metadata);

    // Puts a failed (or review-flagged) file back through debounce and dispatch
    RegistryOpResult resubmit(const std::string &path);

    size_t getPendingCount() const;
    std::optional<FileRecord> getStatus(const std::string &path) const;
    EngineState getState() const;

    // Name of the active discovery source, empty before start()
    std::string discoverySourceName() const;

    WatchEventChannel &events();
    const ProcessedRegistry &registry() const;

    /**
     * @brief Discovery source implied by config.discovery_mode and the directory's filesystem
     * @throws ConfigError if events mode was requested but inotify is unavailable
     */
    static std::unique_ptr<DiscoverySource> createDiscoverySource(const WatchConfig &config);

private:
    struct SharedState;

    static void handleCandidate(const std::shared_ptr<SharedState> &state, const std::string &path);
    static void handleDiscoveryError(const std::shared_ptr<SharedState> &state, const std::exception &error);
    static void dispatchLoop(std::shared_ptr<SharedState> state);

    void ensureInputDirectory();
    void startSource();

    // Shared with the dispatch thread, which may outlive the engine after a forced stop
    std::shared_ptr<SharedState> state_;
    std::unique_ptr<DiscoverySource> source_;
    bool source_injected_;
    std::thread dispatch_thread_;
    bool started_ = false;
    std::atomic<bool> stopped_{false};
};
