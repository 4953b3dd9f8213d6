#pragma once

#include "core/watch_engine.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Lifecycle controller the embedding application talks to
 *
 * Wraps one WatchEngine per start()/stop() session. Observers and the
 * poll buffer belong to the service, so they survive restarts.
 * All methods are safe to call from any thread.
 */
class WatchService
{
public:
    WatchService();
    ~WatchService();

    WatchService(const WatchService &) = delete;
    WatchService &operator=(const WatchService &) = delete;

    /**
     * @brief Begin watching config.input_directory
     * @throws ConfigError, RegistryCorruptionError or DiscoveryError; the service stays stopped
     * @throws WatchError if a session is already running
     */
    void start(const WatchConfig &config, ProcessingCallback callback);

    // Same, with a caller-supplied discovery source
    void start(const WatchConfig &config, ProcessingCallback callback, std::unique_ptr<DiscoverySource> source);

    /**
     * @brief Stop the current session
     * @param timeout Bound on the wait for the in-flight callback; config.stop_timeout_seconds applies when unset
     */
    StopResult stop(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void setCallback(ProcessingCallback callback);
    void pause();
    void resume();

    RegistryOpResult markFileAsProcessed(const std::string &path, const nlohmann::json &metadata);
    RegistryOpResult resubmit(const std::string &path);

    size_t getPendingCount() const;
    std::optional<FileRecord> getStatus(const std::string &path) const;
    EngineState getState() const;
    bool isPaused() const;

    void addObserver(WatchObserver *observer);
    void removeObserver(WatchObserver *observer);

    // Drains events buffered since the last call, oldest first
    std::vector<WatchEvent> pollEvents();

private:
    std::shared_ptr<WatchEventChannel> events_;
    // Kept after stop() so registry queries still answer until the next start()
    std::shared_ptr<WatchEngine> engine_;
    std::optional<std::chrono::milliseconds> default_stop_timeout_;
    mutable std::mutex mutex_;
};
