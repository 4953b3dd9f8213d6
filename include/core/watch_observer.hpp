#pragma once

#include <chrono>
#include <string>

enum class WatchEventType
{
    STARTED,
    STOPPED,
    PAUSED,
    RESUMED,
    FILE_QUEUED,
    FILE_DISPATCHED,
    FILE_COMPLETED,
    FILE_FAILED,
    DISCOVERY_FAILED,
    FORCED_STOP,
    CALLBACK_ABANDONED
};

std::string watchEventTypeToString(WatchEventType type);

/**
 * @brief Status update published by the engine
 */
struct WatchEvent
{
    WatchEventType type;
    std::string path;    // Empty for engine-wide events
    std::string message; // Failure description or other detail
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Observer interface for engine status updates
 *
 * Called on engine threads (discovery or dispatch), never on the caller's
 * thread; implementations must be thread-safe and should return quickly.
 */
class WatchObserver
{
public:
    virtual ~WatchObserver() = default;
    virtual void onWatchEvent(const WatchEvent &event) = 0;
};
