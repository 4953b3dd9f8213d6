#include "core/watch_event_channel.hpp"
#include "logging/logger.hpp"
#include <algorithm>

std::string watchEventTypeToString(WatchEventType type)
{
    switch (type)
    {
    case WatchEventType::STARTED:
        return "started";
    case WatchEventType::STOPPED:
        return "stopped";
    case WatchEventType::PAUSED:
        return "paused";
    case WatchEventType::RESUMED:
        return "resumed";
    case WatchEventType::FILE_QUEUED:
        return "file_queued";
    case WatchEventType::FILE_DISPATCHED:
        return "file_dispatched";
    case WatchEventType::FILE_COMPLETED:
        return "file_completed";
    case WatchEventType::FILE_FAILED:
        return "file_failed";
    case WatchEventType::DISCOVERY_FAILED:
        return "discovery_failed";
    case WatchEventType::FORCED_STOP:
        return "forced_stop";
    case WatchEventType::CALLBACK_ABANDONED:
        return "callback_abandoned";
    }
    return "unknown";
}

WatchEventChannel::WatchEventChannel(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
{
}

void WatchEventChannel::subscribe(WatchObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void WatchEventChannel::unsubscribe(WatchObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
}

void WatchEventChannel::publish(WatchEventType type, const std::string &path, const std::string &message)
{
    publish(WatchEvent{type, path, message, std::chrono::system_clock::now()});
}

void WatchEventChannel::publish(const WatchEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (buffer_.size() >= capacity_)
        {
            buffer_.pop_front();
            ++dropped_;
        }
        buffer_.push_back(event);
    }

    std::lock_guard<std::mutex> lock(observers_mutex_);
    for (auto observer : observers_)
    {
        try
        {
            observer->onWatchEvent(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in watch observer handling " + watchEventTypeToString(event.type) + ": " + e.what());
        }
    }
}

std::vector<WatchEvent> WatchEventChannel::poll()
{
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    std::vector<WatchEvent> events(buffer_.begin(), buffer_.end());
    buffer_.clear();
    return events;
}

size_t WatchEventChannel::droppedCount() const
{
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return dropped_;
}
