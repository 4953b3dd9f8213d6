#pragma once

#include "core/watch_observer.hpp"
#include <deque>
#include <mutex>
#include <vector>

/**
 * @brief Thread-safe fan-out of engine status events
 *
 * Events go to every subscribed observer and into a bounded buffer that an
 * embedding application without its own threads can drain with poll().
 * When the buffer is full the oldest event is dropped.
 */
class WatchEventChannel
{
public:
    explicit WatchEventChannel(size_t capacity = 1024);

    void subscribe(WatchObserver *observer);
    void unsubscribe(WatchObserver *observer);

    void publish(WatchEventType type, const std::string &path = "", const std::string &message = "");
    void publish(const WatchEvent &event);

    // Removes and returns every buffered event, oldest first
    std::vector<WatchEvent> poll();

    size_t droppedCount() const;

private:
    mutable std::mutex observers_mutex_;
    std::vector<WatchObserver *> observers_;

    mutable std::mutex buffer_mutex_;
    std::deque<WatchEvent> buffer_;
    size_t capacity_;
    size_t dropped_ = 0;
};
