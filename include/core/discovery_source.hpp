#pragma once

#include <exception>
#include <functional>
#include <string>

/**
 * @brief Produces candidate file paths for the watch engine
 *
 * Implementations run on their own background thread. Every implementation
 * emits all files already present in the directory before reporting live
 * changes, so files that arrived while the process was down are not missed.
 * Candidates are raw: the engine filters and deduplicates them.
 */
class DiscoverySource
{
public:
    using CandidateHandler = std::function<void(const std::string &path)>;
    // Called at most once per session, from the source's thread, after which the source stops emitting
    using ErrorHandler = std::function<void(const std::exception &error)>;

    virtual ~DiscoverySource() = default;

    /**
     * @brief Begin discovery in the background
     * @throws DiscoveryError if the source cannot be set up at all
     */
    virtual void start(CandidateHandler on_candidate, ErrorHandler on_error) = 0;

    // Blocks until the background thread has exited; safe to call repeatedly
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    virtual std::string name() const = 0;
};
