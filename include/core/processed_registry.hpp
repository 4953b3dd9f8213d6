#pragma once

#include "core/file_record.hpp"
#include "core/file_utils.hpp"
#include "core/watch_errors.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Durable record of every file the engine has queued or handled
 *
 * The whole registry is rewritten as one JSON snapshot (temp file + atomic
 * rename) after each mutation, so a crash never loses a "completed" fact and
 * never leaves a half-written file behind. Identities are normalized paths.
 *
 * Thread-safe. The engine serializes its own state with its mutex and calls
 * into the registry while holding it; the registry never calls back out.
 */
class ProcessedRegistry
{
public:
    static constexpr int kFormatVersion = 1;

    explicit ProcessedRegistry(std::string registry_path);

    /**
     * @brief Read the persisted snapshot
     *
     * A missing file yields an empty registry. Records left in_progress by a
     * previous run are flagged for review, not redispatched.
     * @throws RegistryCorruptionError if the file exists but cannot be parsed
     */
    void load();

    /**
     * @brief Discard the current (possibly corrupt) snapshot and start empty
     *
     * The old file is kept aside as "<path>.corrupt-<timestamp>".
     */
    RegistryOpResult reset();

    bool isLoaded() const;

    // True for completed or in_progress records
    bool isKnown(const std::string &identity) const;

    std::optional<FileStatus> getStatus(const std::string &identity) const;
    std::optional<FileRecord> getRecord(const std::string &identity) const;

    RegistryOpResult recordPending(const std::string &identity, const FileMetadata &metadata);
    RegistryOpResult recordInProgress(const std::string &identity);
    RegistryOpResult recordCompleted(const std::string &identity, const nlohmann::json &result);
    RegistryOpResult recordFailed(const std::string &identity, const std::string &error_description);

    // Completed without ever being dispatched, e.g. handled outside the engine
    RegistryOpResult markProcessed(const std::string &identity, const nlohmann::json &metadata);

    RegistryOpResult flagNeedsReview(const std::string &identity, const std::string &reason);

    // failed / in_progress -> pending so the engine will dispatch it again
    RegistryOpResult resetForResubmit(const std::string &identity);

    /**
     * @brief Keep only the newest max_entries finished records
     *
     * Only completed and failed records are candidates; pending and
     * in_progress ones are never removed. Never called by the engine.
     */
    RegistryOpResult prune(size_t max_entries, size_t *removed = nullptr);

    size_t size() const;
    size_t countWithStatus(FileStatus status) const;
    std::vector<FileRecord> recordsNeedingReview() const;

    const std::string &path() const { return registry_path_; }

private:
    RegistryOpResult persistLocked();
    FileRecord &upsertLocked(const std::string &identity);
    nlohmann::json snapshotLocked() const;

    std::string registry_path_;
    mutable std::mutex mutex_;
    std::map<std::string, FileRecord> records_;
    nlohmann::json document_extra_ = nlohmann::json::object();
    bool loaded_ = false;
};
