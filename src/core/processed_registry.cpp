#include "core/processed_registry.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ProcessedRegistry::ProcessedRegistry(std::string registry_path)
    : registry_path_(std::move(registry_path))
{
}

void ProcessedRegistry::load()
{
    std::lock_guard<std::mutex> lock(mutex_);

    records_.clear();
    document_extra_ = nlohmann::json::object();

    std::error_code ec;
    if (!fs::exists(registry_path_, ec))
    {
        Logger::info("No registry found at " + registry_path_ + ", starting with an empty registry");
        loaded_ = true;
        return;
    }

    std::ifstream in(registry_path_, std::ios::binary);
    if (!in.is_open())
    {
        throw RegistryCorruptionError(registry_path_, "file exists but cannot be opened");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(buffer.str());
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw RegistryCorruptionError(registry_path_, e.what());
    }

    if (!document.is_object())
    {
        throw RegistryCorruptionError(registry_path_, "top-level value is not an object");
    }

    std::map<std::string, FileRecord> loaded_records;
    if (document.contains("files"))
    {
        const auto &files = document.at("files");
        if (!files.is_object())
        {
            throw RegistryCorruptionError(registry_path_, "'files' is not an object");
        }
        for (auto it = files.begin(); it != files.end(); ++it)
        {
            try
            {
                std::string identity = FileRecord::identityFromStorageKey(it.key());
                FileRecord record = FileRecord::fromJson(identity, it.value());
                loaded_records.emplace(identity, std::move(record));
            }
            catch (const std::exception &e)
            {
                throw RegistryCorruptionError(registry_path_, e.what());
            }
        }
    }

    size_t interrupted = 0;
    for (auto &entry : loaded_records)
    {
        FileRecord &record = entry.second;
        if (record.status == FileStatus::IN_PROGRESS && !record.needs_review)
        {
            record.needs_review = true;
            record.review_reason = "dispatch interrupted before an outcome was recorded";
            ++interrupted;
            Logger::warn("Registry: " + record.identity + " was in progress when the previous run ended; flagged for review");
        }
    }

    document.erase("files");
    document_extra_ = document;
    records_ = std::move(loaded_records);
    loaded_ = true;

    Logger::info("Loaded registry " + registry_path_ + " with " + std::to_string(records_.size()) + " records" +
                 (interrupted > 0 ? " (" + std::to_string(interrupted) + " interrupted)" : ""));
}

RegistryOpResult ProcessedRegistry::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (fs::exists(registry_path_, ec))
    {
        std::string stamp = FileUtils::currentTimestampUtc();
        std::replace(stamp.begin(), stamp.end(), ':', '-');
        std::string aside = registry_path_ + ".corrupt-" + stamp;
        fs::rename(registry_path_, aside, ec);
        if (ec)
        {
            return RegistryOpResult(false, "Could not move registry aside: " + ec.message());
        }
        Logger::warn("Registry " + registry_path_ + " discarded; previous contents kept at " + aside);
    }

    records_.clear();
    document_extra_ = nlohmann::json::object();
    loaded_ = true;
    return persistLocked();
}

bool ProcessedRegistry::isLoaded() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

bool ProcessedRegistry::isKnown(const std::string &identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(FileUtils::normalizePath(identity));
    if (it == records_.end())
    {
        return false;
    }
    return it->second.status == FileStatus::COMPLETED || it->second.status == FileStatus::IN_PROGRESS;
}

std::optional<FileStatus> ProcessedRegistry::getStatus(const std::string &identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(FileUtils::normalizePath(identity));
    if (it == records_.end())
    {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<FileRecord> ProcessedRegistry::getRecord(const std::string &identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(FileUtils::normalizePath(identity));
    if (it == records_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

RegistryOpResult ProcessedRegistry::recordPending(const std::string &identity, const FileMetadata &metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord &record = upsertLocked(identity);
    record.status = FileStatus::PENDING;
    record.size = metadata.file_size;
    record.mtime_ns = metadata.modification_time_ns;
    record.error.clear();
    record.needs_review = false;
    record.review_reason.clear();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::recordInProgress(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord &record = upsertLocked(identity);
    record.status = FileStatus::IN_PROGRESS;
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::recordCompleted(const std::string &identity, const nlohmann::json &result)
{
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord &record = upsertLocked(identity);
    record.status = FileStatus::COMPLETED;
    record.completed_at = record.updated_at;
    record.result = result.is_null() ? nlohmann::json::object() : sanitizeUtf8Json(result);
    record.error.clear();
    record.needs_review = false;
    record.review_reason.clear();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::recordFailed(const std::string &identity, const std::string &error_description)
{
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord &record = upsertLocked(identity);
    record.status = FileStatus::FAILED;
    record.error = sanitizeUtf8Text(error_description);
    record.needs_review = false;
    record.review_reason.clear();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::markProcessed(const std::string &identity, const nlohmann::json &metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    FileRecord &record = upsertLocked(identity);

    // The file may not exist yet; keep whatever stamp we already had
    if (auto current = FileUtils::getFileMetadata(record.identity))
    {
        record.size = current->file_size;
        record.mtime_ns = current->modification_time_ns;
    }
    record.status = FileStatus::COMPLETED;
    record.completed_at = record.updated_at;
    record.result = metadata.is_null() ? nlohmann::json::object() : sanitizeUtf8Json(metadata);
    record.error.clear();
    record.needs_review = false;
    record.review_reason.clear();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::flagNeedsReview(const std::string &identity, const std::string &reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(FileUtils::normalizePath(identity));
    if (it == records_.end())
    {
        return RegistryOpResult(false, "No record for " + identity);
    }
    it->second.needs_review = true;
    it->second.review_reason = sanitizeUtf8Text(reason);
    it->second.updated_at = FileUtils::currentTimestampUtc();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::resetForResubmit(const std::string &identity)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(FileUtils::normalizePath(identity));
    if (it == records_.end())
    {
        return RegistryOpResult(true);
    }
    if (it->second.status == FileStatus::COMPLETED)
    {
        return RegistryOpResult(false, "Record already completed: " + identity);
    }
    it->second.status = FileStatus::PENDING;
    it->second.error.clear();
    it->second.needs_review = false;
    it->second.review_reason.clear();
    it->second.updated_at = FileUtils::currentTimestampUtc();
    return persistLocked();
}

RegistryOpResult ProcessedRegistry::prune(size_t max_entries, size_t *removed)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const FileRecord *> finished;
    for (const auto &entry : records_)
    {
        if (entry.second.status == FileStatus::COMPLETED || entry.second.status == FileStatus::FAILED)
        {
            finished.push_back(&entry.second);
        }
    }

    if (removed)
    {
        *removed = 0;
    }
    if (finished.size() <= max_entries)
    {
        return RegistryOpResult(true);
    }

    // ISO 8601 UTC timestamps sort lexicographically; newest first
    std::stable_sort(finished.begin(), finished.end(),
                     [](const FileRecord *a, const FileRecord *b)
                     { return a->updated_at > b->updated_at; });

    std::vector<std::string> doomed;
    for (size_t i = max_entries; i < finished.size(); ++i)
    {
        doomed.push_back(finished[i]->identity);
    }
    for (const auto &identity : doomed)
    {
        records_.erase(identity);
    }

    Logger::info("Pruned " + std::to_string(doomed.size()) + " finished records from registry " + registry_path_ +
                 " (kept " + std::to_string(max_entries) + ")");
    if (removed)
    {
        *removed = doomed.size();
    }
    return persistLocked();
}

size_t ProcessedRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t ProcessedRegistry::countWithStatus(FileStatus status) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                             [status](const std::pair<const std::string, FileRecord> &entry)
                                             { return entry.second.status == status; }));
}

std::vector<FileRecord> ProcessedRegistry::recordsNeedingReview() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileRecord> result;
    for (const auto &entry : records_)
    {
        if (entry.second.needs_review)
        {
            result.push_back(entry.second);
        }
    }
    return result;
}

FileRecord &ProcessedRegistry::upsertLocked(const std::string &identity)
{
    std::string key = FileUtils::normalizePath(identity);
    auto it = records_.find(key);
    if (it == records_.end())
    {
        FileRecord record;
        record.identity = key;
        it = records_.emplace(key, std::move(record)).first;
    }
    it->second.updated_at = FileUtils::currentTimestampUtc();
    return it->second;
}

nlohmann::json ProcessedRegistry::snapshotLocked() const
{
    nlohmann::json document = document_extra_.is_object() ? document_extra_ : nlohmann::json::object();
    if (!document.contains("version"))
    {
        document["version"] = kFormatVersion;
    }

    nlohmann::json files = nlohmann::json::object();
    for (const auto &entry : records_)
    {
        files[FileRecord::storageKey(entry.first)] = entry.second.toJson();
    }
    document["files"] = std::move(files);
    return document;
}

RegistryOpResult ProcessedRegistry::persistLocked()
{
    std::string content;
    try
    {
        // Keys and text are made UTF-8 safe on the way in; replace is the backstop so one
        // bad record can never block the rest of the snapshot from being written
        content = snapshotLocked().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to serialize registry " + registry_path_ + ": " + e.what());
        return RegistryOpResult(false, e.what());
    }

    std::string error = FileUtils::writeFileAtomically(registry_path_, content);
    if (!error.empty())
    {
        Logger::error("Failed to persist registry " + registry_path_ + ": " + error);
        return RegistryOpResult(false, error);
    }
    return RegistryOpResult(true);
}
