#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class FileStatus
{
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

std::string fileStatusToString(FileStatus status);
std::optional<FileStatus> fileStatusFromString(const std::string &status_str);

bool isValidUtf8(const std::string &text);

// Invalid UTF-8 sequences become U+FFFD so the value can always be written as JSON
std::string sanitizeUtf8Text(const std::string &text);
nlohmann::json sanitizeUtf8Json(const nlohmann::json &value);

/**
 * @brief One entry of the processed registry, keyed by normalized path
 */
struct FileRecord
{
    std::string identity;
    FileStatus status = FileStatus::PENDING;
    uint64_t size = 0;
    int64_t mtime_ns = 0;
    std::string updated_at;
    std::string completed_at;
    nlohmann::json result = nlohmann::json::object();
    std::string error;
    bool needs_review = false;
    std::string review_reason;

    // Fields written by a newer version; written back untouched
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toJson() const;

    // Throws std::invalid_argument on a malformed entry or unknown status
    static FileRecord fromJson(const std::string &identity, const nlohmann::json &j);

    /**
     * @brief Key under which a record is stored in the registry document
     *
     * Linux paths are arbitrary bytes but JSON keys must be UTF-8. Paths that
     * are valid UTF-8 are stored as-is; any other path is stored as
     * "base64:<encoded bytes>". Normalized paths are absolute, so the two
     * forms cannot collide.
     */
    static std::string storageKey(const std::string &identity);

    // Inverse of storageKey(); throws std::invalid_argument on a malformed encoded key
    static std::string identityFromStorageKey(const std::string &key);
};
