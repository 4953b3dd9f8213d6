#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief File metadata used for change and stability detection
 */
struct FileMetadata
{
    std::string file_path;
    int64_t modification_time_ns = 0; // Nanoseconds since the Unix epoch
    uint64_t file_size = 0;
    uint64_t inode = 0;
    uint64_t device_id = 0;

    // Size and mtime only; inode/device do not change while a file is written
    bool sameContentStamp(const FileMetadata &other) const;

    bool operator==(const FileMetadata &other) const;
    bool operator!=(const FileMetadata &other) const;

    std::string toString() const;
};

/**
 * @brief Filesystem helpers shared by the discovery sources, filter and registry
 */
class FileUtils
{
public:
    /**
     * @brief Stat a path without reading its contents
     * @param file_path Path to the file
     * @return Metadata if the path exists and is a regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to descend into subdirectories
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file.
     * Unreadable subdirectories are skipped with a warning.
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Absolute, lexically normalized form of a path; the registry identity
     *
     * Does not require the path to exist and does not resolve symlinks.
     */
    static std::string normalizePath(const std::string &path);

    // Lower-cased extension including the dot, e.g. ".wav"; empty if none
    static std::string lowercaseExtension(const std::string &path);

    // True if the directory lives on NFS, SMB/CIFS, FUSE or another remote filesystem
    static bool isNetworkFilesystem(const std::string &dir_path);

    // UTC timestamp formatted as ISO 8601, e.g. 2025-01-01T00:00:00Z
    static std::string currentTimestampUtc();

    /**
     * @brief Write content to path through a temp file, fsync and atomic rename
     * @return Empty string on success, otherwise the error description
     */
    static std::string writeFileAtomically(const std::string &path, const std::string &content);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive);
};
