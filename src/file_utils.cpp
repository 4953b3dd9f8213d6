#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statfs.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    // statfs f_type values of filesystems whose change notifications are unreliable
    constexpr long kNfsSuperMagic = 0x6969;
    constexpr long kSmbSuperMagic = 0x517B;
    constexpr long kCifsMagicNumber = 0xFF534D42;
    constexpr long kSmb2MagicNumber = 0xFE534D42;
    constexpr long kFuseSuperMagic = 0x65735546;
    constexpr long kV9fsMagic = 0x01021997;
    constexpr long kAfsSuperMagic = 0x5346414F;
    constexpr long kCodaSuperMagic = 0x73757245;
    constexpr long kNcpSuperMagic = 0x564C;
}

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return listFilesInternal(dir_path, recursive);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            std::error_code ec;
                            if (entry.is_regular_file(ec))
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory() && !entry.is_symlink())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Only the root directory failing is fatal; the caller checks it separately
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

bool FileMetadata::sameContentStamp(const FileMetadata &other) const
{
    return modification_time_ns == other.modification_time_ns && file_size == other.file_size;
}

bool FileMetadata::operator==(const FileMetadata &other) const
{
    return modification_time_ns == other.modification_time_ns &&
           file_size == other.file_size &&
           inode == other.inode &&
           device_id == other.device_id;
}

bool FileMetadata::operator!=(const FileMetadata &other) const
{
    return !(*this == other);
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mtime_ns=" << modification_time_ns << ", "
       << "size=" << file_size << ", "
       << "inode=" << inode << ", "
       << "device=" << device_id << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (::stat(file_path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.inode = static_cast<uint64_t>(st.st_ino);
    metadata.device_id = static_cast<uint64_t>(st.st_dev);
    return metadata;
}

std::string FileUtils::normalizePath(const std::string &path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec)
    {
        absolute = fs::path(path);
    }
    fs::path normal = absolute.lexically_normal();

    // "/watch/" and "/watch" must be the same identity
    std::string result = normal.string();
    while (result.size() > 1 && result.back() == '/')
    {
        result.pop_back();
    }
    return result;
}

std::string FileUtils::lowercaseExtension(const std::string &path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool FileUtils::isNetworkFilesystem(const std::string &dir_path)
{
    struct statfs sfs;
    if (::statfs(dir_path.c_str(), &sfs) != 0)
    {
        Logger::debug("statfs failed for " + dir_path + ": " + std::strerror(errno));
        return false;
    }

    const long type = static_cast<long>(sfs.f_type);
    switch (type)
    {
    case kNfsSuperMagic:
    case kSmbSuperMagic:
    case kCifsMagicNumber:
    case kSmb2MagicNumber:
    case kFuseSuperMagic:
    case kV9fsMagic:
    case kAfsSuperMagic:
    case kCodaSuperMagic:
    case kNcpSuperMagic:
        return true;
    default:
        return false;
    }
}

std::string FileUtils::currentTimestampUtc()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string FileUtils::writeFileAtomically(const std::string &path, const std::string &content)
{
    fs::path final_path(path);
    fs::path temp_path = final_path;
    temp_path += ".tmp";

    try
    {
        if (final_path.has_parent_path() && !fs::exists(final_path.parent_path()))
        {
            fs::create_directories(final_path.parent_path());
        }
    }
    catch (const fs::filesystem_error &e)
    {
        return "Error creating directories for " + path + ": " + e.what();
    }

    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open())
        {
            return "Failed to open temp file: " + temp_path.string();
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail())
        {
            ofs.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            return "Write failed for temp file: " + temp_path.string();
        }
    }

    // ofstream cannot fsync; reopen the temp file for that
    int fd = ::open(temp_path.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        if (::fsync(fd) != 0)
        {
            Logger::warn("fsync failed for " + temp_path.string() + ": " + std::strerror(errno));
        }
        ::close(fd);
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec)
    {
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        return "Rename failed for " + path + ": " + ec.message();
    }
    return "";
}
