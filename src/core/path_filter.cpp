#include "core/path_filter.hpp"
#include "core/file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace
{
    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

PathFilter::PathFilter(std::set<std::string> accepted_extensions, std::vector<std::string> ignored_suffixes)
    : ignored_suffixes_(std::move(ignored_suffixes))
{
    for (const auto &ext : accepted_extensions)
    {
        accepted_extensions_.insert(WatchConfig::normalizeExtension(ext));
    }
    for (auto &suffix : ignored_suffixes_)
    {
        std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
    }
}

PathFilter::PathFilter(const WatchConfig &config)
    : PathFilter(config.accepted_extensions, config.ignored_suffixes)
{
}

bool PathFilter::isEligible(const std::string &path) const
{
    return evaluate(path) == Verdict::ELIGIBLE;
}

PathFilter::Verdict PathFilter::evaluate(const std::string &path) const
{
    // stat() follows symlinks, so a link to a regular file passes
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return Verdict::NOT_REGULAR_FILE;
    }
    return evaluateName(path);
}

PathFilter::Verdict PathFilter::evaluateName(const std::string &path) const
{
    if (accepted_extensions_.count(FileUtils::lowercaseExtension(path)) == 0)
    {
        return Verdict::EXTENSION_NOT_ACCEPTED;
    }
    if (isTransientName(fs::path(path).filename().string()))
    {
        return Verdict::TRANSIENT;
    }
    return Verdict::ELIGIBLE;
}

bool PathFilter::isTransientName(const std::string &file_name) const
{
    if (file_name.empty() || file_name.front() == '.')
    {
        return true;
    }
    if (file_name.rfind("~$", 0) == 0)
    {
        return true;
    }

    std::string lowered = file_name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    for (const auto &suffix : ignored_suffixes_)
    {
        if (!suffix.empty() && endsWith(lowered, suffix))
        {
            return true;
        }
    }
    return false;
}

std::string PathFilter::verdictToString(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::ELIGIBLE:
        return "eligible";
    case Verdict::NOT_REGULAR_FILE:
        return "not a regular file";
    case Verdict::EXTENSION_NOT_ACCEPTED:
        return "extension not accepted";
    case Verdict::TRANSIENT:
        return "transient file";
    }
    return "unknown";
}
