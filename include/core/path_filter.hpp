#pragma once

#include "core/watch_config.hpp"
#include <set>
#include <string>
#include <vector>

/**
 * @brief Decides whether a discovered path is eligible for processing
 *
 * Rules, in order: regular file, extension in the allow-list (case-insensitive),
 * not a transient file (hidden, Office lock file, partial-download suffix).
 * Rejected paths are simply ignored by the engine.
 */
class PathFilter
{
public:
    enum class Verdict
    {
        ELIGIBLE,
        NOT_REGULAR_FILE,
        EXTENSION_NOT_ACCEPTED,
        TRANSIENT
    };

    PathFilter(std::set<std::string> accepted_extensions, std::vector<std::string> ignored_suffixes);
    explicit PathFilter(const WatchConfig &config);

    bool isEligible(const std::string &path) const;

    // Full check including the stat for rule (a)
    Verdict evaluate(const std::string &path) const;

    // Rules (b) and (c) only; looks at the name, never at the filesystem
    Verdict evaluateName(const std::string &path) const;

    bool isTransientName(const std::string &file_name) const;

    static std::string verdictToString(Verdict verdict);

private:
    std::set<std::string> accepted_extensions_;
    std::vector<std::string> ignored_suffixes_;
};
