#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class DiscoveryMode
{
    AUTO,
    EVENTS,
    POLLING
};

std::string discoveryModeToString(DiscoveryMode mode);
DiscoveryMode discoveryModeFromString(const std::string &mode_str);

/**
 * @brief Immutable configuration snapshot handed to the engine at construction
 *
 * Changing any value requires stopping and reconstructing the engine.
 */
struct WatchConfig
{
    std::string input_directory;
    std::set<std::string> accepted_extensions; // Lower-case, with leading dot
    double poll_interval_seconds = 5.0;
    double debounce_seconds = 2.0;
    bool recursive = false;
    std::string registry_file_path = "processed_files.json";

    DiscoveryMode discovery_mode = DiscoveryMode::AUTO;
    std::vector<std::string> ignored_suffixes = defaultIgnoredSuffixes();
    double stop_timeout_seconds = 0.0; // 0 waits for the in-flight callback indefinitely
    int stability_check_millis = 250;
    bool create_input_directory = false;

    std::string log_level = "INFO";
    std::string log_file;
    std::string process_command;

    static std::vector<std::string> defaultIgnoredSuffixes();

    // Accepts "wav", ".wav" or ".WAV" and stores ".wav"
    static std::string normalizeExtension(const std::string &extension);

    std::chrono::milliseconds pollInterval() const;
    std::chrono::milliseconds debounce() const;
    std::chrono::milliseconds stabilityCheckInterval() const;

    // Unset when stop_timeout_seconds is 0 (or not a usable number)
    std::optional<std::chrono::milliseconds> stopTimeout() const;

    // Upper bound for every *Seconds option
    static constexpr double kMaxSeconds = 86400.0;

    // Throws ConfigError describing the first invalid field
    void validate() const;
};

/**
 * @brief Builds a WatchConfig from a JSON config file read through Poco
 */
class WatchConfigLoader
{
public:
    /**
     * @brief Load and validate a config file
     * @throws ConfigError if the file is missing, unparsable or invalid
     */
    static WatchConfig loadFromFile(const std::string &config_path);

private:
    static WatchConfig readConfig(const std::string &config_path);
};
