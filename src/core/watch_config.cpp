#include "core/watch_config.hpp"
#include "core/poco_config_manager.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    std::chrono::milliseconds secondsToMillis(double seconds)
    {
        return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

std::string discoveryModeToString(DiscoveryMode mode)
{
    switch (mode)
    {
    case DiscoveryMode::AUTO:
        return "auto";
    case DiscoveryMode::EVENTS:
        return "events";
    case DiscoveryMode::POLLING:
        return "polling";
    }
    return "auto";
}

DiscoveryMode discoveryModeFromString(const std::string &mode_str)
{
    std::string mode = toLower(mode_str);
    if (mode == "auto")
        return DiscoveryMode::AUTO;
    if (mode == "events" || mode == "inotify")
        return DiscoveryMode::EVENTS;
    if (mode == "polling" || mode == "poll")
        return DiscoveryMode::POLLING;
    throw ConfigError("unknown discoveryMode '" + mode_str + "' (expected auto, events or polling)");
}

std::vector<std::string> WatchConfig::defaultIgnoredSuffixes()
{
    return {".part", ".partial", ".tmp", ".crdownload", ".download", "~"};
}

std::string WatchConfig::normalizeExtension(const std::string &extension)
{
    std::string ext = toLower(extension);
    if (!ext.empty() && ext.front() != '.')
    {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

std::chrono::milliseconds WatchConfig::pollInterval() const
{
    return secondsToMillis(poll_interval_seconds);
}

std::chrono::milliseconds WatchConfig::debounce() const
{
    return secondsToMillis(debounce_seconds);
}

std::chrono::milliseconds WatchConfig::stabilityCheckInterval() const
{
    return std::chrono::milliseconds(stability_check_millis);
}

std::optional<std::chrono::milliseconds> WatchConfig::stopTimeout() const
{
    if (!std::isfinite(stop_timeout_seconds) || stop_timeout_seconds <= 0.0)
    {
        return std::nullopt;
    }
    return secondsToMillis(std::min(stop_timeout_seconds, kMaxSeconds));
}

void WatchConfig::validate() const
{
    if (input_directory.empty())
    {
        throw ConfigError("inputDirectory is required");
    }
    if (accepted_extensions.empty())
    {
        throw ConfigError("acceptedExtensions must list at least one extension");
    }
    for (const auto &ext : accepted_extensions)
    {
        if (ext.size() < 2 || ext.front() != '.')
        {
            throw ConfigError("invalid extension in acceptedExtensions: '" + ext + "'");
        }
    }
    if (!std::isfinite(poll_interval_seconds) || poll_interval_seconds <= 0.0 || poll_interval_seconds > kMaxSeconds)
    {
        throw ConfigError("pollIntervalSeconds must be positive and at most " + std::to_string(kMaxSeconds));
    }
    if (!std::isfinite(debounce_seconds) || debounce_seconds < 0.0 || debounce_seconds > kMaxSeconds)
    {
        throw ConfigError("debounceSeconds must be between 0 and " + std::to_string(kMaxSeconds));
    }
    if (!std::isfinite(stop_timeout_seconds) || stop_timeout_seconds < 0.0 || stop_timeout_seconds > kMaxSeconds)
    {
        throw ConfigError("stopTimeoutSeconds must be between 0 and " + std::to_string(kMaxSeconds));
    }
    if (stability_check_millis <= 0 || stability_check_millis > 60000)
    {
        throw ConfigError("stabilityCheckMillis must be between 1 and 60000");
    }
    if (registry_file_path.empty())
    {
        throw ConfigError("registryFilePath must not be empty");
    }
    if (!Logger::isValidLevel(log_level))
    {
        throw ConfigError("unknown logLevel '" + log_level + "'");
    }
}

WatchConfig WatchConfigLoader::loadFromFile(const std::string &config_path)
{
    try
    {
        return readConfig(config_path);
    }
    catch (const ConfigError &)
    {
        throw;
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigError("cannot read config file " + config_path + ": " + e.displayText());
    }
    catch (const std::exception &e)
    {
        throw ConfigError("cannot read config file " + config_path + ": " + e.what());
    }
}

WatchConfig WatchConfigLoader::readConfig(const std::string &config_path)
{
    PocoConfigManager manager;
    manager.load(config_path);

    WatchConfig config;
    config.input_directory = manager.getString("inputDirectory", "");

    for (const auto &ext : manager.getStringList("acceptedExtensions"))
    {
        config.accepted_extensions.insert(WatchConfig::normalizeExtension(ext));
    }

    config.poll_interval_seconds = manager.getDouble("pollIntervalSeconds", config.poll_interval_seconds);
    config.debounce_seconds = manager.getDouble("debounceSeconds", config.debounce_seconds);
    config.recursive = manager.getBool("recursive", config.recursive);
    config.registry_file_path = manager.getString("registryFilePath", config.registry_file_path);
    config.discovery_mode = discoveryModeFromString(manager.getString("discoveryMode", "auto"));

    // An explicit empty list disables suffix filtering, so presence matters, not contents
    if (manager.getAll().contains("ignoredSuffixes"))
    {
        config.ignored_suffixes.clear();
        for (const auto &suffix : manager.getStringList("ignoredSuffixes"))
        {
            config.ignored_suffixes.push_back(toLower(suffix));
        }
    }

    config.stop_timeout_seconds = manager.getDouble("stopTimeoutSeconds", config.stop_timeout_seconds);
    config.stability_check_millis = manager.getInt("stabilityCheckMillis", config.stability_check_millis);
    config.create_input_directory = manager.getBool("createInputDirectory", config.create_input_directory);
    config.log_level = manager.getString("logLevel", config.log_level);
    config.log_file = manager.getString("logFile", config.log_file);
    config.process_command = manager.getString("processCommand", config.process_command);

    // Relative paths in a config file are relative to the file, not the cwd
    fs::path base_dir = fs::path(config_path).parent_path();
    auto resolve = [&base_dir](std::string &value)
    {
        if (!value.empty() && fs::path(value).is_relative() && !base_dir.empty())
        {
            value = (base_dir / value).lexically_normal().string();
        }
    };
    resolve(config.registry_file_path);
    resolve(config.input_directory);
    resolve(config.log_file);

    config.validate();

    Logger::info("Loaded watch configuration from " + config_path + ": inputDirectory=" + config.input_directory +
                 ", extensions=" + std::to_string(config.accepted_extensions.size()) +
                 ", discoveryMode=" + discoveryModeToString(config.discovery_mode) +
                 ", debounce=" + std::to_string(config.debounce_seconds) + "s" +
                 ", pollInterval=" + std::to_string(config.poll_interval_seconds) + "s");
    return config;
}
