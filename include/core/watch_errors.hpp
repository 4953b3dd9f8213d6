#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every fatal condition raised by the watch engine
 */
class WatchError : public std::runtime_error
{
public:
    explicit WatchError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid or unreadable configuration; raised synchronously by start()
 */
class ConfigError : public WatchError
{
public:
    explicit ConfigError(const std::string &message) : WatchError("Configuration error: " + message) {}
};

/**
 * @brief Watched directory deleted or unreachable; fatal for the session
 */
class DiscoveryError : public WatchError
{
public:
    explicit DiscoveryError(const std::string &message) : WatchError("Discovery error: " + message) {}
};

/**
 * @brief Persisted registry exists but cannot be parsed
 *
 * Never handled by silently resetting the registry: the caller decides
 * whether to call ProcessedRegistry::reset() or abort.
 */
class RegistryCorruptionError : public WatchError
{
public:
    RegistryCorruptionError(const std::string &registry_path, const std::string &detail)
        : WatchError("Registry corrupted: " + registry_path + ": " + detail), registry_path_(registry_path) {}

    const std::string &registryPath() const { return registry_path_; }

private:
    std::string registry_path_;
};

/**
 * @brief Outcome of a registry mutation and its snapshot persist
 */
struct RegistryOpResult
{
    bool success;
    std::string error_message;
    RegistryOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};
