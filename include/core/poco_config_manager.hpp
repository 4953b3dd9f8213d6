#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Thin thread-safe wrapper over Poco::Util::JSONConfiguration
 *
 * One instance per config file; there is no process-wide configuration.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    /**
     * @brief Replace the current configuration with the contents of a JSON file
     * @throws ConfigError if the file cannot be opened or is not valid JSON
     */
    void load(const std::string &path);

    nlohmann::json getAll() const;

    bool has(const std::string &key) const;
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;

    // Reads a JSON array of strings through Poco's "key[n]" addressing
    std::vector<std::string> getStringList(const std::string &key) const;

    const std::string &sourcePath() const { return source_path_; }

private:
    template <typename T, typename Getter>
    T getTyped(const std::string &key, T def, Getter getter) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
    std::string source_path_;
};
