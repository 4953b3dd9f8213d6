#include "core/poco_config_manager.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

void PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        throw ConfigError("cannot open config file " + path);
    }

    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigError("cannot parse config file " + path + ": " + e.displayText());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    source_path_ = path;
    Logger::debug("Configuration loaded from " + path);
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

bool PocoConfigManager::has(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

template <typename T, typename Getter>
T PocoConfigManager::getTyped(const std::string &key, T def, Getter getter) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return getter(*cfg_, key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        throw ConfigError("invalid value for '" + key + "': " + e.displayText());
    }
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    return getTyped<std::string>(key, def, [](const JSONConfiguration &cfg, const std::string &k, const std::string &d)
                                 { return cfg.getString(k, d); });
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    return getTyped<int>(key, def, [](const JSONConfiguration &cfg, const std::string &k, int d)
                         { return cfg.getInt(k, d); });
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    return getTyped<double>(key, def, [](const JSONConfiguration &cfg, const std::string &k, double d)
                            { return cfg.getDouble(k, d); });
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    return getTyped<bool>(key, def, [](const JSONConfiguration &cfg, const std::string &k, bool d)
                          { return cfg.getBool(k, d); });
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> values;
    for (size_t i = 0;; ++i)
    {
        std::string indexed = key + "[" + std::to_string(i) + "]";
        if (!cfg_->has(indexed))
        {
            break;
        }
        values.push_back(cfg_->getString(indexed));
    }
    return values;
}
