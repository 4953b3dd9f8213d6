#include "core/command_processor.hpp"
#include "core/processed_registry.hpp"
#include "core/shutdown_manager.hpp"
#include "core/watch_config.hpp"
#include "core/watch_errors.hpp"
#include "core/watch_service.hpp"
#include "logging/logger.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitError = 1;
    constexpr int kExitDiscoveryFailed = 2;

    void printUsage(const char *program)
    {
        std::cout << "auto_ingest - watch a directory and process each new file exactly once" << std::endl;
        std::cout << "Usage: " << program << " --config <file> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>         JSON configuration file (required)" << std::endl;
        std::cout << "  --log-level <level>         TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --reset-corrupt-registry    Set aside an unreadable registry and start empty" << std::endl;
        std::cout << "  --prune-registry <n>        Keep only the newest n finished records before starting" << std::endl;
        std::cout << "  --help, -h                  Show this help message" << std::endl;
    }

    // Remembers a discovery failure so main can exit with a distinct code
    class DiscoveryFailureObserver : public WatchObserver
    {
    public:
        void onWatchEvent(const WatchEvent &event) override
        {
            if (event.type == WatchEventType::DISCOVERY_FAILED)
            {
                failed_.store(true);
                ShutdownManager::getInstance().requestShutdown("Discovery failed: " + event.message);
            }
            else if (event.type == WatchEventType::FILE_FAILED)
            {
                Logger::warn("File failed: " + event.path + " (" + event.message + ")");
            }
        }

        bool failed() const { return failed_.load(); }

    private:
        std::atomic<bool> failed_{false};
    };
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string log_level_override;
    bool reset_corrupt_registry = false;
    long prune_limit = -1;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            log_level_override = argv[++i];
        }
        else if (arg == "--reset-corrupt-registry")
        {
            reset_corrupt_registry = true;
        }
        else if (arg == "--prune-registry" && i + 1 < argc)
        {
            try
            {
                prune_limit = std::stol(argv[++i]);
            }
            catch (const std::exception &)
            {
                prune_limit = -1;
            }
            if (prune_limit < 0)
            {
                std::cerr << "--prune-registry expects a non-negative number" << std::endl;
                return kExitError;
            }
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitOk;
        }
        else
        {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitError;
        }
    }

    if (config_path.empty())
    {
        printUsage(argv[0]);
        return kExitError;
    }

    WatchConfig config;
    try
    {
        Logger::init(log_level_override.empty() ? "INFO" : log_level_override);
        config = WatchConfigLoader::loadFromFile(config_path);
        Logger::init(log_level_override.empty() ? config.log_level : log_level_override, config.log_file);
    }
    catch (const ConfigError &e)
    {
        Logger::error(e.what());
        return kExitError;
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to load configuration from " + config_path + ": " + e.what());
        return kExitError;
    }

    // Registry maintenance happens before the engine owns the file
    if (reset_corrupt_registry || prune_limit >= 0)
    {
        ProcessedRegistry registry(config.registry_file_path);
        try
        {
            registry.load();
        }
        catch (const RegistryCorruptionError &e)
        {
            if (!reset_corrupt_registry)
            {
                Logger::error(std::string(e.what()) + " (rerun with --reset-corrupt-registry to discard it)");
                return kExitError;
            }
            RegistryOpResult reset = registry.reset();
            if (!reset.success)
            {
                Logger::error("Could not reset registry: " + reset.error_message);
                return kExitError;
            }
        }

        if (prune_limit >= 0)
        {
            size_t removed = 0;
            RegistryOpResult pruned = registry.prune(static_cast<size_t>(prune_limit), &removed);
            if (!pruned.success)
            {
                Logger::error("Could not prune registry: " + pruned.error_message);
                return kExitError;
            }
            Logger::info("Pruned " + std::to_string(removed) + " finished records from " + config.registry_file_path);
        }
    }

    auto &shutdown = ShutdownManager::getInstance();
    try
    {
        shutdown.installSignalHandlers();
    }
    catch (const std::exception &e)
    {
        Logger::error(e.what());
        return kExitError;
    }

    WatchService service;
    DiscoveryFailureObserver failure_observer;
    service.addObserver(&failure_observer);

    try
    {
        service.start(config, CommandProcessor::fromCommand(config.process_command));
    }
    catch (const RegistryCorruptionError &e)
    {
        Logger::error(std::string(e.what()) + " (rerun with --reset-corrupt-registry to discard it)");
        service.removeObserver(&failure_observer);
        shutdown.uninstallSignalHandlers();
        return kExitError;
    }
    catch (const WatchError &e)
    {
        Logger::error(e.what());
        service.removeObserver(&failure_observer);
        shutdown.uninstallSignalHandlers();
        return kExitError;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Failed to start watching: ") + e.what());
        service.removeObserver(&failure_observer);
        shutdown.uninstallSignalHandlers();
        return kExitError;
    }

    Logger::info("auto_ingest running; press Ctrl+C to stop");
    shutdown.waitForShutdown();

    StopResult stopped = service.stop();
    if (stopped.forced)
    {
        Logger::warn("Shutdown did not wait for " + stopped.abandoned_path + "; it is flagged for review");
    }
    service.removeObserver(&failure_observer);
    shutdown.uninstallSignalHandlers();

    if (failure_observer.failed())
    {
        return kExitDiscoveryFailed;
    }
    Logger::info("auto_ingest stopped");
    return kExitOk;
}
