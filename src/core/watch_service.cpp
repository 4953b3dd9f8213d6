#include "core/watch_service.hpp"
#include "core/watch_errors.hpp"
#include "logging/logger.hpp"

WatchService::WatchService()
    : events_(std::make_shared<WatchEventChannel>())
{
}

WatchService::~WatchService()
{
    try
    {
        stop();
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Error stopping watch service: ") + e.what());
    }
}

void WatchService::start(const WatchConfig &config, ProcessingCallback callback)
{
    start(config, std::move(callback), nullptr);
}

void WatchService::start(const WatchConfig &config, ProcessingCallback callback, std::unique_ptr<DiscoverySource> source)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_ && engine_->getState() != EngineState::STOPPED)
    {
        throw WatchError("Watch service is already running on " + config.input_directory);
    }
    if (engine_)
    {
        // Previous session may have ended on its own after a discovery failure; release its threads
        engine_->stop();
        engine_.reset();
    }

    auto engine = std::make_shared<WatchEngine>(config, std::move(callback), std::move(source), events_);
    engine->start();

    engine_ = std::move(engine);
    default_stop_timeout_ = config.stopTimeout();
}

StopResult WatchService::stop(std::optional<std::chrono::milliseconds> timeout)
{
    std::shared_ptr<WatchEngine> engine;
    std::optional<std::chrono::milliseconds> effective;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        engine = engine_;
        effective = timeout ? timeout : default_stop_timeout_;
    }
    if (!engine)
    {
        return StopResult{};
    }
    return engine->stop(effective);
}

void WatchService::setCallback(ProcessingCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_ || engine_->getState() == EngineState::STOPPED)
    {
        throw WatchError("Watch service is not running");
    }
    engine_->setCallback(std::move(callback));
}

void WatchService::pause()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_)
    {
        engine_->pause();
    }
}

void WatchService::resume()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_)
    {
        engine_->resume();
    }
}

RegistryOpResult WatchService::markFileAsProcessed(const std::string &path, const nlohmann::json &metadata)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_)
    {
        return RegistryOpResult(false, "Watch service is not running");
    }
    return engine_->markFileAsProcessed(path, metadata);
}

RegistryOpResult WatchService::resubmit(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_)
    {
        return RegistryOpResult(false, "Watch service is not running");
    }
    return engine_->resubmit(path);
}

size_t WatchService::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ ? engine_->getPendingCount() : 0;
}

std::optional<FileRecord> WatchService::getStatus(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!engine_)
    {
        return std::nullopt;
    }
    return engine_->getStatus(path);
}

EngineState WatchService::getState() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ ? engine_->getState() : EngineState::STOPPED;
}

bool WatchService::isPaused() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ && engine_->isPaused();
}

void WatchService::addObserver(WatchObserver *observer)
{
    events_->subscribe(observer);
}

void WatchService::removeObserver(WatchObserver *observer)
{
    events_->unsubscribe(observer);
}

std::vector<WatchEvent> WatchService::pollEvents()
{
    return events_->poll();
}
