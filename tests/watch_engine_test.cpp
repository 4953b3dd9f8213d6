#include "test_base.hpp"
#include "core/watch_engine.hpp"
#include "core/watch_errors.hpp"
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;

namespace
{
    /**
     * @brief Discovery source driven by the test thread
     */
    class ManualDiscoverySource : public DiscoverySource
    {
    public:
        void start(CandidateHandler on_candidate, ErrorHandler on_error) override
        {
            on_candidate_ = std::move(on_candidate);
            on_error_ = std::move(on_error);
            running_ = true;
        }

        void stop() override { running_ = false; }
        bool isRunning() const override { return running_; }
        std::string name() const override { return "manual"; }

        void emit(const std::string &path)
        {
            if (running_)
            {
                on_candidate_(path);
            }
        }

        void fail(const std::string &message)
        {
            running_ = false;
            on_error_(DiscoveryError(message));
        }

    private:
        CandidateHandler on_candidate_;
        ErrorHandler on_error_;
        std::atomic<bool> running_{false};
    };

    // Shared with callbacks that may outlive the test body after a forced stop
    struct CallLog
    {
        std::mutex mutex;
        std::vector<std::string> paths;

        void add(const std::string &path)
        {
            std::lock_guard<std::mutex> lock(mutex);
            paths.push_back(path);
        }

        size_t count()
        {
            std::lock_guard<std::mutex> lock(mutex);
            return paths.size();
        }

        size_t countFor(const std::string &path)
        {
            std::lock_guard<std::mutex> lock(mutex);
            return static_cast<size_t>(std::count(paths.begin(), paths.end(), path));
        }

        std::vector<std::string> snapshot()
        {
            std::lock_guard<std::mutex> lock(mutex);
            return paths;
        }
    };
}

class WatchEngineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        calls_ = std::make_shared<CallLog>();
    }

    WatchConfig makeConfig()
    {
        WatchConfig config;
        config.input_directory = watchDir();
        config.accepted_extensions = {".wav", ".mp4"};
        config.debounce_seconds = 0.2;
        config.poll_interval_seconds = 0.05;
        config.stability_check_millis = 20;
        config.registry_file_path = registryPath();
        config.discovery_mode = DiscoveryMode::POLLING;
        return config;
    }

    ProcessingCallback succeed()
    {
        auto calls = calls_;
        return [calls](const std::string &path)
        {
            calls->add(path);
            return ProcessingResult::ok({{"handled", true}});
        };
    }

    // Engine with a manual source; source_ points into it
    std::unique_ptr<WatchEngine> makeManualEngine(ProcessingCallback callback, WatchConfig config)
    {
        auto source = std::make_unique<ManualDiscoverySource>();
        source_ = source.get();
        return std::make_unique<WatchEngine>(std::move(config), std::move(callback), std::move(source));
    }

    std::unique_ptr<WatchEngine> makeManualEngine(ProcessingCallback callback)
    {
        return makeManualEngine(std::move(callback), makeConfig());
    }

    std::optional<FileStatus> statusOf(WatchEngine &engine, const std::string &path)
    {
        auto record = engine.getStatus(path);
        if (!record)
        {
            return std::nullopt;
        }
        return record->status;
    }

    std::shared_ptr<CallLog> calls_;
    ManualDiscoverySource *source_ = nullptr;
};

TEST_F(WatchEngineTest, RepeatedEventsDispatchExactlyOnce)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    EXPECT_EQ(engine->getState(), EngineState::RUNNING);
    EXPECT_EQ(engine->discoverySourceName(), "manual");

    std::string path = createFile("a.wav", "audio");
    for (int i = 0; i < 5; ++i)
    {
        source_->emit(path);
    }

    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::COMPLETED; }));

    source_->emit(path);
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(calls_->countFor(path), 1u);

    auto record = engine->getStatus(path);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->result["handled"], true);
    EXPECT_EQ(record->size, 5u);

    engine->stop();
    EXPECT_EQ(engine->getState(), EngineState::STOPPED);
}

TEST_F(WatchEngineTest, ExtensionsOutsideAllowListAreNeverDispatched)
{
    auto engine = makeManualEngine(succeed());
    engine->start();

    source_->emit(createFile("b.txt"));
    source_->emit(createFile(".hidden.wav"));
    source_->emit(createFile("upload.wav.part"));
    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(calls_->count(), 0u);
    EXPECT_FALSE(engine->getStatus(pathInWatch("b.txt")).has_value());
    engine->stop();
}

TEST_F(WatchEngineTest, GrowingFileWaitsForStability)
{
    WatchConfig config = makeConfig();
    config.debounce_seconds = 0.3;

    std::atomic<int64_t> dispatched_at{0};
    auto calls = calls_;
    WatchEngine engine(config, [calls, &dispatched_at](const std::string &path)
                       {
        dispatched_at.store(std::chrono::steady_clock::now().time_since_epoch().count());
        calls->add(path);
        return ProcessingResult::ok(); });
    engine.start();
    EXPECT_EQ(engine.discoverySourceName(), "polling");

    std::string path = createFile("c.mp4", "start");
    for (int i = 0; i < 10; ++i)
    {
        std::this_thread::sleep_for(100ms);
        appendToFile(path, "more data");
        EXPECT_EQ(calls_->count(), 0u) << "dispatched while still being written";
    }
    auto last_write = std::chrono::steady_clock::now();

    ASSERT_TRUE(waitUntil([&]()
                          { return calls_->count() == 1; }));
    auto waited = std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(dispatched_at.load())) - last_write;
    EXPECT_GE(waited, 250ms);

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(calls_->count(), 1u);
    engine.stop();
}

TEST_F(WatchEngineTest, RestartDoesNotRedispatchCompletedFiles)
{
    std::string path = createFile("a.wav", "same bytes");
    {
        WatchEngine first(makeConfig(), succeed());
        first.start();
        ASSERT_TRUE(waitUntil([&]()
                              { return calls_->count() == 1; }));
        ASSERT_TRUE(waitUntil([&]()
                              { return first.getStatus(path) && first.getStatus(path)->status == FileStatus::COMPLETED; }));
        first.stop();
    }

    WatchEngine second(makeConfig(), succeed());
    second.start();
    std::this_thread::sleep_for(400ms);

    // Re-drop identical content at the same path
    createFile("a.wav", "same bytes");
    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(calls_->count(), 1u);
    second.stop();
}

TEST_F(WatchEngineTest, MarkFileAsProcessedBeforeDiscoverySuppressesDispatch)
{
    auto engine = makeManualEngine(succeed());
    engine->start();

    std::string path = pathInWatch("d.wav");
    ASSERT_TRUE(engine->markFileAsProcessed(path, {{"note", "handled elsewhere"}}).success);

    createFile("d.wav");
    source_->emit(path);
    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(calls_->count(), 0u);
    EXPECT_EQ(statusOf(*engine, path), FileStatus::COMPLETED);
    EXPECT_EQ(engine->getStatus(path)->result["note"], "handled elsewhere");
    engine->stop();
}

TEST_F(WatchEngineTest, MarkFileAsProcessedRemovesQueuedFile)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    engine->pause();

    std::string path = createFile("queued.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return engine->getPendingCount() == 1; }));

    ASSERT_TRUE(engine->markFileAsProcessed(path, nlohmann::json::object()).success);
    EXPECT_EQ(engine->getPendingCount(), 0u);

    engine->resume();
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(calls_->count(), 0u);
    engine->stop();
}

TEST_F(WatchEngineTest, CallbackFailureIsRecordedAndNotRetried)
{
    auto calls = calls_;
    auto engine = makeManualEngine([calls](const std::string &path)
                                   {
        calls->add(path);
        return ProcessingResult::failure("unsupported codec"); });
    engine->start();

    std::string path = createFile("bad.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::FAILED; }));
    EXPECT_EQ(engine->getStatus(path)->error, "unsupported codec");

    source_->emit(path);
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(calls_->count(), 1u);
    engine->stop();
}

TEST_F(WatchEngineTest, ThrowingCallbackCountsAsFailureAndEngineContinues)
{
    auto calls = calls_;
    auto engine = makeManualEngine([calls](const std::string &path) -> ProcessingResult
                                   {
        calls->add(path);
        if (path.find("explode") != std::string::npos)
        {
            throw std::runtime_error("callback threw");
        }
        return ProcessingResult::ok(); });
    engine->start();

    std::string bad = createFile("explode.wav");
    std::string good = createFile("fine.wav");
    source_->emit(bad);
    source_->emit(good);

    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, good) == FileStatus::COMPLETED; }));
    EXPECT_EQ(statusOf(*engine, bad), FileStatus::FAILED);
    EXPECT_EQ(engine->getStatus(bad)->error, "callback threw");
    engine->stop();
}

TEST_F(WatchEngineTest, FileDeletedBeforeDispatchIsPathVanished)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    engine->pause();

    std::string path = createFile("gone.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return engine->getPendingCount() == 1; }));

    std::filesystem::remove(path);
    engine->resume();

    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::FAILED; }));
    EXPECT_EQ(engine->getStatus(path)->error.rfind("path vanished", 0), 0u);
    EXPECT_EQ(calls_->count(), 0u);
    engine->stop();
}

TEST_F(WatchEngineTest, FileDeletedByFailingCallbackIsPathVanished)
{
    auto engine = makeManualEngine([](const std::string &path)
                                   {
        std::filesystem::remove(path);
        return ProcessingResult::failure("read error"); });
    engine->start();

    std::string path = createFile("flaky.wav");
    source_->emit(path);

    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::FAILED; }));
    std::string error = engine->getStatus(path)->error;
    EXPECT_EQ(error.rfind("path vanished", 0), 0u);
    EXPECT_NE(error.find("read error"), std::string::npos);
    engine->stop();
}

TEST_F(WatchEngineTest, FileRemovedDuringDebounceIsForgotten)
{
    WatchConfig config = makeConfig();
    config.debounce_seconds = 0.5;
    auto engine = makeManualEngine(succeed(), config);
    engine->start();

    std::string path = createFile("brief.wav");
    source_->emit(path);
    std::filesystem::remove(path);
    std::this_thread::sleep_for(700ms);

    EXPECT_EQ(calls_->count(), 0u);
    EXPECT_FALSE(engine->getStatus(path).has_value());
    engine->stop();
}

TEST_F(WatchEngineTest, DispatchFollowsFirstObservedOrder)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    engine->pause();

    std::string second = createFile("zzz.wav");
    std::string first = createFile("aaa.wav");
    source_->emit(second);
    std::this_thread::sleep_for(30ms);
    source_->emit(first);
    ASSERT_TRUE(waitUntil([&]()
                          { return engine->getPendingCount() == 2; }));

    engine->resume();
    ASSERT_TRUE(waitUntil([&]()
                          { return calls_->count() == 2; }));
    EXPECT_EQ(calls_->snapshot(), (std::vector<std::string>{second, first}));
    engine->stop();
}

TEST_F(WatchEngineTest, PauseHoldsDispatchButNotDiscovery)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    engine->pause();
    EXPECT_TRUE(engine->isPaused());

    std::string path = createFile("held.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return engine->getPendingCount() == 1; }));
    EXPECT_EQ(statusOf(*engine, path), FileStatus::PENDING);
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(calls_->count(), 0u);

    engine->resume();
    EXPECT_FALSE(engine->isPaused());
    ASSERT_TRUE(waitUntil([&]()
                          { return calls_->count() == 1; }));
    engine->stop();
}

TEST_F(WatchEngineTest, ResubmitRedispatchesFailedFile)
{
    auto engine = makeManualEngine([](const std::string &)
                                   { return ProcessingResult::failure("first attempt"); });
    engine->start();

    std::string path = createFile("retry.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::FAILED; }));

    engine->setCallback(succeed());
    ASSERT_TRUE(engine->resubmit(path).success);

    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::COMPLETED; }));
    EXPECT_EQ(calls_->count(), 1u);

    EXPECT_FALSE(engine->resubmit(path).success) << "completed files cannot be resubmitted";
    engine->stop();
}

TEST_F(WatchEngineTest, StopTimeoutAbandonsRunningCallback)
{
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto calls = calls_;
    auto engine = makeManualEngine([release, calls](const std::string &path)
                                   {
        calls->add(path);
        while (!release->load())
        {
            std::this_thread::sleep_for(5ms);
        }
        return ProcessingResult::ok(); });
    engine->start();

    std::string path = createFile("slow.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return calls_->count() == 1; }));

    StopResult result = engine->stop(50ms);
    EXPECT_TRUE(result.forced);
    EXPECT_EQ(result.abandoned_path, path);
    EXPECT_EQ(engine->getState(), EngineState::STOPPED);

    auto record = engine->getStatus(path);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, FileStatus::IN_PROGRESS);
    EXPECT_TRUE(record->needs_review);

    auto events = engine->events().poll();
    EXPECT_TRUE(std::any_of(events.begin(), events.end(), [](const WatchEvent &e)
                            { return e.type == WatchEventType::FORCED_STOP; }));
    EXPECT_TRUE(std::any_of(events.begin(), events.end(), [&path](const WatchEvent &e)
                            { return e.type == WatchEventType::CALLBACK_ABANDONED && e.path == path; }));

    engine.reset();
    release->store(true);
    std::this_thread::sleep_for(100ms);

    // The late outcome is discarded
    ProcessedRegistry on_disk(registryPath());
    on_disk.load();
    EXPECT_EQ(on_disk.getStatus(path), FileStatus::IN_PROGRESS);
    EXPECT_TRUE(on_disk.getRecord(path)->needs_review);
}

TEST_F(WatchEngineTest, StopWithoutTimeoutWaitsForCallback)
{
    auto engine = makeManualEngine([](const std::string &)
                                   {
        std::this_thread::sleep_for(200ms);
        return ProcessingResult::ok(); });
    engine->start();

    std::string path = createFile("wait.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::IN_PROGRESS; }));

    StopResult result = engine->stop();
    EXPECT_FALSE(result.forced);
    EXPECT_EQ(statusOf(*engine, path), FileStatus::COMPLETED);
}

TEST_F(WatchEngineTest, InterruptedRecordFromPreviousRunIsNotRedispatched)
{
    std::string path = createFile("interrupted.wav");
    {
        ProcessedRegistry registry(registryPath());
        registry.load();
        registry.recordInProgress(path);
    }

    auto engine = makeManualEngine(succeed());
    engine->start();
    source_->emit(path);
    std::this_thread::sleep_for(400ms);

    EXPECT_EQ(calls_->count(), 0u);
    EXPECT_TRUE(engine->getStatus(path)->needs_review);
    engine->stop();
}

TEST_F(WatchEngineTest, PendingRecordFromPreviousRunIsDispatched)
{
    std::string path = createFile("leftover.wav");
    {
        ProcessedRegistry registry(registryPath());
        registry.load();
        registry.recordPending(path, *FileUtils::getFileMetadata(path));
    }

    auto engine = makeManualEngine(succeed());
    engine->start();
    source_->emit(path);

    ASSERT_TRUE(waitUntil([&]()
                          { return calls_->count() == 1; }));
    engine->stop();
}

TEST_F(WatchEngineTest, StatusEventsFollowTheFileLifecycle)
{
    auto engine = makeManualEngine(succeed());
    engine->start();

    std::string path = createFile("tracked.wav");
    source_->emit(path);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, path) == FileStatus::COMPLETED; }));
    engine->stop();

    std::vector<WatchEventType> types;
    for (const auto &event : engine->events().poll())
    {
        types.push_back(event.type);
    }
    EXPECT_EQ(types, (std::vector<WatchEventType>{WatchEventType::STARTED, WatchEventType::FILE_QUEUED,
                                                  WatchEventType::FILE_DISPATCHED, WatchEventType::FILE_COMPLETED,
                                                  WatchEventType::STOPPED}));
}

TEST_F(WatchEngineTest, DiscoveryFailureStopsTheSession)
{
    auto engine = makeManualEngine(succeed());
    engine->start();

    source_->fail("directory vanished");

    std::vector<WatchEvent> events;
    ASSERT_TRUE(waitUntil([&]()
                          {
        for (auto &event : engine->events().poll())
        {
            events.push_back(event);
        }
        return !events.empty() && events.back().type == WatchEventType::STOPPED; }));
    EXPECT_EQ(engine->getState(), EngineState::STOPPED);
    auto failed = std::find_if(events.begin(), events.end(), [](const WatchEvent &e)
                               { return e.type == WatchEventType::DISCOVERY_FAILED; });
    ASSERT_NE(failed, events.end());
    EXPECT_NE(failed->message.find("directory vanished"), std::string::npos);

    StopResult result = engine->stop();
    EXPECT_FALSE(result.forced);
}

TEST_F(WatchEngineTest, PollingSourceReportsDeletedDirectory)
{
    WatchEngine engine(makeConfig(), succeed());
    engine.start();

    std::filesystem::remove_all(watchDir());
    ASSERT_TRUE(waitUntil([&]()
                          { return engine.getState() == EngineState::STOPPED; }));
    engine.stop();
}

TEST_F(WatchEngineTest, StartRejectsMissingDirectory)
{
    WatchConfig config = makeConfig();
    config.input_directory = rootDir() + "/absent";

    WatchEngine engine(config, succeed());
    EXPECT_THROW(engine.start(), ConfigError);
    EXPECT_EQ(engine.getState(), EngineState::STOPPED);
}

TEST_F(WatchEngineTest, StartCanCreateMissingDirectory)
{
    WatchConfig config = makeConfig();
    config.input_directory = rootDir() + "/created/inbox";
    config.create_input_directory = true;

    WatchEngine engine(config, succeed());
    engine.start();
    EXPECT_TRUE(std::filesystem::is_directory(config.input_directory));
    engine.stop();
}

TEST_F(WatchEngineTest, StartRejectsInvalidConfigAndMissingCallback)
{
    WatchConfig config = makeConfig();
    config.accepted_extensions.clear();
    WatchEngine no_extensions(config, succeed());
    EXPECT_THROW(no_extensions.start(), ConfigError);

    WatchEngine no_callback(makeConfig(), nullptr);
    EXPECT_THROW(no_callback.start(), ConfigError);
}

TEST_F(WatchEngineTest, CorruptRegistryIsFatalAtStart)
{
    std::ofstream(registryPath()) << "{ broken";

    WatchEngine engine(makeConfig(), succeed());
    EXPECT_THROW(engine.start(), RegistryCorruptionError);
    EXPECT_EQ(engine.getState(), EngineState::STOPPED);
    EXPECT_EQ(readFile(registryPath()), "{ broken");
}

TEST_F(WatchEngineTest, EngineIsSingleUse)
{
    auto engine = makeManualEngine(succeed());
    engine->start();
    EXPECT_THROW(engine->start(), WatchError);
    engine->stop();
    EXPECT_THROW(engine->start(), WatchError);
}

TEST_F(WatchEngineTest, PollingModeSelectsPollingSource)
{
    WatchConfig config = makeConfig();
    auto source = WatchEngine::createDiscoverySource(config);
    EXPECT_EQ(source->name(), "polling");
}

TEST_F(WatchEngineTest, NonUtf8NamesAndPayloadsDoNotLoseCompletedFiles)
{
    auto calls = calls_;
    auto engine = makeManualEngine([calls](const std::string &path)
                                   {
        calls->add(path);
        if (path.find("garbled") != std::string::npos)
        {
            return ProcessingResult::ok({{"transcript", "caf\xe9 au lait"}});
        }
        return ProcessingResult::ok(); });
    engine->start();

    std::string latin1 = createFile("caf\xe9.wav");
    std::string garbled = createFile("garbled.wav");
    std::string plain = createFile("plain.wav");
    source_->emit(latin1);
    source_->emit(garbled);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, latin1) == FileStatus::COMPLETED &&
                                   statusOf(*engine, garbled) == FileStatus::COMPLETED; }));

    source_->emit(plain);
    ASSERT_TRUE(waitUntil([&]()
                          { return statusOf(*engine, plain) == FileStatus::COMPLETED; }));
    engine->stop();

    ProcessedRegistry on_disk(registryPath());
    on_disk.load();
    EXPECT_EQ(on_disk.getStatus(plain), FileStatus::COMPLETED);
    EXPECT_EQ(on_disk.getStatus(latin1), FileStatus::COMPLETED);
    EXPECT_EQ(on_disk.getStatus(garbled), FileStatus::COMPLETED);
    EXPECT_EQ(on_disk.getRecord(garbled)->result["transcript"], "caf\xEF\xBF\xBD au lait");

    // A restart against the same registry dispatches none of them again
    auto restarted = makeManualEngine(succeed());
    restarted->start();
    source_->emit(latin1);
    source_->emit(garbled);
    source_->emit(plain);
    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(calls_->count(), 3u);
    restarted->stop();
}
