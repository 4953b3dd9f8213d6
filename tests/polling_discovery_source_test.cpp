#include "test_base.hpp"
#include "core/polling_discovery_source.hpp"
#include <filesystem>
#include <mutex>
#include <sys/time.h>
#include <vector>

using namespace std::chrono_literals;

namespace
{
    // Gives a file a fixed mtime so ordering does not depend on write timing
    void setMtime(const std::string &path, time_t seconds)
    {
        struct timeval times[2];
        times[0].tv_sec = seconds;
        times[0].tv_usec = 0;
        times[1] = times[0];
        ASSERT_EQ(utimes(path.c_str(), times), 0);
    }
}

class PollingDiscoverySourceTest : public TestBase
{
protected:
    std::vector<std::string> scan(PollingDiscoverySource &source)
    {
        std::vector<std::string> emitted;
        std::string error;
        EXPECT_TRUE(source.scanOnce([&emitted](const std::string &path)
                                    { emitted.push_back(std::filesystem::path(path).filename().string()); },
                                    &error))
            << error;
        return emitted;
    }
};

TEST_F(PollingDiscoverySourceTest, FirstScanEmitsExistingFilesOldestFirst)
{
    setMtime(createFile("newer.wav"), 2000000);
    setMtime(createFile("older.wav"), 1000000);

    PollingDiscoverySource source(watchDir(), 100ms, false);
    EXPECT_EQ(scan(source), (std::vector<std::string>{"older.wav", "newer.wav"}));
}

TEST_F(PollingDiscoverySourceTest, LaterScansEmitOnlyDifferences)
{
    createFile("a.wav", "1");
    PollingDiscoverySource source(watchDir(), 100ms, false);
    scan(source);

    EXPECT_TRUE(scan(source).empty());

    createFile("b.wav", "2");
    EXPECT_EQ(scan(source), (std::vector<std::string>{"b.wav"}));

    appendToFile(pathInWatch("a.wav"), "more");
    EXPECT_EQ(scan(source), (std::vector<std::string>{"a.wav"}));
}

TEST_F(PollingDiscoverySourceTest, RecursiveScanIncludesSubdirectories)
{
    createFile("top.wav");
    createFile("nested/deep/inner.wav");

    PollingDiscoverySource flat(watchDir(), 100ms, false);
    EXPECT_EQ(scan(flat).size(), 1u);

    PollingDiscoverySource recursive(watchDir(), 100ms, true);
    EXPECT_EQ(scan(recursive).size(), 2u);
}

TEST_F(PollingDiscoverySourceTest, BackgroundLoopPicksUpNewFiles)
{
    std::mutex mutex;
    std::vector<std::string> seen;
    PollingDiscoverySource source(watchDir(), 50ms, false);
    source.start(
        [&](const std::string &path)
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(path);
        },
        [](const std::exception &e)
        {
            ADD_FAILURE() << "unexpected discovery error: " << e.what();
        });
    EXPECT_TRUE(source.isRunning());
    EXPECT_EQ(source.name(), "polling");

    createFile("late.wav");
    EXPECT_TRUE(waitUntil([&]()
                          {
        std::lock_guard<std::mutex> lock(mutex);
        return !seen.empty(); }));

    source.stop();
    EXPECT_FALSE(source.isRunning());
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.front(), pathInWatch("late.wav"));
}

TEST_F(PollingDiscoverySourceTest, DirectoryLossReportsErrorOnce)
{
    std::atomic<int> errors{0};
    std::string message;
    std::mutex mutex;

    PollingDiscoverySource source(watchDir(), 30ms, false);
    source.start([](const std::string &) {},
                 [&](const std::exception &e)
                 {
                     std::lock_guard<std::mutex> lock(mutex);
                     message = e.what();
                     errors++;
                 });

    std::filesystem::remove_all(watchDir());

    EXPECT_TRUE(waitUntil([&]()
                          { return errors.load() > 0; }));
    EXPECT_TRUE(waitUntil([&]()
                          { return !source.isRunning(); }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(errors.load(), 1);

    source.stop();
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_NE(message.find("Discovery error"), std::string::npos);
}

TEST_F(PollingDiscoverySourceTest, StopIsIdempotent)
{
    PollingDiscoverySource source(watchDir(), 10s, false);
    source.start([](const std::string &) {}, [](const std::exception &) {});
    source.stop();
    source.stop();
    EXPECT_FALSE(source.isRunning());
}
