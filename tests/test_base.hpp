#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <unistd.h>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory on disk
 *
 * Every test gets its own directory under the system temp path, removed
 * again in TearDown.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{0};
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();

        test_root_ = std::filesystem::temp_directory_path() /
                     ("auto_ingest_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++) + "_" + info->name());
        std::filesystem::remove_all(test_root_);
        std::filesystem::create_directories(test_root_ / "watch");

        Logger::debug("TestBase SetUp completed for test: " + std::string(info->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_root_, ec);
        if (ec)
        {
            Logger::warn("TestBase could not remove " + test_root_.string() + ": " + ec.message());
        }
    }

    // Directory the engine watches
    std::string watchDir() const { return (test_root_ / "watch").string(); }

    // Scratch space outside the watched directory
    std::string rootDir() const { return test_root_.string(); }

    std::string registryPath() const { return (test_root_ / "registry.json").string(); }

    std::string pathInWatch(const std::string &name) const { return (test_root_ / "watch" / name).string(); }

    // Helper to create (or overwrite) a file relative to the watched directory
    std::string createFile(const std::string &name, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_root_ / "watch" / name;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    void appendToFile(const std::string &path, const std::string &content)
    {
        std::ofstream ofs(path, std::ios::binary | std::ios::app);
        ofs << content;
    }

    std::string readFile(const std::string &path) const
    {
        std::ifstream ifs(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }

    // Polls condition until it holds or the timeout expires
    static bool waitUntil(const std::function<bool()> &condition,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

private:
    std::filesystem::path test_root_;
};
