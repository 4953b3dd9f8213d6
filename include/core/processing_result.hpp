#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Outcome reported by the processing callback for one file
 */
struct ProcessingResult
{
    bool success;
    std::string error_message;
    nlohmann::json payload; // Stored as the record's result on success

    ProcessingResult() : success(false), payload(nlohmann::json::object()) {}
    ProcessingResult(bool s, const std::string &msg = "")
        : success(s), error_message(msg), payload(nlohmann::json::object()) {}

    static ProcessingResult ok(nlohmann::json payload = nlohmann::json::object())
    {
        ProcessingResult result(true);
        result.payload = std::move(payload);
        return result;
    }

    static ProcessingResult failure(const std::string &message)
    {
        return ProcessingResult(false, message);
    }
};

/**
 * @brief Caller-supplied processing logic
 *
 * Invoked synchronously on the engine's dispatch thread with the absolute
 * path of a stable, eligible file. Exceptions are treated as failures.
 * Must not touch the ProcessedRegistry; bookkeeping is the engine's job.
 */
using ProcessingCallback = std::function<ProcessingResult(const std::string &file_path)>;
