#include "core/file_record.hpp"
#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace
{
    const char *const kKnownFields[] = {"status", "size", "mtime_ns", "updated_at", "completed_at",
                                        "result", "error", "needs_review", "review_reason", "path"};

    const std::string kEncodedKeyPrefix = "base64:";

    std::string encodeBase64(const std::string &bytes)
    {
        std::ostringstream out;
        Poco::Base64Encoder encoder(out);
        encoder.rdbuf()->setLineLength(0);
        encoder << bytes;
        encoder.close();
        return out.str();
    }

    std::string decodeBase64(const std::string &encoded)
    {
        std::istringstream in(encoded);
        Poco::Base64Decoder decoder(in);
        std::string bytes((std::istreambuf_iterator<char>(decoder)), std::istreambuf_iterator<char>());
        // The decoder skips characters outside the alphabet; a round trip catches that
        if (encodeBase64(bytes) != encoded)
        {
            throw std::invalid_argument("malformed base64 key '" + encoded + "'");
        }
        return bytes;
    }

    bool isKnownField(const std::string &key)
    {
        for (const char *field : kKnownFields)
        {
            if (key == field)
                return true;
        }
        return false;
    }
}

std::string fileStatusToString(FileStatus status)
{
    switch (status)
    {
    case FileStatus::PENDING:
        return "pending";
    case FileStatus::IN_PROGRESS:
        return "in_progress";
    case FileStatus::COMPLETED:
        return "completed";
    case FileStatus::FAILED:
        return "failed";
    }
    return "pending";
}

std::optional<FileStatus> fileStatusFromString(const std::string &status_str)
{
    if (status_str == "pending")
        return FileStatus::PENDING;
    if (status_str == "in_progress")
        return FileStatus::IN_PROGRESS;
    if (status_str == "completed")
        return FileStatus::COMPLETED;
    if (status_str == "failed")
        return FileStatus::FAILED;
    return std::nullopt;
}

bool isValidUtf8(const std::string &text)
{
    try
    {
        nlohmann::json(text).dump();
        return true;
    }
    catch (const nlohmann::json::type_error &)
    {
        return false;
    }
}

std::string sanitizeUtf8Text(const std::string &text)
{
    if (isValidUtf8(text))
    {
        return text;
    }
    std::string replaced = nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(replaced).get<std::string>();
}

nlohmann::json sanitizeUtf8Json(const nlohmann::json &value)
{
    try
    {
        value.dump();
        return value;
    }
    catch (const nlohmann::json::type_error &)
    {
        return nlohmann::json::parse(value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
}

std::string FileRecord::storageKey(const std::string &identity)
{
    if (isValidUtf8(identity))
    {
        return identity;
    }
    return kEncodedKeyPrefix + encodeBase64(identity);
}

std::string FileRecord::identityFromStorageKey(const std::string &key)
{
    if (key.compare(0, kEncodedKeyPrefix.size(), kEncodedKeyPrefix) != 0)
    {
        return key;
    }
    return decodeBase64(key.substr(kEncodedKeyPrefix.size()));
}

nlohmann::json FileRecord::toJson() const
{
    nlohmann::json j = extra.is_object() ? extra : nlohmann::json::object();
    j["status"] = fileStatusToString(status);
    j["size"] = size;
    j["mtime_ns"] = mtime_ns;
    j["updated_at"] = updated_at;
    j["completed_at"] = completed_at;
    j["result"] = result;
    j["error"] = error;
    j["needs_review"] = needs_review;
    if (!review_reason.empty())
    {
        j["review_reason"] = review_reason;
    }
    // Readable form of a path whose key had to be encoded
    if (!isValidUtf8(identity))
    {
        j["path"] = sanitizeUtf8Text(identity);
    }
    return j;
}

FileRecord FileRecord::fromJson(const std::string &identity, const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::invalid_argument("record for " + identity + " is not an object");
    }

    FileRecord record;
    record.identity = identity;

    if (!j.contains("status") || !j.at("status").is_string())
    {
        throw std::invalid_argument("record for " + identity + " has no status");
    }
    auto status = fileStatusFromString(j.at("status").get<std::string>());
    if (!status)
    {
        throw std::invalid_argument("record for " + identity + " has unknown status '" +
                                    j.at("status").get<std::string>() + "'");
    }
    record.status = *status;

    // get<> throws nlohmann::json::type_error on mismatched types; the registry reports that as corruption
    record.size = j.value("size", static_cast<uint64_t>(0));
    record.mtime_ns = j.value("mtime_ns", static_cast<int64_t>(0));
    record.updated_at = j.value("updated_at", std::string());
    record.completed_at = j.value("completed_at", std::string());
    record.error = j.value("error", std::string());
    record.needs_review = j.value("needs_review", false);
    record.review_reason = j.value("review_reason", std::string());
    if (j.contains("result") && !j.at("result").is_null())
    {
        record.result = j.at("result");
    }

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        if (!isKnownField(it.key()))
        {
            record.extra[it.key()] = it.value();
        }
    }
    return record;
}
