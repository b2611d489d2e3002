#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace ridgeline {

enum class JsonFileStatus {
    Ok,
    NotFound,     // missing, not a regular file, or cannot be opened
    ReadFailed,
    ParseFailed,
};

struct JsonFile {
    JsonFileStatus status = JsonFileStatus::NotFound;
    nlohmann::json value;
    std::string message; // parser or stream diagnostic; empty when status is Ok

    explicit operator bool() const { return status == JsonFileStatus::Ok; }
};

// Reads and parses a whole JSON file. Never throws; callers map the status
// onto their own error types.
JsonFile loadJsonFile(const std::string& path);

} // namespace ridgeline
