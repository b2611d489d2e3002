#pragma once

#include "profile/profile.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace ridgeline {

constexpr const char* kDefaultLevelUrlTemplate = "https://deaddropgames.com/stuntski/api/levels/{id}";

// Level JSON stored on local disk.
struct FileSource {
    std::string path;
};

// Level published on the level server, addressed by its numeric id.
struct IdentifierSource {
    long long id = 0;
};

using InputSource = std::variant<FileSource, IdentifierSource>;

struct FetchConfig {
    std::string urlTemplate = kDefaultLevelUrlTemplate; // "{id}" is replaced by the level id
    int connectTimeoutSeconds = 10;
    int readTimeoutSeconds = 30;
};

struct UrlParts {
    std::string schemeHostPort; // "https://host[:port]"
    std::string path;           // always starts with '/'
};

// Substitutes every "{id}"; throws std::invalid_argument when there is none.
std::string formatLevelUrl(const std::string& urlTemplate, long long id);

// Splits an absolute http(s) URL; throws std::invalid_argument otherwise.
UrlParts splitUrl(const std::string& url);

/**
 * @brief Parses a level record from a local JSON file.
 *
 * Throws IoError when the file is missing or unreadable and
 * MalformedInputError when it is not valid JSON.
 */
nlohmann::json readRecordFile(const std::string& path);

/**
 * @brief GETs a level record from the level server.
 *
 * Throws FetchError for transport failures and non-2xx responses, and
 * MalformedInputError when the body is not valid JSON.
 */
nlohmann::json fetchRecord(long long id, const FetchConfig& config);

// Loads the record from whichever source was selected and extracts its profile.
ProfileRecord loadProfileRecord(const InputSource& source, const FetchConfig& config);

std::string describeSource(const InputSource& source);

} // namespace ridgeline
