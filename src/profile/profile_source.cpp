#include "profile/profile_source.hpp"
#include "core/errors.hpp"
#include "utils/json_file.hpp"

#include <httplib.h>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace ridgeline {

namespace {
constexpr const char* kIdPlaceholder = "{id}";

nlohmann::json parseRecordText(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInputError("level record from " + origin + " is not valid JSON (" + e.what() + ")");
    }
}
} // namespace

std::string formatLevelUrl(const std::string& urlTemplate, long long id) {
    const std::string placeholder = kIdPlaceholder;
    if (urlTemplate.find(placeholder) == std::string::npos) {
        throw std::invalid_argument("level URL template has no {id} placeholder: " + urlTemplate);
    }
    std::string url = urlTemplate;
    const std::string value = std::to_string(id);
    std::size_t pos = 0;
    while ((pos = url.find(placeholder, pos)) != std::string::npos) {
        url.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return url;
}

UrlParts splitUrl(const std::string& url) {
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme '" + scheme + "' in " + url);
    }

    std::size_t hostBegin = schemeEnd + 3;
    std::size_t pathBegin = url.find('/', hostBegin);
    UrlParts parts;
    if (pathBegin == std::string::npos) {
        parts.schemeHostPort = url;
        parts.path = "/";
    } else {
        parts.schemeHostPort = url.substr(0, pathBegin);
        parts.path = url.substr(pathBegin);
    }
    if (parts.schemeHostPort.size() == hostBegin) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return parts;
}

nlohmann::json readRecordFile(const std::string& path) {
    JsonFile file = loadJsonFile(path);
    switch (file.status) {
    case JsonFileStatus::Ok:
        return std::move(file.value);
    case JsonFileStatus::NotFound:
        throw IoError(path, "Input file not found");
    case JsonFileStatus::ReadFailed:
        throw IoError(path, "Failed to read input file");
    case JsonFileStatus::ParseFailed:
        break;
    }
    throw MalformedInputError("level record from " + path + " is not valid JSON (" + file.message + ")");
}

nlohmann::json fetchRecord(long long id, const FetchConfig& config) {
    std::string url = formatLevelUrl(config.urlTemplate, id);
    UrlParts parts = splitUrl(url);
    std::cout << "[ProfileSource] Fetching data from " << url << "..." << std::endl;

    httplib::Client cli(parts.schemeHostPort);
    cli.set_follow_location(true);
    cli.set_connection_timeout(config.connectTimeoutSeconds);
    cli.set_read_timeout(config.readTimeoutSeconds);

    httplib::Result res = cli.Get(parts.path);
    if (!res) {
        throw FetchError(url, "HTTP request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw FetchError(url, "server answered with status " + std::to_string(res->status));
    }
    return parseRecordText(res->body, url);
}

ProfileRecord loadProfileRecord(const InputSource& source, const FetchConfig& config) {
    nlohmann::json record;
    if (const auto* file = std::get_if<FileSource>(&source)) {
        std::cout << "[ProfileSource] Reading polyline from '" << file->path << "'..." << std::endl;
        record = readRecordFile(file->path);
    } else {
        record = fetchRecord(std::get<IdentifierSource>(source).id, config);
    }
    return extractProfileRecord(record);
}

std::string describeSource(const InputSource& source) {
    if (const auto* file = std::get_if<FileSource>(&source)) {
        return "file '" + file->path + "'";
    }
    return "level " + std::to_string(std::get<IdentifierSource>(source).id);
}

} // namespace ridgeline
