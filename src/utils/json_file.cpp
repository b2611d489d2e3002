#include "utils/json_file.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace ridgeline {

JsonFile loadJsonFile(const std::string& path) {
    JsonFile result;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.message = "file not found";
        return result;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        result.message = "cannot open file";
        return result;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.status = JsonFileStatus::ReadFailed;
        result.message = "read error";
        return result;
    }

    try {
        result.value = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        result.status = JsonFileStatus::ParseFailed;
        result.message = e.what();
        return result;
    }
    result.status = JsonFileStatus::Ok;
    return result;
}

} // namespace ridgeline
