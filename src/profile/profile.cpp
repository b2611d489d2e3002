#include "profile/profile.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ridgeline {

namespace {
double coordinateOrZero(const nlohmann::json& point, const char* key, std::size_t index) {
    auto it = point.find(key);
    if (it == point.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw MalformedInputError("point " + std::to_string(index) + " has a non-numeric \"" + key + "\"");
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        throw MalformedInputError("point " + std::to_string(index) + " has a non-finite \"" + key + "\"");
    }
    return value;
}
} // namespace

Profile extractProfile(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw MalformedInputError("level record is not a JSON object");
    }
    auto polyLines = record.find("polyLines");
    if (polyLines == record.end() || !polyLines->is_array()) {
        throw MalformedInputError("missing \"polyLines\" array");
    }
    if (polyLines->empty()) {
        throw MalformedInputError("\"polyLines\" is empty");
    }

    const auto& polyline = (*polyLines)[0];
    if (!polyline.is_object() || !polyline.contains("points") || !polyline["points"].is_array()) {
        throw MalformedInputError("first polyline has no \"points\" array");
    }
    const auto& points = polyline["points"];
    if (points.empty()) {
        throw MalformedInputError("first polyline has no points");
    }
    if (points.size() < 2) {
        throw MalformedInputError("a terrain profile needs at least 2 points, got 1");
    }

    Profile profile;
    profile.points.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        const auto& point = points[i];
        if (!point.is_object()) {
            throw MalformedInputError("point " + std::to_string(i) + " is not an object");
        }
        ProfilePoint p;
        p.x = coordinateOrZero(point, "x", i);
        p.y = coordinateOrZero(point, "y", i);
        profile.points.push_back(p);
    }
    return profile;
}

ProfileRecord extractProfileRecord(const nlohmann::json& record) {
    ProfileRecord out;
    out.profile = extractProfile(record);
    auto name = record.find("name");
    if (name != record.end() && name->is_string()) {
        out.name = name->get<std::string>();
    }
    return out;
}

ProfileBounds computeBounds(const Profile& profile) {
    if (profile.empty()) {
        throw MalformedInputError("cannot compute the bounds of an empty profile");
    }
    ProfileBounds bounds;
    bounds.minX = bounds.maxX = profile.points.front().x;
    bounds.minY = bounds.maxY = profile.points.front().y;
    for (const auto& p : profile.points) {
        bounds.minX = std::min(bounds.minX, p.x);
        bounds.maxX = std::max(bounds.maxX, p.x);
        bounds.minY = std::min(bounds.minY, p.y);
        bounds.maxY = std::max(bounds.maxY, p.y);
    }
    return bounds;
}

} // namespace ridgeline
