#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ridgeline {

struct ProfilePoint {
    double x = 0.0; // horizontal distance along the level, meters
    double y = 0.0; // elevation, meters
};

/**
 * @brief Terrain cross-section in the order the level stores it.
 *
 * Points are not sorted by x; the resampler sorts its own copy.
 */
struct Profile {
    std::vector<ProfilePoint> points;

    std::size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
};

struct ProfileBounds {
    double minX = 0.0;
    double maxX = 0.0;
    double minY = 0.0;
    double maxY = 0.0;

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
};

/**
 * @brief A level record reduced to what the heightmap compiler needs.
 */
struct ProfileRecord {
    Profile profile;
    std::string name; // empty when the record carries no "name"
};

/**
 * @brief Extracts the first polyline of a level record.
 *
 * Missing "x"/"y" fields default to 0.0. Throws MalformedInputError when
 * "polyLines" or "points" is missing or empty, when the polyline has fewer
 * than two points, or when a point is not an object with numeric fields.
 */
Profile extractProfile(const nlohmann::json& record);

// extractProfile plus the optional level name.
ProfileRecord extractProfileRecord(const nlohmann::json& record);

// Bounding box of the profile; the profile must not be empty.
ProfileBounds computeBounds(const Profile& profile);

} // namespace ridgeline
