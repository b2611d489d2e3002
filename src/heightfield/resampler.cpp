#include "heightfield/resampler.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace ridgeline {

std::vector<ProfilePoint> sortedKnots(const Profile& profile) {
    std::vector<ProfilePoint> knots = profile.points;
    std::sort(knots.begin(), knots.end(), [](const ProfilePoint& a, const ProfilePoint& b) {
        if (a.x != b.x) return a.x < b.x;
        return a.y < b.y;
    });
    return knots;
}

double interpolateElevation(const std::vector<ProfilePoint>& knots, double x) {
    if (x < knots.front().x) {
        return knots.front().y;
    }
    if (x >= knots.back().x) {
        return knots.back().y;
    }

    // knots[hi - 1].x <= x < knots[hi].x
    auto upper = std::upper_bound(knots.begin(), knots.end(), x,
                                  [](double value, const ProfilePoint& knot) { return value < knot.x; });
    const ProfilePoint& b = *upper;
    const ProfilePoint& a = *(upper - 1);
    double t = (x - a.x) / (b.x - a.x);
    return a.y + (b.y - a.y) * t;
}

std::vector<double> linspace(double start, double stop, int num) {
    std::vector<double> out;
    if (num <= 0) {
        return out;
    }
    out.resize(static_cast<std::size_t>(num));
    if (num == 1) {
        out[0] = start;
        return out;
    }
    double step = (stop - start) / static_cast<double>(num - 1);
    for (int i = 0; i < num; ++i) {
        out[static_cast<std::size_t>(i)] = start + step * static_cast<double>(i);
    }
    out.back() = stop;
    return out;
}

HeightField resample(const Profile& profile, int width, int height) {
    if (width < 1 || height < 1) {
        throw DegenerateGeometryError("cannot resample onto a " + std::to_string(width) + "x" +
                                      std::to_string(height) + " raster (terrain has no horizontal extent"
                                      " at this resolution)");
    }
    if (static_cast<std::size_t>(width) * static_cast<std::size_t>(height) > kMaxHeightFieldSamples) {
        throw OversizedRasterError(std::to_string(width) + "x" + std::to_string(height) + " exceeds " +
                                   std::to_string(kMaxHeightFieldSamples) + " samples");
    }
    if (profile.size() < 2) {
        throw MalformedInputError("a terrain profile needs at least 2 points, got " +
                                  std::to_string(profile.size()));
    }

    std::vector<ProfilePoint> knots = sortedKnots(profile);
    if (knots.front().x == knots.back().x) {
        throw MalformedInputError("a terrain profile needs at least 2 distinct x values");
    }

    ProfileBounds bounds = computeBounds(profile);
    std::vector<double> columnX = linspace(bounds.minX, bounds.maxX, width);
    std::vector<double> rowY = linspace(bounds.minY, bounds.maxY, height);

    std::vector<double> line(columnX.size());
    for (std::size_t i = 0; i < columnX.size(); ++i) {
        line[i] = interpolateElevation(knots, columnX[i]);
    }

    // Rows are identical, so the row extrema are the field extrema.
    auto extrema = std::minmax_element(line.begin(), line.end());
    double lo = *extrema.first;
    double hi = *extrema.second;
    if (hi > lo) {
        double range = hi - lo;
        for (double& v : line) {
            v = (v - lo) / range;
        }
    }

    std::vector<float> row(line.size());
    std::transform(line.begin(), line.end(), row.begin(),
                   [](double v) { return static_cast<float>(v); });

    std::vector<float> values;
    values.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (int r = 0; r < height; ++r) {
        values.insert(values.end(), row.begin(), row.end());
    }

    return HeightField(width, height, std::move(values), std::move(columnX), std::move(rowY));
}

} // namespace ridgeline
