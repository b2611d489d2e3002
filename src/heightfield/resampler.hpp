#pragma once

#include "heightfield/height_field.hpp"
#include "profile/profile.hpp"

#include <vector>

namespace ridgeline {

/**
 * @brief Resamples a terrain profile onto a regular width x height grid.
 *
 * Elevation is interpolated linearly between knots along x and held flat
 * beyond the first and last knot. The profile is a single cross-section,
 * so every row of the field carries the same interpolated profile. When the
 * resulting elevations are not all equal they are rescaled to [0,1];
 * a perfectly flat profile keeps its raw elevation.
 *
 * Throws DegenerateGeometryError when width or height is below 1,
 * OversizedRasterError above kMaxHeightFieldSamples, and MalformedInputError
 * when the profile has fewer than two distinct x values.
 */
HeightField resample(const Profile& profile, int width, int height);

// Knots ordered by x, ties ordered by y.
std::vector<ProfilePoint> sortedKnots(const Profile& profile);

/**
 * @brief Piecewise-linear elevation at x over knots sorted by sortedKnots().
 *
 * Values left of the first knot return its elevation, values right of the
 * last knot return the last knot's elevation.
 */
double interpolateElevation(const std::vector<ProfilePoint>& knots, double x);

// num evenly spaced samples over [start, stop]; the last sample is exactly stop.
std::vector<double> linspace(double start, double stop, int num);

} // namespace ridgeline
