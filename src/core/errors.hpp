#pragma once

#include <stdexcept>
#include <string>

namespace ridgeline {

/**
 * @brief Base of every failure the heightmap pipeline reports.
 *
 * Callers that only need "did it work" catch this; callers that need to tell
 * a network problem from a bad file catch the concrete types below.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Structured record is missing required keys, or the profile cannot be interpolated.
class MalformedInputError : public Error {
public:
    explicit MalformedInputError(const std::string& message)
        : Error("Malformed input: " + message) {}
};

class FetchError : public Error {
public:
    FetchError(const std::string& url, const std::string& cause)
        : Error("Failed to fetch " + url + ": " + cause), m_url(url) {}

    const std::string& url() const { return m_url; }

private:
    std::string m_url;
};

// Raster dimensions that cannot produce an image (zero width or height).
class DegenerateGeometryError : public Error {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : Error("Degenerate geometry: " + message) {}
};

// Raster holding more samples than the resampler will allocate.
class OversizedRasterError : public Error {
public:
    explicit OversizedRasterError(const std::string& message)
        : Error("Raster too large: " + message) {}
};

class IoError : public Error {
public:
    IoError(const std::string& path, const std::string& message)
        : Error(message + ": " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

} // namespace ridgeline
