#pragma once

#include <cstddef>
#include <vector>

namespace ridgeline {

// Upper bound on width * height, 1 GiB of float samples.
constexpr std::size_t kMaxHeightFieldSamples = std::size_t(1) << 28;

/**
 * @brief Dense row-major elevation grid produced by the resampler.
 *
 * Values are normalized to [0,1] unless the source terrain was flat. The
 * field is read-only once constructed.
 */
class HeightField {
public:
    HeightField(int width, int height, std::vector<float> values,
                std::vector<double> columnX, std::vector<double> rowY);

    int width() const { return m_width; }
    int height() const { return m_height; }
    std::size_t size() const { return m_values.size(); }

    float at(int row, int column) const {
        return m_values[static_cast<std::size_t>(row) * static_cast<std::size_t>(m_width) +
                        static_cast<std::size_t>(column)];
    }

    const std::vector<float>& values() const { return m_values; }

    // World x of each column's sample, meters.
    const std::vector<double>& columnX() const { return m_columnX; }
    // World y of each row of the sampling grid, meters.
    const std::vector<double>& rowY() const { return m_rowY; }

    float minValue() const;
    float maxValue() const;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<float> m_values;
    std::vector<double> m_columnX;
    std::vector<double> m_rowY;
};

} // namespace ridgeline
