#include "heightfield/height_field.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace ridgeline {

HeightField::HeightField(int width, int height, std::vector<float> values,
                         std::vector<double> columnX, std::vector<double> rowY)
    : m_width(width),
      m_height(height),
      m_values(std::move(values)),
      m_columnX(std::move(columnX)),
      m_rowY(std::move(rowY)) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("HeightField dimensions must be positive");
    }
    const std::size_t expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    if (m_values.size() != expected) {
        throw std::invalid_argument("HeightField expects " + std::to_string(expected) +
                                    " values, got " + std::to_string(m_values.size()));
    }
    if (m_columnX.size() != static_cast<std::size_t>(width) ||
        m_rowY.size() != static_cast<std::size_t>(height)) {
        throw std::invalid_argument("HeightField grid coordinates do not match its dimensions");
    }
}

float HeightField::minValue() const {
    return *std::min_element(m_values.begin(), m_values.end());
}

float HeightField::maxValue() const {
    return *std::max_element(m_values.begin(), m_values.end());
}

} // namespace ridgeline
