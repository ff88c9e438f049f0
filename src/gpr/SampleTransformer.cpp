#include "gpr/SampleTransformer.hpp"
#include <cmath>

namespace {
    constexpr double Scale = 65535.0 / 255.0;
    constexpr double Offset = 32768.0;
}

int16_t transform_sample(uint8_t value) {
    return static_cast<int16_t>(std::lround(value * Scale - Offset));
}

std::vector<int16_t> transform_column(const std::vector<uint8_t>& column) {
    std::vector<int16_t> samples(column.size());
    for (size_t i = 0; i < column.size(); ++i) {
        samples[i] = transform_sample(column[i]);
    }
    return samples;
}
