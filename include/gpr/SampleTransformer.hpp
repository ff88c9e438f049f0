#pragma once
#include <cstdint>
#include <vector>

// Maps an 8-bit intensity onto the full int16 range:
// round(v * 65535/255 - 32768), rounding half away from zero.
// 0 -> -32768, 255 -> 32767.
int16_t transform_sample(uint8_t value);

std::vector<int16_t> transform_column(const std::vector<uint8_t>& column);
