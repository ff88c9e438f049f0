#pragma once

#include <cstdint>
#include <vector>

// One B-scan column and where it was taken. Coordinates are raw, clamping
// happens only when the trace header is written.
struct Trace {
    std::vector<int16_t> samples;
    uint64_t sequence_index = 0;
    int64_t x_coordinate = 0;
    int64_t y_coordinate = 0;
};
