#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

// One inbound B-scan column as delivered by the sensor feed
struct Frame {
    std::vector<uint8_t> column;
    // (x, y) when the feed has a position fix for this column
    std::optional<std::pair<double, double>> position;
};
