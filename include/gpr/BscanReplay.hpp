#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "gpr/Frame.hpp"

// 8-bit grayscale B-scan, row-major. Each column is one radar trace.
struct BscanImage {
    std::size_t width = 0;
    std::size_t height = 0;
    std::vector<uint8_t> pixels;

    std::vector<uint8_t> column(std::size_t c) const;
};

// Binary PGM (P5) with maxval <= 255. Pixel values are kept as stored.
BscanImage read_pgm(const std::string& path);

// column -> (x, y)
using PositionTable = std::map<std::size_t, std::pair<double, double>>;

// Whitespace separated "column x y" lines, columns counted from 0.
// An optional header line and '#' comments are skipped.
PositionTable read_position_table(const std::string& path);

// Plays a recorded B-scan back as a live frame feed.
class BscanReplay {
public:
    explicit BscanReplay(BscanImage image, PositionTable positions = {});

    std::size_t num_frames() const { return image_.width; }
    Frame frame(std::size_t column) const;

    // Delivers frames in column order, at most frame_rate_hz per second
    // (0 = no pacing). Stops early once `stop` is set. Returns the number
    // of frames delivered.
    std::size_t run(const std::function<void(Frame)>& sink, double frame_rate_hz,
                    const std::atomic<bool>& stop) const;

private:
    BscanImage image_;
    PositionTable positions_;
};
