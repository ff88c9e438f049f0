#include "gpr/BscanReplay.hpp"
#include "Logger.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {
    // Next PGM header token, skipping whitespace and '#' comments
    std::string next_token(std::istream& in) {
        std::string token;
        int c;
        while ((c = in.get()) != EOF) {
            if (c == '#') {
                std::string comment;
                std::getline(in, comment);
                continue;
            }
            if (std::isspace(c)) {
                if (!token.empty()) break;
                continue;
            }
            token.push_back(static_cast<char>(c));
        }
        return token;
    }

    std::size_t header_number(std::istream& in, const std::string& path, const char* what) {
        std::string token = next_token(in);
        std::size_t value = 0;
        try {
            std::size_t used = 0;
            unsigned long long v = std::stoull(token, &used);
            if (used != token.size()) throw std::invalid_argument(token);
            value = static_cast<std::size_t>(v);
        } catch (const std::exception&) {
            throw std::runtime_error("Bad PGM " + std::string(what) + " '" + token + "' in " + path);
        }
        return value;
    }

    // False when width * height does not fit in size_t
    bool pixel_count(std::size_t width, std::size_t height, std::size_t& count) {
        if (height != 0 && width > std::numeric_limits<std::size_t>::max() / height) return false;
        count = width * height;
        return true;
    }
}

std::vector<uint8_t> BscanImage::column(std::size_t c) const {
    if (c >= width) throw std::out_of_range("Column " + std::to_string(c) + " out of range");
    std::vector<uint8_t> out(height);
    for (std::size_t r = 0; r < height; ++r) {
        out[r] = pixels[r * width + c];
    }
    return out;
}

BscanImage read_pgm(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Cannot open B-scan image: " + path);

    if (next_token(file) != "P5") {
        throw std::runtime_error("Not a binary PGM (P5) file: " + path);
    }
    BscanImage image;
    image.width = header_number(file, path, "width");
    image.height = header_number(file, path, "height");
    std::size_t maxval = header_number(file, path, "maxval");
    if (image.width == 0 || image.height == 0) {
        throw std::runtime_error("Empty PGM image: " + path);
    }
    if (maxval == 0 || maxval > 255) {
        throw std::runtime_error("Only 8-bit PGM is supported (maxval " + std::to_string(maxval) + "): " + path);
    }

    std::size_t count = 0;
    if (!pixel_count(image.width, image.height, count)) {
        throw std::runtime_error("PGM dimensions " + std::to_string(image.width) + " x " +
                                 std::to_string(image.height) + " are too large: " + path);
    }

    // next_token consumed the single whitespace after maxval
    image.pixels.resize(count);
    file.read(reinterpret_cast<char*>(image.pixels.data()), static_cast<std::streamsize>(image.pixels.size()));
    if (static_cast<std::size_t>(file.gcount()) != image.pixels.size()) {
        throw std::runtime_error("Truncated PGM pixel data in " + path);
    }

    log_info("B-scan " + path + ": " + std::to_string(image.width) + " columns x " +
             std::to_string(image.height) + " samples");
    return image;
}

PositionTable read_position_table(const std::string& path) {
    PositionTable table;
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open positions table: " + path);

    std::string line;
    bool header_skipped = false;

    while (std::getline(file, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;

        if (!header_skipped && (line.find("column") != std::string::npos || line.find("COLUMN") != std::string::npos)) {
            header_skipped = true;
            continue;
        }

        std::istringstream iss(line);
        std::size_t column;
        double x, y;
        if (iss >> column >> x >> y) {
            table[column] = {x, y};
        } else {
            log_warn("Failed to parse positions line: " + line);
        }
    }

    return table;
}

BscanReplay::BscanReplay(BscanImage image, PositionTable positions)
    : image_(std::move(image)), positions_(std::move(positions))
{
    std::size_t count = 0;
    if (!pixel_count(image_.width, image_.height, count) || image_.pixels.size() != count) {
        throw std::invalid_argument("B-scan pixel count does not match its dimensions");
    }
    if (!positions_.empty() && positions_.rbegin()->first >= image_.width) {
        log_warn("Positions table has entries past the last column (" + std::to_string(image_.width) + ")");
    }
}

Frame BscanReplay::frame(std::size_t column) const {
    Frame frame;
    frame.column = image_.column(column);
    auto it = positions_.find(column);
    if (it != positions_.end()) frame.position = it->second;
    return frame;
}

std::size_t BscanReplay::run(const std::function<void(Frame)>& sink, double frame_rate_hz,
                             const std::atomic<bool>& stop) const {
    using clock = std::chrono::steady_clock;
    const bool paced = frame_rate_hz > 0.0;
    const auto period = paced
        ? std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(1.0 / frame_rate_hz))
        : clock::duration::zero();

    auto next = clock::now();
    std::size_t delivered = 0;
    for (std::size_t c = 0; c < image_.width; ++c) {
        if (stop.load()) break;
        if (paced) {
            std::this_thread::sleep_until(next);
            next += period;
        }
        sink(frame(c));
        ++delivered;
    }
    return delivered;
}
