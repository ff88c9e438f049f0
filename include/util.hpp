#pragma once

#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

inline void print_progress_bar(const std::string& label, int current, int total, int width = 50) {
    if (total == 0) return;

    double progress = static_cast<double>(current) / total;
    int bar_width = static_cast<int>(progress * width + 0.5);

    std::cout << "\r"
              << std::left << std::setw(30) << label
              << ": [";

    for (int i = 0; i < width; ++i) {
        std::cout << (i < bar_width ? '#' : '.');
    }
    std::cout << "] "
              << std::right << std::setw(3) << static_cast<int>(progress * 100.0) << "%"
              << " (" << current << "/" << total << ")"
              << std::flush;

    if (current >= total) {
        std::cout << std::endl;
    }
}

// UTC wall clock as YYYYmmdd_HHMMSS, used in output file names
inline std::string utc_timestamp(std::time_t t = std::time(nullptr)) {
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_utc);
    return buf;
}
