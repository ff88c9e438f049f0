#pragma once
#include <cstddef>
#include <string>

struct Config {
    std::string output_dir;
    std::string input_bscan;
    std::string positions_file;
    double frame_rate_hz = 0.0;
    int sample_interval_us = 1;
    std::string description = "GPR B-SCAN SESSION";
    std::size_t progress_every = 100;
    std::size_t staging_capacity = 1024;
    bool index_traces = false;
};

Config load_config(const std::string& filename);
