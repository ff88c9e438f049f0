#include "Config.hpp"
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <stdexcept>
#include <string>
#include <utility>


namespace {
    struct Param {
        std::string value;
        int line = 0;
    };

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(" \t\n\r");
        return s.substr(start, end - start + 1);
    }

    [[noreturn]] void bad_value(const std::string& key, const Param& p, const std::string& why) {
        throw std::runtime_error("Invalid value for '" + key + "' at line " + std::to_string(p.line) +
                                 ": '" + p.value + "' (" + why + ")");
    }

    long long to_integer(const std::string& key, const Param& p, long long min, long long max) {
        long long v = 0;
        try {
            std::size_t used = 0;
            v = std::stoll(p.value, &used);
            if (used != p.value.size()) bad_value(key, p, "not an integer");
        } catch (const std::invalid_argument&) {
            bad_value(key, p, "not an integer");
        } catch (const std::out_of_range&) {
            bad_value(key, p, "out of range");
        }
        if (v < min || v > max) {
            bad_value(key, p, "expected " + std::to_string(min) + ".." + std::to_string(max));
        }
        return v;
    }

    double to_double(const std::string& key, const Param& p) {
        double v = 0.0;
        try {
            std::size_t used = 0;
            v = std::stod(p.value, &used);
            if (used != p.value.size()) bad_value(key, p, "not a number");
        } catch (const std::invalid_argument&) {
            bad_value(key, p, "not a number");
        } catch (const std::out_of_range&) {
            bad_value(key, p, "out of range");
        }
        return v;
    }

    bool to_bool(const std::string& key, const Param& p) {
        if (p.value == "true" || p.value == "1" || p.value == "yes") return true;
        if (p.value == "false" || p.value == "0" || p.value == "no") return false;
        bad_value(key, p, "expected true or false");
    }
    }

    Config load_config(const std::string& filename) {
        std::ifstream file(filename);
        if (!file) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        std::unordered_map<std::string, Param> params;
        std::string line;
        int line_num = 0;

        while (std::getline(file, line)) {
            line_num++;
            if (trim(line).empty() || trim(line)[0] == '#') {
                continue;
            }

            std::istringstream is_line(line);
            std::string key, value;
            if (std::getline(is_line, key, '=') && std::getline(is_line, value)) {
                std::string cleaned_key = trim(key);
                if (!cleaned_key.empty()) {
                    params[cleaned_key] = Param{trim(value), line_num};
                }
            } else {
                throw std::runtime_error("Invalid format in config file at line " + std::to_string(line_num) + ": " + line);
            }
        }

        Config cfg;

        try {
            cfg.output_dir = params.at("output_dir").value;
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Missing mandatory parameter in config file: output_dir");
        }
        if (cfg.output_dir.empty()) {
            throw std::runtime_error("Empty output_dir at line " + std::to_string(params.at("output_dir").line));
        }

        if (params.count("input_bscan")) {
            cfg.input_bscan = params.at("input_bscan").value;
        }
        if (params.count("positions_file")) {
            cfg.positions_file = params.at("positions_file").value;
        }
        if (params.count("frame_rate_hz")) {
            cfg.frame_rate_hz = to_double("frame_rate_hz", params.at("frame_rate_hz"));
            if (cfg.frame_rate_hz < 0.0) {
                bad_value("frame_rate_hz", params.at("frame_rate_hz"), "must not be negative");
            }
        }
        if (params.count("sample_interval_us")) {
            cfg.sample_interval_us = static_cast<int>(to_integer("sample_interval_us", params.at("sample_interval_us"), 1, 32767));
        }
        if (params.count("description")) {
            cfg.description = params.at("description").value;
        }
        if (params.count("progress_every")) {
            cfg.progress_every = static_cast<std::size_t>(to_integer("progress_every", params.at("progress_every"), 0, 1000000000));
        }
        if (params.count("staging_capacity")) {
            cfg.staging_capacity = static_cast<std::size_t>(to_integer("staging_capacity", params.at("staging_capacity"), 1, 100000000));
        }
        if (params.count("index_traces")) {
            cfg.index_traces = to_bool("index_traces", params.at("index_traces"));
        }

        return cfg;
    }
