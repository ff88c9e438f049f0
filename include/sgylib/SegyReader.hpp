#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <fstream>
#include <unordered_map>
#include <optional>
#include "TraceMap.hpp"

// Reads fixed-length SEG-Y files with 2-byte integer samples (format 3),
// i.e. what SegyEncoder produces.
class SegyReader {
public:
    explicit SegyReader(const std::string& filename);
    ~SegyReader();

    std::vector<int16_t> get_trace(int index) const;
    std::vector<uint8_t> get_trace_header(int index) const;

    int32_t get_header_value_i32(int trace_index, const std::string& key) const;
    int32_t get_header_value_i32(const std::vector<uint8_t>& trace_header, const std::string& key) const;
    int32_t get_bin_header_value(const std::string& key) const;

    // Builds a persistent index over the given trace header keys
    void build_tracemap(const std::string& name, const std::string& db_path, const std::vector<std::string>& keys);
    // Opens an index built earlier for this file
    void load_tracemap(const std::string& name, const std::string& db_path, const std::vector<std::string>& keys);
    std::shared_ptr<TraceMap> get_tracemap(const std::string& name) const;

    std::vector<std::vector<int16_t>> get_gather(const std::string& tracemap_name,
                                                 const std::vector<std::optional<int>>& keys) const;

    void get_gather_and_headers(const std::string& tracemap_name,
                                const std::vector<std::optional<int>>& keys,
                                std::vector<std::vector<uint8_t>>& headers,
                                std::vector<std::vector<int16_t>>& traces) const;

    int num_traces() const { return num_traces_; }
    int num_samples() const { return num_samples_; }
    int sample_interval() const { return sample_interval_; }
    int sample_format() const { return sample_format_; }

    const std::vector<uint8_t>& text_header() const { return text_header_; }
    const std::vector<uint8_t>& bin_header() const { return bin_header_; }
    // Text header decoded from EBCDIC, one string per 80-column card
    std::vector<std::string> text_header_lines() const;

private:
    std::string filename_;
    mutable std::ifstream file_;
    std::vector<uint8_t> text_header_;
    std::vector<uint8_t> bin_header_;
    int num_traces_ = 0;
    int num_samples_ = 0;
    int sample_interval_ = 0;
    int sample_format_ = 0;
    int trace_bsize_ = 0;
    std::unordered_map<std::string, std::shared_ptr<TraceMap>> tracemaps_;

    inline std::streamoff data_offset() const { return 3200 + 400; }
    inline std::streamoff trace_offset(int index) const { return data_offset() + static_cast<std::streamoff>(index) * trace_bsize_; }
    inline std::streamoff trace_data_offset(int index) const { return trace_offset(index) + 240; }

    void check_index(int index) const;
    void read_exact(std::streamoff offset, uint8_t* dst, std::size_t size) const;
    void read_gather_block(const std::vector<int>& indices,
                           std::vector<std::vector<uint8_t>>& headers,
                           std::vector<std::vector<int16_t>>& traces) const;
};
