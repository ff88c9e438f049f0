#include "sgylib/SegyReader.hpp"
#include "sgylib/SegyUtil.hpp"
#include "sgylib/BinFieldMap.hpp"
#include "sgylib/TraceFieldMap.hpp"
#include <algorithm>
#include <stdexcept>

SegyReader::SegyReader(const std::string& filename)
    : filename_(filename) {
    file_.open(filename, std::ios::binary | std::ios::in);
    if (!file_) throw std::runtime_error("Cannot open SEG-Y file: " + filename);

    file_.seekg(0, std::ios::end);
    std::streamoff file_size = file_.tellg();
    if (file_size < data_offset()) {
        throw std::runtime_error("File too short for SEG-Y headers: " + filename);
    }

    text_header_.resize(segy::TextHeaderSize);
    read_exact(0, text_header_.data(), text_header_.size());
    bin_header_.resize(segy::BinHeaderSize);
    read_exact(segy::TextHeaderSize, bin_header_.data(), bin_header_.size());

    num_samples_ = get_bin_field_value(bin_header_.data(), "SamplesPerTrace");
    sample_interval_ = get_bin_field_value(bin_header_.data(), "SampleInterval");
    sample_format_ = get_bin_field_value(bin_header_.data(), "DataSampleFormat");

    if (sample_format_ != segy::FormatInt16) {
        throw std::runtime_error("Unsupported sample format " + std::to_string(sample_format_) + " in " + filename);
    }
    if (num_samples_ <= 0) {
        throw std::runtime_error("Invalid samples per trace " + std::to_string(num_samples_) + " in " + filename);
    }

    trace_bsize_ = segy::TraceHeaderSize + num_samples_ * 2;
    std::streamoff payload = file_size - data_offset();
    if (payload % trace_bsize_ != 0) {
        throw std::runtime_error("Trace data in " + filename + " is not a whole number of " +
                                 std::to_string(trace_bsize_) + "-byte records");
    }
    num_traces_ = static_cast<int>(payload / trace_bsize_);
}

SegyReader::~SegyReader() {
    if (file_.is_open()) file_.close();
}

void SegyReader::check_index(int index) const {
    if (index < 0 || index >= num_traces_) {
        throw std::out_of_range("Trace index " + std::to_string(index) + " out of range [0, " +
                                std::to_string(num_traces_) + ")");
    }
}

void SegyReader::read_exact(std::streamoff offset, uint8_t* dst, std::size_t size) const {
    file_.clear();
    file_.seekg(offset, std::ios::beg);
    file_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(size));
    if (file_.gcount() != static_cast<std::streamsize>(size)) {
        throw std::runtime_error("Short read at offset " + std::to_string(offset) + " in " + filename_);
    }
}

std::vector<int16_t> SegyReader::get_trace(int index) const {
    check_index(index);
    std::vector<uint8_t> buf(num_samples_ * 2);
    read_exact(trace_data_offset(index), buf.data(), buf.size());
    std::vector<int16_t> trace(num_samples_);
    for (int i = 0; i < num_samples_; ++i) {
        trace[i] = get_i16_be(buf.data(), i * 2);
    }
    return trace;
}

std::vector<uint8_t> SegyReader::get_trace_header(int index) const {
    check_index(index);
    std::vector<uint8_t> header(segy::TraceHeaderSize);
    read_exact(trace_offset(index), header.data(), header.size());
    return header;
}

int32_t SegyReader::get_header_value_i32(int trace_index, const std::string& key) const {
    return get_header_value_i32(get_trace_header(trace_index), key);
}

int32_t SegyReader::get_header_value_i32(const std::vector<uint8_t>& trace_header, const std::string& key) const {
    return get_trace_field_value(trace_header.data(), key);
}

int32_t SegyReader::get_bin_header_value(const std::string& key) const {
    return get_bin_field_value(bin_header_.data(), key);
}

std::vector<std::string> SegyReader::text_header_lines() const {
    std::vector<std::string> lines;
    for (int i = 0; i < segy::TextLineCount; ++i) {
        std::string line = ebcdic_to_utf8(text_header_.data() + i * segy::TextLineWidth, segy::TextLineWidth);
        line.erase(line.find_last_not_of(' ') + 1);
        lines.push_back(line);
    }
    return lines;
}

void SegyReader::build_tracemap(const std::string& name, const std::string& db_path,
                                const std::vector<std::string>& keys) {
    auto map = std::make_shared<TraceMap>(db_path, keys);
    map->build_map(*this);
    tracemaps_[name] = map;
}

void SegyReader::load_tracemap(const std::string& name, const std::string& db_path,
                               const std::vector<std::string>& keys) {
    tracemaps_[name] = std::make_shared<TraceMap>(db_path, keys);
}

std::shared_ptr<TraceMap> SegyReader::get_tracemap(const std::string& name) const {
    auto it = tracemaps_.find(name);
    if (it == tracemaps_.end()) throw std::invalid_argument("No such TraceMap: " + name);
    return it->second;
}

std::vector<std::vector<int16_t>> SegyReader::get_gather(const std::string& tracemap_name,
                                                         const std::vector<std::optional<int>>& keys) const {
    std::vector<std::vector<uint8_t>> headers;
    std::vector<std::vector<int16_t>> traces;
    get_gather_and_headers(tracemap_name, keys, headers, traces);
    return traces;
}

void SegyReader::get_gather_and_headers(const std::string& tracemap_name,
                                        const std::vector<std::optional<int>>& keys,
                                        std::vector<std::vector<uint8_t>>& headers,
                                        std::vector<std::vector<int16_t>>& traces) const {
    auto indices = get_tracemap(tracemap_name)->find_trace_indices(keys);
    std::sort(indices.begin(), indices.end());
    read_gather_block(indices, headers, traces);
}

void SegyReader::read_gather_block(const std::vector<int>& indices,
                                   std::vector<std::vector<uint8_t>>& headers,
                                   std::vector<std::vector<int16_t>>& traces) const {
    headers.resize(indices.size());
    traces.resize(indices.size());

    std::vector<uint8_t> buf(trace_bsize_);
    for (size_t i = 0; i < indices.size(); ++i) {
        int idx = indices[i];
        check_index(idx);
        read_exact(trace_offset(idx), buf.data(), buf.size());
        headers[i] = std::vector<uint8_t>(buf.begin(), buf.begin() + segy::TraceHeaderSize);

        std::vector<int16_t> trace(num_samples_);
        for (int j = 0; j < num_samples_; ++j) {
            trace[j] = get_i16_be(buf.data(), segy::TraceHeaderSize + j * 2);
        }
        traces[i] = std::move(trace);
    }
}
