#include "sgylib/SegyEncoder.hpp"
#include "sgylib/SegyUtil.hpp"
#include "sgylib/BinFieldMap.hpp"
#include "sgylib/TraceFieldMap.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <omp.h>

namespace {
    // Trace records are packed in parallel one block at a time, then written
    constexpr int TracesPerBlock = 1024;
    constexpr int64_t CoordinateLimit = std::numeric_limits<int16_t>::max();

    // Removes the .part file on scope exit unless the write completed
    class PartFileGuard {
    public:
        explicit PartFileGuard(std::string path) : path_(std::move(path)) {}
        ~PartFileGuard() {
            if (released_) return;
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            if (ec) log_warn("Could not remove partial file " + path_ + ": " + ec.message());
        }
        PartFileGuard(const PartFileGuard&) = delete;
        PartFileGuard& operator=(const PartFileGuard&) = delete;

        void release() { released_ = true; }

    private:
        std::string path_;
        bool released_ = false;
    };
}

int16_t clamp_coordinate(int64_t value) {
    if (value >= std::numeric_limits<int16_t>::min() && value <= CoordinateLimit) {
        return static_cast<int16_t>(value);
    }
    uint64_t magnitude = value < 0 ? 0 - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
    uint64_t divisor = (magnitude + CoordinateLimit - 1) / CoordinateLimit;
    return static_cast<int16_t>(value / static_cast<int64_t>(divisor));
}

SegyEncoder::SegyEncoder(EncoderOptions options)
    : options_(std::move(options))
{
}

std::vector<std::string> SegyEncoder::text_header_lines(const std::string& description,
                                                        int num_samples, int num_traces,
                                                        int sample_interval_us) {
    // Control characters would break the 80-column card layout
    std::string desc = description;
    std::replace_if(desc.begin(), desc.end(),
                    [](char c) { return static_cast<unsigned char>(c) < 0x20; }, ' ');

    std::vector<std::string> content(segy::TextLineCount);
    content[0] = "SEG-Y REV1 GROUND PENETRATING RADAR B-SCAN";
    content[1] = desc;
    content[2] = "SAMPLES PER TRACE: " + std::to_string(num_samples);
    content[3] = "NUMBER OF TRACES: " + std::to_string(num_traces);
    content[4] = "SAMPLE INTERVAL: " + std::to_string(sample_interval_us) + " US";
    content[5] = "DATA SAMPLE FORMAT: 3 (2-BYTE INTEGER)";
    content[6] = "CDP_X/CDP_Y: POSITION REDUCED TO 16-BIT RANGE";
    content[38] = "SEG Y REV1";
    content[39] = "END TEXTUAL HEADER";

    std::vector<std::string> lines;
    lines.reserve(segy::TextLineCount);
    for (int i = 0; i < segy::TextLineCount; ++i) {
        char card[8];
        std::snprintf(card, sizeof(card), "C%02d ", i + 1);
        lines.push_back(card + content[i]);
    }
    return lines;
}

void SegyEncoder::encode(const std::vector<Trace>& traces, std::ostream& out) {
    begin(traces);
    write_headers(out);
    write_traces(traces, out);
    state_ = State::Done;
}

void SegyEncoder::write_file(const std::vector<Trace>& traces, const std::string& filename) {
    begin(traces);

    const std::string part = filename + ".part";
    // Declared before the stream so the file is closed when it is removed
    PartFileGuard guard(part);
    std::ofstream file(part, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file) fail("Failed to open file for writing: " + part);

    try {
        write_headers(file);
        write_traces(traces, file);
        file.close();
        if (file.fail()) fail("Failed to flush " + part);

        std::error_code ec;
        std::filesystem::rename(part, filename, ec);
        if (ec) fail("Failed to move " + part + " to " + filename + ": " + ec.message());
    } catch (const EncodeError&) {
        throw;
    } catch (const std::exception& e) {
        fail("Writing " + part + " failed: " + e.what());
    }
    guard.release();
    state_ = State::Done;
}

void SegyEncoder::begin(const std::vector<Trace>& traces) {
    if (state_ != State::Idle) throw EncodeError("SEG-Y encoder already used");

    if (traces.empty()) fail("No traces to encode");
    if (options_.sample_interval_us <= 0 || options_.sample_interval_us > std::numeric_limits<int16_t>::max()) {
        fail("Sample interval must be 1.." + std::to_string(std::numeric_limits<int16_t>::max()) +
             " us, got " + std::to_string(options_.sample_interval_us));
    }
    if (traces.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        fail("Too many traces for one SEG-Y file: " + std::to_string(traces.size()));
    }

    const std::size_t n = traces.front().samples.size();
    if (n == 0 || n > static_cast<std::size_t>(std::numeric_limits<int16_t>::max())) {
        fail("Samples per trace must be 1.." + std::to_string(std::numeric_limits<int16_t>::max()) +
             ", got " + std::to_string(n));
    }
    for (std::size_t i = 1; i < traces.size(); ++i) {
        if (traces[i].samples.size() != n) {
            fail("Trace " + std::to_string(i + 1) + " has " + std::to_string(traces[i].samples.size()) +
                 " samples, expected " + std::to_string(n));
        }
    }

    num_samples_ = static_cast<int>(n);
    num_traces_ = static_cast<int>(traces.size());
    state_ = State::Encoding;

    build_text_header();
    build_bin_header();
    if (replaced_chars_ > 0) {
        log_warn("Text header: " + std::to_string(replaced_chars_) +
                 " character(s) not representable in EBCDIC were replaced with '?'");
    }
}

void SegyEncoder::fail(const std::string& message) {
    state_ = State::Failed;
    throw EncodeError(message);
}

void SegyEncoder::build_text_header() {
    text_header_.clear();
    text_header_.reserve(segy::TextHeaderSize);
    auto lines = text_header_lines(options_.description, num_samples_, num_traces_, options_.sample_interval_us);
    for (const auto& line : lines) {
        auto ebcdic = utf8_to_ebcdic(line, &replaced_chars_);
        ebcdic.resize(segy::TextLineWidth, segy::EbcdicSpace);
        text_header_.insert(text_header_.end(), ebcdic.begin(), ebcdic.end());
    }
}

void SegyEncoder::build_bin_header() {
    bin_header_.assign(segy::BinHeaderSize, 0);
    uint8_t* h = bin_header_.data();
    set_bin_field_value(h, "JobID", 1);
    set_bin_field_value(h, "LineNumber", 1);
    set_bin_field_value(h, "ReelNumber", 1);
    // Ensemble geometry stays zero: long sessions overflow these int16 fields
    set_bin_field_value(h, "DataTracesPerEnsemble", 0);
    set_bin_field_value(h, "AuxTracesPerEnsemble", 0);
    set_bin_field_value(h, "EnsembleFold", 0);
    set_bin_field_value(h, "SampleInterval", options_.sample_interval_us);
    set_bin_field_value(h, "SampleIntervalOriginal", options_.sample_interval_us);
    set_bin_field_value(h, "SamplesPerTrace", num_samples_);
    set_bin_field_value(h, "SamplesPerTraceOriginal", num_samples_);
    set_bin_field_value(h, "DataSampleFormat", segy::FormatInt16);
    set_bin_field_value(h, "MeasurementSystem", 1);
    set_bin_field_value(h, "SEGYRevision", segy::Revision1);
    set_bin_field_value(h, "FixedLengthTraceFlag", 1);
    set_bin_field_value(h, "ExtendedTextHeaders", 0);
}

void SegyEncoder::write_headers(std::ostream& out) {
    out.write(reinterpret_cast<const char*>(text_header_.data()), text_header_.size());
    out.write(reinterpret_cast<const char*>(bin_header_.data()), bin_header_.size());
    if (!out) fail("Write error in file headers");
}

void SegyEncoder::write_traces(const std::vector<Trace>& traces, std::ostream& out) {
    const std::size_t record_size = segy::TraceHeaderSize + 2 * static_cast<std::size_t>(num_samples_);
    std::vector<uint8_t> block;

    for (int first = 0; first < num_traces_; first += TracesPerBlock) {
        const int count = std::min(TracesPerBlock, num_traces_ - first);
        block.assign(static_cast<std::size_t>(count) * record_size, 0);

        #pragma omp parallel for schedule(static)
        for (int k = 0; k < count; ++k) {
            pack_trace(traces[first + k], first + k, block.data() + static_cast<std::size_t>(k) * record_size);
        }

        out.write(reinterpret_cast<const char*>(block.data()), block.size());
        if (!out) fail("Write error at trace " + std::to_string(first + 1));
        log_debug("SEG-Y: wrote traces " + std::to_string(first + 1) + ".." + std::to_string(first + count));
    }
}

void SegyEncoder::pack_trace(const Trace& trace, int index, uint8_t* dst) const {
    const int32_t number = index + 1;
    set_trace_field_value(dst, "TraceSequenceLine", number);
    set_trace_field_value(dst, "TraceSequenceFile", number);
    set_trace_field_value(dst, "FieldRecord", 1);
    set_trace_field_value(dst, "TraceNumber", number);
    set_trace_field_value(dst, "TraceIdentificationCode", 1);
    set_trace_field_value(dst, "SourceGroupScalar", 1);
    set_trace_field_value(dst, "CoordinateUnits", 1);
    set_trace_field_value(dst, "TraceSamples", num_samples_);
    set_trace_field_value(dst, "TraceSampleInterval", options_.sample_interval_us);
    set_trace_field_value(dst, "CDP_X", clamp_coordinate(trace.x_coordinate));
    set_trace_field_value(dst, "CDP_Y", clamp_coordinate(trace.y_coordinate));

    uint8_t* data = dst + segy::TraceHeaderSize;
    for (int j = 0; j < num_samples_; ++j) {
        set_i16_be(data, 2 * j, trace.samples[j]);
    }
}
