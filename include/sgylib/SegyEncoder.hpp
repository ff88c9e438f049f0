#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "sgylib/Trace.hpp"

class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EncoderOptions {
    std::string description = "GPR B-SCAN SESSION";
    int sample_interval_us = 1;
};

// Brings a coordinate into int16 range. In-range values pass unchanged;
// otherwise the value is divided (truncating) by ceil(|value| / 32767),
// which keeps the sign and scales the magnitude down instead of saturating.
int16_t clamp_coordinate(int64_t value);

// Writes one SEG-Y rev 1 file (int16 samples, EBCDIC text header) from a
// drained batch of traces. An encoder is single use: once encode() or
// write_file() has run, further calls throw EncodeError.
class SegyEncoder {
public:
    enum class State { Idle, Encoding, Done, Failed };

    explicit SegyEncoder(EncoderOptions options = {});

    // Validates the whole batch before the first byte goes to `out`.
    void encode(const std::vector<Trace>& traces, std::ostream& out);
    // Writes to `filename`.part and renames it into place once complete.
    // Nothing is left behind on failure.
    void write_file(const std::vector<Trace>& traces, const std::string& filename);

    State state() const { return state_; }
    int num_samples() const { return num_samples_; }
    int num_traces() const { return num_traces_; }
    // Characters of the text header that CP500 could not represent
    std::size_t replaced_chars() const { return replaced_chars_; }

    // 40 card lines, before transcoding
    static std::vector<std::string> text_header_lines(const std::string& description,
                                                      int num_samples, int num_traces,
                                                      int sample_interval_us);

private:
    EncoderOptions options_;
    State state_ = State::Idle;
    int num_samples_ = 0;
    int num_traces_ = 0;
    std::size_t replaced_chars_ = 0;
    std::vector<uint8_t> text_header_;
    std::vector<uint8_t> bin_header_;

    void begin(const std::vector<Trace>& traces);
    [[noreturn]] void fail(const std::string& message);
    void build_text_header();
    void build_bin_header();
    void write_headers(std::ostream& out);
    void write_traces(const std::vector<Trace>& traces, std::ostream& out);
    void pack_trace(const Trace& trace, int index, uint8_t* dst) const;
};
