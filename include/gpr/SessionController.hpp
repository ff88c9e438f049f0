#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "gpr/Frame.hpp"
#include "gpr/FrameQueue.hpp"
#include "gpr/TraceBuffer.hpp"
#include "sgylib/SegyEncoder.hpp"

struct SessionOptions {
    std::string output_dir = ".";
    EncoderOptions encoder;
    // Progress line every N traces, 0 disables it
    std::size_t progress_every = 100;
    std::size_t staging_capacity = 1024;
};

struct FinalizeResult {
    bool encoded = false;
    std::size_t traces = 0;
    std::string path;
    std::string error;
};

// Owns one recording session: frames in, one SEG-Y file out at shutdown.
class SessionController {
public:
    enum class State { Running, ShuttingDown, Terminated };

    explicit SessionController(SessionOptions options);
    // Stops the worker. Does not write anything: shutdown() must be called
    // to keep the session.
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Starts the worker that ingests staged frames
    void start();

    // Sensor feed entry point, never blocks. Returns false if the frame was
    // dropped (staging full, or the session is no longer running).
    bool on_frame(Frame frame);

    // Validates, transforms and buffers one frame on the calling thread.
    // Returns false if the frame was skipped (the reason is logged) or the
    // session is no longer running.
    bool process_frame(const Frame& frame);

    // The first call ingests what is still staged, drains the buffer and
    // writes gpr_output_<UTC>.sgy when there is anything to write. Every
    // later call returns an empty result without touching the file system.
    FinalizeResult shutdown();

    State state() const { return state_.load(); }
    std::size_t trace_count() const { return buffer_.count(); }
    uint64_t dropped_frames() const { return staging_.dropped(); }
    // Samples per trace fixed by the first accepted frame, 0 before that
    std::size_t session_samples() const { return session_samples_.load(); }

private:
    SessionOptions options_;
    TraceBuffer buffer_;
    FrameQueue staging_;
    std::thread worker_;
    std::atomic<State> state_{State::Running};
    std::mutex shutdown_mutex_;
    bool finalized_ = false;
    // Serializes ingestion with the final drain; taken after shutdown_mutex_
    std::mutex intake_mutex_;
    std::atomic<std::size_t> session_samples_{0};
    uint64_t columns_ = 0;

    void ingest_loop();
    // Caller holds intake_mutex_
    bool ingest(const Frame& frame);
    Trace make_trace(const Frame& frame) const;
    std::string next_output_path() const;
};
