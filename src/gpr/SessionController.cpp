#include "gpr/SessionController.hpp"
#include "gpr/Errors.hpp"
#include "gpr/SampleTransformer.hpp"
#include "Logger.hpp"
#include "util.hpp"
#include <cmath>
#include <filesystem>

namespace {
    // Largest magnitude that still rounds into int64
    constexpr double MaxCoordinate = 9.2e18;
}

SessionController::SessionController(SessionOptions options)
    : options_(std::move(options)),
      staging_(options_.staging_capacity)
{
}

SessionController::~SessionController() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (finalized_) return;
    staging_.close();
    if (worker_.joinable()) worker_.join();
    if (buffer_.count() > 0) {
        log_warn("Session discarded without shutdown: " + std::to_string(buffer_.count()) + " trace(s) not written");
    }
}

void SessionController::start() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (finalized_ || worker_.joinable()) return;
    worker_ = std::thread(&SessionController::ingest_loop, this);
}

bool SessionController::on_frame(Frame frame) {
    if (state_.load() != State::Running) {
        log_debug("Frame ignored, session is shutting down");
        return false;
    }
    if (!staging_.try_push(std::move(frame))) {
        uint64_t dropped = staging_.dropped();
        if (dropped == 1 || dropped % 100 == 0) {
            log_warn("Staging queue full (" + std::to_string(staging_.capacity()) + "), dropped " +
                     std::to_string(dropped) + " frame(s) so far");
        }
        return false;
    }
    return true;
}

void SessionController::ingest_loop() {
    Frame frame;
    while (staging_.pop(frame)) {
        std::lock_guard<std::mutex> lock(intake_mutex_);
        ingest(frame);
    }
}

Trace SessionController::make_trace(const Frame& frame) const {
    if (frame.column.empty()) {
        throw TransformError("frame has no samples");
    }
    Trace trace;
    if (frame.position) {
        const auto [x, y] = *frame.position;
        if (!std::isfinite(x) || !std::isfinite(y) || std::fabs(x) > MaxCoordinate || std::fabs(y) > MaxCoordinate) {
            throw TransformError("unusable coordinate (" + std::to_string(x) + ", " + std::to_string(y) + ")");
        }
        trace.x_coordinate = std::llround(x);
        trace.y_coordinate = std::llround(y);
    }
    trace.samples = transform_column(frame.column);
    return trace;
}

bool SessionController::process_frame(const Frame& frame) {
    std::lock_guard<std::mutex> lock(intake_mutex_);
    if (state_.load() != State::Running) {
        log_debug("Frame refused, session is shutting down");
        return false;
    }
    return ingest(frame);
}

bool SessionController::ingest(const Frame& frame) {
    try {
        Trace trace = make_trace(frame);

        const std::size_t n = trace.samples.size();
        std::size_t expected = 0;
        if (!session_samples_.compare_exchange_strong(expected, n) && expected != n) {
            throw BufferInvariantViolation("trace has " + std::to_string(n) + " samples, session uses " +
                                           std::to_string(expected));
        }

        // Same lock as the append below, so column equals the sequence index
        const uint64_t column = ++columns_;
        if (!frame.position) {
            trace.x_coordinate = static_cast<int64_t>(column);
            trace.y_coordinate = 0;
        }

        const uint64_t seq = buffer_.append(std::move(trace));
        if (options_.progress_every > 0 && seq % options_.progress_every == 0) {
            log_info("Recorded " + std::to_string(seq) + " traces");
        }
        return true;
    } catch (const TransformError& e) {
        log_warn(std::string("Skipping frame: ") + e.what());
    } catch (const BufferInvariantViolation& e) {
        log_warn(std::string("Rejecting trace: ") + e.what());
    }
    return false;
}

FinalizeResult SessionController::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    FinalizeResult result;
    if (finalized_) {
        log_debug("Shutdown already done");
        return result;
    }
    finalized_ = true;
    state_ = State::ShuttingDown;

    // Frames accepted into staging still belong to the session
    staging_.close();
    if (worker_.joinable()) worker_.join();
    Frame frame;
    while (staging_.pop(frame)) {
        std::lock_guard<std::mutex> lock(intake_mutex_);
        ingest(frame);
    }
    if (staging_.dropped() > 0) {
        log_warn("Dropped " + std::to_string(staging_.dropped()) + " frame(s) while staging was full");
    }

    std::vector<Trace> traces;
    {
        // A process_frame() that passed its state check has finished appending
        std::lock_guard<std::mutex> lock(intake_mutex_);
        traces = buffer_.drain();
    }
    result.traces = traces.size();

    if (traces.empty()) {
        log_warn("No traces recorded, SEG-Y file not written");
    } else {
        try {
            std::filesystem::create_directories(options_.output_dir);
            result.path = next_output_path();
            SegyEncoder encoder(options_.encoder);
            encoder.write_file(traces, result.path);
            result.encoded = true;
            log_info("Wrote " + std::to_string(traces.size()) + " traces x " +
                     std::to_string(encoder.num_samples()) + " samples to " + result.path);
        } catch (const EncodeError& e) {
            result.error = e.what();
        } catch (const std::filesystem::filesystem_error& e) {
            result.error = e.what();
        }
        if (!result.encoded) {
            log_error("SEG-Y write failed, " + std::to_string(traces.size()) + " trace(s) lost: " + result.error);
        }
    }

    state_ = State::Terminated;
    return result;
}

std::string SessionController::next_output_path() const {
    namespace fs = std::filesystem;
    const std::string stem = "gpr_output_" + utc_timestamp();
    fs::path path = fs::path(options_.output_dir) / (stem + ".sgy");
    for (int n = 1; fs::exists(path) || fs::exists(path.string() + ".part"); ++n) {
        path = fs::path(options_.output_dir) / (stem + "_" + std::to_string(n) + ".sgy");
    }
    return path.string();
}
