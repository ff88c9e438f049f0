#include "gpr/BscanReplay.hpp"
#include "gpr/SessionController.hpp"
#include "sgylib/SegyReader.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <signal.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_stop_requested{false};
    static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");

    void on_terminate_signal(int) {
        g_stop_requested.store(true);
    }

    void install_signal_handlers() {
        struct sigaction sa{};
        sa.sa_handler = on_terminate_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        if (sigaction(SIGINT, &sa, nullptr) != 0 || sigaction(SIGTERM, &sa, nullptr) != 0) {
            throw std::runtime_error("Cannot install SIGINT/SIGTERM handlers");
        }
    }

    void replay_into(SessionController& session, const Config& cfg) {
        BscanImage image = read_pgm(cfg.input_bscan);
        PositionTable positions;
        if (!cfg.positions_file.empty()) {
            positions = read_position_table(cfg.positions_file);
            log_info("Positions: " + std::to_string(positions.size()) + " column(s) from " + cfg.positions_file);
        }
        BscanReplay replay(std::move(image), std::move(positions));
        // Refused frames are counted and logged by the session
        std::size_t delivered = replay.run(
            [&session](Frame frame) { session.on_frame(std::move(frame)); },
            cfg.frame_rate_hz, g_stop_requested);
        if (g_stop_requested.load()) {
            log_info("Stop requested after " + std::to_string(delivered) + " of " +
                     std::to_string(replay.num_frames()) + " frames");
        } else {
            log_info("Replay finished: " + std::to_string(delivered) + " frames");
        }
    }

    void index_output(const std::string& path) {
        const std::string db_path = path + ".cdp.sqlite";
        log_info("Building trace index " + db_path);
        SegyReader reader(path);
        reader.build_tracemap("cdp_map", db_path, {"CDP_X", "CDP_Y"});
    }
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    if (argc < 2) {
        std::cerr << "Error: Configuration file path not provided.\nUsage: " << argv[0] << " <path_to_config>\n";
        return 1;
    }

    Config cfg;
    try {
        cfg = load_config(argv[1]);
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }

    std::cout << "Output dir: " << cfg.output_dir << std::endl;
    if (!cfg.input_bscan.empty()) {
        std::cout << "B-scan:     " << cfg.input_bscan << std::endl;
    }

    try {
        install_signal_handlers();
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }

    SessionOptions options;
    options.output_dir = cfg.output_dir;
    options.encoder.description = cfg.description;
    options.encoder.sample_interval_us = cfg.sample_interval_us;
    options.progress_every = cfg.progress_every;
    options.staging_capacity = cfg.staging_capacity;

    SessionController session(options);
    session.start();

    int exit_code = 0;
    try {
        if (cfg.input_bscan.empty()) {
            log_info("No replay source configured, recording until SIGINT/SIGTERM");
            while (!g_stop_requested.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        } else {
            replay_into(session, cfg);
        }
    } catch (const std::exception& e) {
        // Whatever was recorded before the source failed is still written
        log_error(std::string("Frame source failed: ") + e.what());
        exit_code = 2;
    }

    FinalizeResult result = session.shutdown();
    if (!result.encoded && result.traces > 0) {
        exit_code = 3;
    }

    if (result.encoded && cfg.index_traces) {
        try {
            index_output(result.path);
        } catch (const std::exception& e) {
            log_error(std::string("Trace index failed: ") + e.what());
            exit_code = 4;
        }
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
    std::cout << "Session finished: " << result.traces << " trace(s)";
    if (result.encoded) std::cout << " written to " << result.path;
    std::cout << "\nTotal session time: " << std::fixed << std::setprecision(2) << elapsed.count() << " seconds.\n";

    return exit_code;
}
