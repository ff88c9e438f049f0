#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <thread>
#include "gpr/SessionController.hpp"
#include "gpr/SampleTransformer.hpp"
#include "sgylib/SegyReader.hpp"
#include "TestUtil.hpp"

namespace {
Frame column_frame(std::size_t n, uint8_t value) {
    Frame f;
    f.column.assign(n, value);
    return f;
}

Frame located_frame(std::size_t n, uint8_t value, double x, double y) {
    Frame f = column_frame(n, value);
    f.position = std::make_pair(x, y);
    return f;
}

SessionOptions options_for(const TempDir& dir) {
    SessionOptions options;
    options.output_dir = dir.path().string();
    options.progress_every = 0;
    return options;
}
}

TEST(SessionControllerTest, WritesOneFileOnShutdown) {
    TempDir dir;
    SessionController session(options_for(dir));
    for (uint8_t v = 0; v < 4; ++v) {
        EXPECT_TRUE(session.process_frame(column_frame(8, static_cast<uint8_t>(v * 60))));
    }
    EXPECT_EQ(session.trace_count(), 4u);

    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded) << result.error;
    EXPECT_EQ(result.traces, 4u);
    EXPECT_EQ(session.state(), SessionController::State::Terminated);

    auto entries = dir.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].rfind("gpr_output_", 0), 0u);
    EXPECT_EQ(entries[0].size(), std::string("gpr_output_YYYYmmdd_HHMMSS.sgy").size());

    SegyReader reader(result.path);
    EXPECT_EQ(reader.num_traces(), 4);
    EXPECT_EQ(reader.num_samples(), 8);
    EXPECT_EQ(reader.get_trace(0)[0], -32768);
    EXPECT_EQ(reader.get_trace(3)[7], transform_sample(180));
}

TEST(SessionControllerTest, SecondShutdownDoesNothing) {
    TempDir dir;
    SessionController session(options_for(dir));
    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));

    FinalizeResult first = session.shutdown();
    ASSERT_TRUE(first.encoded);
    FinalizeResult second = session.shutdown();
    EXPECT_FALSE(second.encoded);
    EXPECT_EQ(second.traces, 0u);
    EXPECT_TRUE(second.path.empty());
    EXPECT_EQ(dir.entries().size(), 1u);
}

TEST(SessionControllerTest, ConcurrentShutdownEncodesOnce) {
    TempDir dir;
    SessionController session(options_for(dir));
    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));

    FinalizeResult a, b;
    std::thread t1([&] { a = session.shutdown(); });
    std::thread t2([&] { b = session.shutdown(); });
    t1.join();
    t2.join();
    EXPECT_NE(a.encoded, b.encoded);
    EXPECT_EQ(dir.entries().size(), 1u);
}

TEST(SessionControllerTest, NoTracesNoFile) {
    TempDir dir;
    LogCapture log;
    SessionController session(options_for(dir));

    FinalizeResult result = session.shutdown();
    EXPECT_FALSE(result.encoded);
    EXPECT_EQ(result.traces, 0u);
    EXPECT_TRUE(result.error.empty());
    EXPECT_TRUE(dir.entries().empty());
    EXPECT_TRUE(log.contains(LogLevel::Warn, "No traces recorded"));
    EXPECT_EQ(session.state(), SessionController::State::Terminated);
}

TEST(SessionControllerTest, MismatchedColumnRejected) {
    TempDir dir;
    LogCapture log;
    SessionController session(options_for(dir));

    EXPECT_TRUE(session.process_frame(column_frame(6, 10)));
    EXPECT_FALSE(session.process_frame(column_frame(5, 10)));
    EXPECT_TRUE(session.process_frame(column_frame(6, 20)));
    EXPECT_EQ(session.trace_count(), 2u);
    EXPECT_EQ(session.session_samples(), 6u);
    EXPECT_TRUE(log.contains(LogLevel::Warn, "Rejecting trace"));

    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded);
    EXPECT_EQ(result.traces, 2u);
}

TEST(SessionControllerTest, BadFramesSkipped) {
    TempDir dir;
    LogCapture log;
    SessionController session(options_for(dir));

    EXPECT_FALSE(session.process_frame(Frame{}));
    EXPECT_FALSE(session.process_frame(located_frame(4, 1, std::nan(""), 0.0)));
    EXPECT_FALSE(session.process_frame(located_frame(4, 1, 0.0, std::numeric_limits<double>::infinity())));
    EXPECT_EQ(log.count(LogLevel::Warn), 3u);
    EXPECT_EQ(session.trace_count(), 0u);
    EXPECT_EQ(session.session_samples(), 0u);

    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));
}

TEST(SessionControllerTest, CoordinatesFromFramesOrProvisional) {
    TempDir dir;
    SessionController session(options_for(dir));
    EXPECT_TRUE(session.process_frame(column_frame(2, 0)));
    EXPECT_TRUE(session.process_frame(located_frame(2, 0, 1234.6, -77.4)));
    EXPECT_TRUE(session.process_frame(column_frame(2, 0)));
    EXPECT_TRUE(session.process_frame(located_frame(2, 0, 100000.0, 0.0)));

    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded);
    SegyReader reader(result.path);
    EXPECT_EQ(reader.get_header_value_i32(0, "CDP_X"), 1);
    EXPECT_EQ(reader.get_header_value_i32(0, "CDP_Y"), 0);
    EXPECT_EQ(reader.get_header_value_i32(1, "CDP_X"), 1235);
    EXPECT_EQ(reader.get_header_value_i32(1, "CDP_Y"), -77);
    EXPECT_EQ(reader.get_header_value_i32(2, "CDP_X"), 3);
    EXPECT_EQ(reader.get_header_value_i32(3, "CDP_X"), 25000);
}

TEST(SessionControllerTest, StagedFramesIngestedBeforeShutdownEncodes) {
    TempDir dir;
    SessionOptions options = options_for(dir);
    options.staging_capacity = 10000;
    SessionController session(options);
    session.start();

    for (int i = 0; i < 500; ++i) {
        ASSERT_TRUE(session.on_frame(column_frame(16, static_cast<uint8_t>(i))));
    }
    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded);
    EXPECT_EQ(result.traces, 500u);
    EXPECT_EQ(session.dropped_frames(), 0u);

    SegyReader reader(result.path);
    ASSERT_EQ(reader.num_traces(), 500);
    for (int i = 0; i < 500; i += 97) {
        EXPECT_EQ(reader.get_trace(i)[0], transform_sample(static_cast<uint8_t>(i)));
    }
}

TEST(SessionControllerTest, FullStagingDropsNewest) {
    TempDir dir;
    LogCapture log;
    SessionOptions options = options_for(dir);
    options.staging_capacity = 3;
    SessionController session(options);
    // No worker yet, so nothing leaves the staging queue

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(session.on_frame(column_frame(4, static_cast<uint8_t>(i))), i < 3);
    }
    EXPECT_EQ(session.dropped_frames(), 2u);
    EXPECT_TRUE(log.contains(LogLevel::Warn, "Staging queue full"));

    session.start();
    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded);
    EXPECT_EQ(result.traces, 3u);

    SegyReader reader(result.path);
    EXPECT_EQ(reader.get_trace(2)[0], transform_sample(2));
}

TEST(SessionControllerTest, FramesAfterShutdownIgnored) {
    TempDir dir;
    SessionController session(options_for(dir));
    session.start();
    EXPECT_FALSE(session.shutdown().encoded);
    EXPECT_FALSE(session.on_frame(column_frame(4, 1)));
    EXPECT_EQ(session.trace_count(), 0u);
}

TEST(SessionControllerTest, NameClashGetsSuffix) {
    TempDir dir;
    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        SessionController session(options_for(dir));
        EXPECT_TRUE(session.process_frame(column_frame(4, 1)));
        FinalizeResult result = session.shutdown();
        ASSERT_TRUE(result.encoded);
        paths.push_back(result.path);
    }
    EXPECT_NE(paths[0], paths[1]);
    EXPECT_NE(paths[1], paths[2]);
    EXPECT_EQ(dir.entries().size(), 3u);
}

TEST(SessionControllerTest, CreatesOutputDirectory) {
    TempDir dir;
    SessionOptions options = options_for(dir);
    options.output_dir = dir.file("nested/out");
    SessionController session(options);
    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));
    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded) << result.error;
    EXPECT_TRUE(std::filesystem::exists(result.path));
}

TEST(SessionControllerTest, EncodeFailureReportedAndTerminates) {
    TempDir dir;
    LogCapture log;
    SessionOptions options = options_for(dir);
    options.encoder.sample_interval_us = 0;
    SessionController session(options);
    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));

    FinalizeResult result = session.shutdown();
    EXPECT_FALSE(result.encoded);
    EXPECT_EQ(result.traces, 1u);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(log.contains(LogLevel::Error, "SEG-Y write failed"));
    EXPECT_EQ(session.state(), SessionController::State::Terminated);
    EXPECT_TRUE(dir.entries().empty());
}

TEST(SessionControllerTest, StagedFramesWrittenWithoutWorker) {
    TempDir dir;
    SessionController session(options_for(dir));
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(session.on_frame(column_frame(4, static_cast<uint8_t>(i))));
    }

    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded) << result.error;
    EXPECT_EQ(result.traces, 3u);

    SegyReader reader(result.path);
    EXPECT_EQ(reader.get_trace(0)[0], transform_sample(0));
    EXPECT_EQ(reader.get_trace(2)[0], transform_sample(2));
}

TEST(SessionControllerTest, ProcessFrameAfterShutdownRefused) {
    TempDir dir;
    SessionController session(options_for(dir));
    EXPECT_TRUE(session.process_frame(column_frame(4, 1)));
    ASSERT_TRUE(session.shutdown().encoded);

    EXPECT_FALSE(session.process_frame(column_frame(4, 2)));
    EXPECT_EQ(session.trace_count(), 0u);
    EXPECT_EQ(dir.entries().size(), 1u);
}

// Frames arrive through the worker and the calling thread at the same time;
// provisional x must still follow the order traces were recorded in
TEST(SessionControllerTest, ProvisionalCoordinatesFollowSequenceAcrossThreads) {
    TempDir dir;
    SessionOptions options = options_for(dir);
    options.staging_capacity = 10000;
    SessionController session(options);
    session.start();

    constexpr int PerPath = 400;
    std::thread feed([&] {
        for (int i = 0; i < PerPath; ++i) {
            EXPECT_TRUE(session.on_frame(column_frame(4, 1)));
        }
    });
    for (int i = 0; i < PerPath; ++i) {
        EXPECT_TRUE(session.process_frame(column_frame(4, 2)));
    }
    feed.join();

    FinalizeResult result = session.shutdown();
    ASSERT_TRUE(result.encoded) << result.error;
    ASSERT_EQ(result.traces, 2u * PerPath);

    SegyReader reader(result.path);
    for (int i = 0; i < reader.num_traces(); ++i) {
        ASSERT_EQ(reader.get_header_value_i32(i, "CDP_X"), i + 1) << "trace " << i;
    }
}
