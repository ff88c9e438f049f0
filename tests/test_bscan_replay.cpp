#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <limits>
#include <stdexcept>
#include "gpr/BscanReplay.hpp"
#include "TestUtil.hpp"

namespace {
// 3 columns x 2 rows:
//   0  10  20
//  30  40 255
std::string write_pgm(const TempDir& dir, const std::string& header = "P5\n# scan\n3 2\n255\n") {
    const std::string path = dir.file("scan.pgm");
    std::ofstream f(path, std::ios::binary);
    f << header;
    const uint8_t pixels[] = {0, 10, 20, 30, 40, 255};
    f.write(reinterpret_cast<const char*>(pixels), sizeof(pixels));
    return path;
}

std::string write_text(const TempDir& dir, const std::string& name, const std::string& text) {
    const std::string path = dir.file(name);
    std::ofstream(path) << text;
    return path;
}
}

TEST(BscanReplayTest, ReadsPgmColumns) {
    TempDir dir;
    BscanImage image = read_pgm(write_pgm(dir));
    EXPECT_EQ(image.width, 3u);
    EXPECT_EQ(image.height, 2u);
    EXPECT_EQ(image.column(0), (std::vector<uint8_t>{0, 30}));
    EXPECT_EQ(image.column(2), (std::vector<uint8_t>{20, 255}));
    EXPECT_THROW(image.column(3), std::out_of_range);
}

TEST(BscanReplayTest, RejectsBadPgm) {
    TempDir dir;
    EXPECT_THROW(read_pgm(write_pgm(dir, "P2\n3 2\n255\n")), std::runtime_error);
    EXPECT_THROW(read_pgm(write_pgm(dir, "P5\n3 2\n65535\n")), std::runtime_error);
    EXPECT_THROW(read_pgm(write_pgm(dir, "P5\n3 x\n255\n")), std::runtime_error);
    EXPECT_THROW(read_pgm(write_pgm(dir, "P5\n4 2\n255\n")), std::runtime_error);
    EXPECT_THROW(read_pgm(dir.file("absent.pgm")), std::runtime_error);
}

TEST(BscanReplayTest, RejectsDimensionsThatOverflow) {
    TempDir dir;
    // 2^63 * 2 wraps to 0, which would leave no pixels behind a huge width
    EXPECT_THROW(read_pgm(write_pgm(dir, "P5\n9223372036854775808 2\n255\n")), std::runtime_error);
    EXPECT_THROW(read_pgm(write_pgm(dir, "P5\n18446744073709551615 2\n255\n")), std::runtime_error);

    BscanImage image;
    image.width = (std::numeric_limits<std::size_t>::max() / 2) + 1;
    image.height = 2;
    EXPECT_THROW({ BscanReplay replay(std::move(image)); }, std::invalid_argument);
}

TEST(BscanReplayTest, PositionTable) {
    TempDir dir;
    LogCapture log;
    PositionTable table = read_position_table(write_text(dir, "pos.txt",
        "column x y\n"
        "# comment\n"
        "0 100.5 200\n"
        "2 -5 7.25\n"
        "garbage line\n"));
    ASSERT_EQ(table.size(), 2u);
    EXPECT_DOUBLE_EQ(table.at(0).first, 100.5);
    EXPECT_DOUBLE_EQ(table.at(2).second, 7.25);
    EXPECT_EQ(log.count(LogLevel::Warn), 1u);
}

TEST(BscanReplayTest, RunDeliversColumnsInOrderWithPositions) {
    TempDir dir;
    PositionTable positions;
    positions[1] = {5.0, 6.0};
    BscanReplay replay(read_pgm(write_pgm(dir)), positions);

    std::vector<Frame> frames;
    std::atomic<bool> stop{false};
    std::size_t n = replay.run([&](Frame f) { frames.push_back(std::move(f)); }, 0.0, stop);

    EXPECT_EQ(n, 3u);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[1].column, (std::vector<uint8_t>{10, 40}));
    EXPECT_FALSE(frames[0].position.has_value());
    ASSERT_TRUE(frames[1].position.has_value());
    EXPECT_DOUBLE_EQ(frames[1].position->first, 5.0);
}

TEST(BscanReplayTest, StopEndsRunEarly) {
    TempDir dir;
    BscanReplay replay(read_pgm(write_pgm(dir)));
    std::atomic<bool> stop{false};
    std::size_t n = replay.run([&](Frame) { stop = true; }, 0.0, stop);
    EXPECT_EQ(n, 1u);
}

TEST(BscanReplayTest, FrameRatePacesDelivery) {
    TempDir dir;
    BscanReplay replay(read_pgm(write_pgm(dir)));
    std::atomic<bool> stop{false};
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(replay.run([](Frame) {}, 50.0, stop), 3u);
    auto elapsed = std::chrono::steady_clock::now() - start;
    // Three frames at 50 Hz: the third one is due 40 ms after the first
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 35);
}
