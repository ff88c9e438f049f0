#include <gtest/gtest.h>
#include <chrono>
#include <iterator>
#include <random>
#include <set>
#include <thread>
#include "gpr/TraceBuffer.hpp"
#include "TestUtil.hpp"

TEST(TraceBufferTest, DrainReturnsAppendOrder) {
    TraceBuffer buffer;
    for (int16_t i = 0; i < 5; ++i) {
        EXPECT_EQ(buffer.append(make_test_trace({i, i})), static_cast<uint64_t>(i + 1));
    }
    EXPECT_EQ(buffer.count(), 5u);

    auto traces = buffer.drain();
    ASSERT_EQ(traces.size(), 5u);
    for (std::size_t i = 0; i < traces.size(); ++i) {
        EXPECT_EQ(traces[i].sequence_index, i + 1);
        EXPECT_EQ(traces[i].samples[0], static_cast<int16_t>(i));
    }
    EXPECT_EQ(buffer.count(), 0u);
}

TEST(TraceBufferTest, EmptyDrain) {
    TraceBuffer buffer;
    EXPECT_TRUE(buffer.drain().empty());
    EXPECT_EQ(buffer.count(), 0u);
    EXPECT_TRUE(buffer.drain().empty());
}

TEST(TraceBufferTest, SequenceContinuesAfterDrain) {
    TraceBuffer buffer;
    buffer.append(make_test_trace({1}));
    buffer.append(make_test_trace({2}));
    ASSERT_EQ(buffer.drain().size(), 2u);

    EXPECT_EQ(buffer.append(make_test_trace({3})), 3u);
    EXPECT_EQ(buffer.count(), 1u);
    EXPECT_EQ(buffer.total_appended(), 3u);
}

// Producer appends while a consumer drains at random points. Every trace
// must come out exactly once, and in sequence order across all drains.
TEST(TraceBufferTest, ConcurrentAppendAndDrainLoseNothing) {
    constexpr int Total = 20000;
    TraceBuffer buffer;
    std::atomic<bool> done{false};

    std::thread producer([&] {
        for (int i = 0; i < Total; ++i) {
            buffer.append(make_test_trace({static_cast<int16_t>(i % 1000)}));
        }
        done = true;
    });

    std::vector<Trace> collected;
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> pause_us(0, 50);
    while (!done.load()) {
        auto batch = buffer.drain();
        collected.insert(collected.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
        std::this_thread::sleep_for(std::chrono::microseconds(pause_us(rng)));
    }
    producer.join();
    auto rest = buffer.drain();
    collected.insert(collected.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));

    ASSERT_EQ(collected.size(), static_cast<std::size_t>(Total));
    for (std::size_t i = 0; i < collected.size(); ++i) {
        ASSERT_EQ(collected[i].sequence_index, i + 1);
        ASSERT_EQ(collected[i].samples[0], static_cast<int16_t>(i % 1000));
    }
    EXPECT_EQ(buffer.total_appended(), static_cast<uint64_t>(Total));
}

// Several producers append while a consumer drains. Sequence indices stay
// unique and ascending, and each producer's traces keep their own order.
TEST(TraceBufferTest, ManyProducersWithConcurrentDrain) {
    constexpr int Producers = 4;
    constexpr int PerProducer = 5000;
    TraceBuffer buffer;
    std::atomic<int> running{Producers};

    std::vector<std::thread> producers;
    for (int p = 0; p < Producers; ++p) {
        producers.emplace_back([&buffer, &running, p] {
            for (int i = 0; i < PerProducer; ++i) {
                buffer.append(make_test_trace({static_cast<int16_t>(p), static_cast<int16_t>(i)}));
            }
            --running;
        });
    }

    std::vector<Trace> collected;
    while (running.load() > 0) {
        auto batch = buffer.drain();
        collected.insert(collected.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
        std::this_thread::yield();
    }
    for (auto& t : producers) t.join();
    auto rest = buffer.drain();
    collected.insert(collected.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));

    ASSERT_EQ(collected.size(), static_cast<std::size_t>(Producers * PerProducer));
    std::set<uint64_t> seen;
    std::vector<int> next(Producers, 0);
    for (std::size_t i = 0; i < collected.size(); ++i) {
        ASSERT_EQ(collected[i].sequence_index, i + 1);
        ASSERT_TRUE(seen.insert(collected[i].sequence_index).second);
        const int p = collected[i].samples[0];
        ASSERT_GE(p, 0);
        ASSERT_LT(p, Producers);
        ASSERT_EQ(collected[i].samples[1], next[p]) << "producer " << p;
        ++next[p];
    }
    EXPECT_EQ(buffer.total_appended(), static_cast<uint64_t>(Producers * PerProducer));
    EXPECT_EQ(buffer.count(), 0u);
}
