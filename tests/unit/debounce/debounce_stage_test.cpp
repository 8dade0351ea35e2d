#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "lw/debounce/accumulators.hpp"
#include "lw/debounce/debounce_stage.hpp"

using namespace lw::debounce;
using namespace std::chrono_literals;

namespace {

// Bursts are paced against absolute deadlines so scheduler jitter does not
// accumulate over a run. Spacing stays well inside the quiet interval.
constexpr auto kInterval = 20ms;
constexpr auto kMaxDelay = 200ms;
constexpr auto kSpacing = 13ms;
constexpr int kBurstLength = 30;

template <typename Stage, typename Make>
void feed(Stage& stage, int count, std::chrono::milliseconds spacing, Make make) {
    auto input = stage.input();
    auto next = std::chrono::steady_clock::now();
    for (int i = 0; i < count; ++i) {
        std::this_thread::sleep_until(next);
        ASSERT_TRUE(input.send(make(i)));
        next += spacing;
    }
}

template <typename Stage>
std::vector<typename Stage::OutputType> drain(Stage& stage) {
    std::vector<typename Stage::OutputType> results;
    auto output = stage.output();
    while (auto value = output.receive()) {
        results.push_back(std::move(*value));
    }
    return results;
}

DebounceOptions timing(std::chrono::milliseconds interval, std::chrono::milliseconds maxDelay) {
    DebounceOptions options;
    options.interval = interval;
    options.maxDelay = maxDelay;
    return options;
}

}  // namespace

// ---------------------------------------------------------------------------
// Accumulators
// ---------------------------------------------------------------------------

TEST(AccumulatorTest, SignalRemembersPresenceOnly) {
    SignalAccumulator acc;
    acc.start();
    EXPECT_TRUE(acc.isEmpty());
    acc.add(Pulse{});
    acc.add(Pulse{});
    EXPECT_FALSE(acc.isEmpty());
    EXPECT_EQ(acc.drain(), Pulse{});
    EXPECT_TRUE(acc.isEmpty());
}

TEST(AccumulatorTest, GroupedKeepsArrivalOrder) {
    GroupedAccumulator<std::string> acc;
    acc.start();
    acc.add("a");
    acc.add("b");
    EXPECT_EQ(acc.drain(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(acc.isEmpty());
}

TEST(AccumulatorTest, LastOverwrites) {
    LastAccumulator<int> acc;
    acc.start();
    acc.add(1);
    acc.add(2);
    EXPECT_EQ(acc.drain(), 2);
    EXPECT_TRUE(acc.isEmpty());
}

TEST(AccumulatorTest, CountedCounts) {
    CountedAccumulator acc;
    acc.start();
    for (int i = 0; i < 3; ++i) {
        acc.add(Pulse{});
    }
    EXPECT_EQ(acc.drain(), 3u);
    EXPECT_TRUE(acc.isEmpty());
}

// ---------------------------------------------------------------------------
// Empty input
// ---------------------------------------------------------------------------

TEST(DebounceStageTest, SignalEmptyInputClosesOutput) {
    SignalDebounce stage(timing(kInterval, kMaxDelay));
    stage.input().close();
    EXPECT_TRUE(drain(stage).empty());
}

TEST(DebounceStageTest, GroupedEmptyInputClosesOutput) {
    GroupedDebounce<int> stage(timing(kInterval, kMaxDelay));
    stage.input().close();
    EXPECT_TRUE(drain(stage).empty());
}

TEST(DebounceStageTest, LastEmptyInputClosesOutput) {
    LastDebounce<int> stage(timing(kInterval, kMaxDelay));
    stage.input().close();
    EXPECT_TRUE(drain(stage).empty());
}

TEST(DebounceStageTest, CountedEmptyInputClosesOutput) {
    CountedDebounce stage(timing(kInterval, 0ms));
    stage.input().close();
    EXPECT_TRUE(drain(stage).empty());
}

// ---------------------------------------------------------------------------
// Max delay bounds a continuous burst
// ---------------------------------------------------------------------------

TEST(DebounceStageTest, SignalWithMaxDelayEmitsTwice) {
    SignalDebounce stage(timing(kInterval, kMaxDelay));
    std::thread producer([&stage] {
        feed(stage, kBurstLength, kSpacing, [](int) { return Pulse{}; });
        stage.input().close();
    });

    auto results = drain(stage);
    producer.join();
    EXPECT_EQ(results.size(), 2u);
}

TEST(DebounceStageTest, LastWithMaxDelayEmitsMidBurstAndFinalValue) {
    LastDebounce<int> stage(timing(kInterval, kMaxDelay));
    std::thread producer([&stage] {
        feed(stage, kBurstLength, kSpacing, [](int i) { return i; });
        stage.input().close();
    });

    auto results = drain(stage);
    producer.join();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_GE(results[0], 13);
    EXPECT_LE(results[0], 17);
    EXPECT_EQ(results[1], kBurstLength - 1);
}

TEST(DebounceStageTest, GroupedWithMaxDelaySplitsBurstInOrder) {
    GroupedDebounce<int> stage(timing(kInterval, kMaxDelay));
    std::thread producer([&stage] {
        feed(stage, kBurstLength, kSpacing, [](int i) { return i; });
        stage.input().close();
    });

    auto results = drain(stage);
    producer.join();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].empty());

    std::vector<int> all;
    for (const auto& group : results) {
        all.insert(all.end(), group.begin(), group.end());
    }
    ASSERT_EQ(all.size(), static_cast<std::size_t>(kBurstLength));
    for (int i = 0; i < kBurstLength; ++i) {
        EXPECT_EQ(all[static_cast<std::size_t>(i)], i);
    }
}

TEST(DebounceStageTest, CountedWithMaxDelayCountsEveryInput) {
    CountedDebounce stage(timing(kInterval, kMaxDelay));
    std::thread producer([&stage] {
        feed(stage, kBurstLength, kSpacing, [](int) { return Pulse{}; });
        stage.input().close();
    });

    auto results = drain(stage);
    producer.join();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0] + results[1], static_cast<std::size_t>(kBurstLength));
}

// ---------------------------------------------------------------------------
// Quiet interval separates bursts
// ---------------------------------------------------------------------------

TEST(DebounceStageTest, CountedWithoutMaxDelaySplitsOnPause) {
    CountedDebounce stage(timing(kInterval, 0ms));
    std::thread producer([&stage] {
        feed(stage, 10, 5ms, [](int) { return Pulse{}; });
        std::this_thread::sleep_for(kInterval * 4);
        feed(stage, 10, 5ms, [](int) { return Pulse{}; });
        stage.input().close();
    });

    auto results = drain(stage);
    producer.join();
    EXPECT_EQ(results, (std::vector<std::size_t>{10, 10}));
}

TEST(DebounceStageTest, IntervalFlushHappensBeforeClose) {
    GroupedDebounce<std::string> stage(timing(kInterval, 0ms));
    auto input = stage.input();
    auto output = stage.output();

    ASSERT_TRUE(input.send("a"));
    ASSERT_TRUE(input.send("b"));

    std::optional<std::vector<std::string>> group;
    EXPECT_EQ(output.receiveFor(2s, group), lw::foundation::ReceiveStatus::Value);
    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(*group, (std::vector<std::string>{"a", "b"}));

    input.close();
    EXPECT_EQ(output.receive(), std::nullopt);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST(DebounceStageTest, DestructorDoesNotWaitForAbandonedConsumer) {
    auto start = std::chrono::steady_clock::now();
    {
        auto stage = makeDebounce<CountedAccumulator>(1ms);
        auto input = stage->input();
        // Nobody drains the output; the worker ends up blocked on it.
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(input.send(Pulse{}));
            std::this_thread::sleep_for(10ms);
        }
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(DebounceStageTest, SendAfterCloseFails) {
    auto stage = makeDebounce<SignalAccumulator>(kInterval, kMaxDelay);
    auto input = stage->input();
    input.close();
    EXPECT_FALSE(input.send(Pulse{}));
    EXPECT_TRUE(drain(*stage).empty());
}

TEST(DebounceStageTest, MakeDebounceCarriesTiming) {
    auto stage = makeDebounce<LastAccumulator<int>>(kInterval, kMaxDelay);
    EXPECT_EQ(stage->options().interval, kInterval);
    EXPECT_EQ(stage->options().maxDelay, kMaxDelay);
    EXPECT_EQ(stage->options().outputBuffer, 1u);
}
