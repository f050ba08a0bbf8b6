#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "retention.hpp"

using namespace std::chrono;

class RetentionTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<HistogramStore>(1000);
        retention = std::make_unique<RetentionManager>(*store, hours(24), hours(1));
    }

    void TearDown() override {
        retention.reset();
    }

    std::unique_ptr<HistogramStore> store;
    std::unique_ptr<RetentionManager> retention;
};

TEST_F(RetentionTest, ConfiguredValues) {
    EXPECT_EQ(retention->window(), hours(24));
    EXPECT_EQ(retention->interval(), hours(1));
    retention->start(milliseconds(250));
    EXPECT_EQ(retention->interval(), milliseconds(250));
    retention->stop();
}

TEST_F(RetentionTest, NothingOlderThanWindowSurvives) {
    auto now = WallClock::now();
    auto key = MetricKey::make("latency");
    store->record(key, Sample{1.0, now - hours(48), {}});
    store->record(key, Sample{2.0, now - hours(25), {}});
    store->record(key, Sample{3.0, now - hours(23), {}});
    store->record(key, Sample{4.0, now, {}});

    auto r = retention->sweep(now);
    EXPECT_EQ(r.samples_removed, 2u);
    for (const auto& s : store->samples(key)) {
        EXPECT_GE(s.timestamp, now - hours(24));
    }
    EXPECT_EQ(store->values(key), (std::vector<double>{3.0, 4.0}));
}

TEST_F(RetentionTest, CutoffIsInclusive) {
    auto now = WallClock::now();
    auto key = MetricKey::make("latency");
    store->record(key, Sample{1.0, now - hours(24), {}});
    store->record(key, Sample{2.0, now - hours(24) - milliseconds(1), {}});

    retention->sweep(now);
    EXPECT_EQ(store->values(key), (std::vector<double>{1.0}));
}

TEST_F(RetentionTest, SweepIfDueHonorsInterval) {
    auto now = WallClock::now();
    auto key = MetricKey::make("latency");
    store->record(key, Sample{1.0, now - hours(30), {}});

    // Construction counts as the last sweep
    EXPECT_FALSE(retention->sweep_if_due(now + minutes(30)));
    EXPECT_EQ(store->values(key).size(), 1u);

    EXPECT_TRUE(retention->sweep_if_due(now + hours(1) + seconds(1)));
    EXPECT_TRUE(store->values(key).empty());
    EXPECT_EQ(retention->last_sweep(), now + hours(1) + seconds(1));

    // Not due again right after
    EXPECT_FALSE(retention->sweep_if_due(now + hours(1) + seconds(2)));
}

TEST_F(RetentionTest, StartStopIsIdempotent) {
    EXPECT_FALSE(retention->running());
    retention->start(milliseconds(10));
    retention->start(milliseconds(10));
    EXPECT_TRUE(retention->running());
    retention->stop();
    EXPECT_FALSE(retention->running());
    retention->stop();
    EXPECT_FALSE(retention->running());

    // Can be restarted after a stop
    retention->start(milliseconds(10));
    EXPECT_TRUE(retention->running());
    retention->stop();
}

TEST_F(RetentionTest, StopDoesNotWaitForFullInterval) {
    retention->start(hours(1));
    auto t0 = steady_clock::now();
    retention->stop();
    EXPECT_LT(steady_clock::now() - t0, seconds(5));
}

TEST_F(RetentionTest, BackgroundLoopTrimsStaleSamples) {
    auto short_lived = std::make_unique<RetentionManager>(*store, milliseconds(200),
                                                          milliseconds(10));
    auto key = MetricKey::make("latency");
    store->record(key, Sample{1.0, WallClock::now() - hours(1), {}});
    store->record(key, Sample{2.0, WallClock::now() + hours(1), {}});

    short_lived->start();
    auto deadline = steady_clock::now() + seconds(5);
    while (store->values(key).size() != 1u && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    short_lived->stop();

    EXPECT_EQ(store->values(key), (std::vector<double>{2.0}));
}

TEST_F(RetentionTest, SweepConcurrentWithRecords) {
    const int num_threads = 4;
    const int values_per_thread = 1000;  // stays under the cap
    std::atomic<bool> done{false};

    std::thread sweeper([this, &done]() {
        while (!done) {
            retention->sweep(WallClock::now());
        }
    });

    std::vector<std::thread> producers;
    for (int t = 0; t < num_threads; ++t) {
        producers.emplace_back([this, t, values_per_thread]() {
            auto key = MetricKey::make("op", {{"t", std::to_string(t)}});
            for (int i = 0; i < values_per_thread; ++i) {
                // Stale and fresh samples interleaved
                auto ts = (i % 2 == 0) ? WallClock::now() - hours(48) : WallClock::now();
                store->record(key, Sample{static_cast<double>(i), ts, {}});
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    done = true;
    sweeper.join();

    auto now = WallClock::now();
    retention->sweep(now);
    for (int t = 0; t < num_threads; ++t) {
        auto key = MetricKey::make("op", {{"t", std::to_string(t)}});
        auto samples = store->samples(key);
        EXPECT_EQ(samples.size(), static_cast<size_t>(values_per_thread / 2));
        for (const auto& s : samples) {
            EXPECT_GE(s.timestamp, now - hours(24));
        }
    }
}
