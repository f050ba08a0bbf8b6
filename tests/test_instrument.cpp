#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "instrument.hpp"

using namespace std::chrono;

namespace {

struct LookupError : std::runtime_error {
    explicit LookupError(int c) : std::runtime_error("lookup failed"), code(c) {}
    int code;
};

}  // namespace

class InstrumentTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<MetricsEngine>();
    }

    std::unique_ptr<MetricsEngine> engine;
};

TEST_F(InstrumentTest, SuccessRecordsTimingOnly) {
    int result = instrument(*engine, "op", [] { return 42; });
    EXPECT_EQ(result, 42);

    auto s = engine->summarize("op_processing_time");
    EXPECT_EQ(s.count, 1u);
    EXPECT_GE(*s.min, 0.0);
    EXPECT_FALSE(engine->get_counter("op_error_total").has_value());
}

TEST_F(InstrumentTest, FailureRecordsTimingAndErrorThenRethrows) {
    try {
        instrument(*engine, "op", [] {
            std::this_thread::sleep_for(milliseconds(12));
            throw LookupError(7);
        });
        FAIL() << "exception was swallowed";
    } catch (const LookupError& e) {
        // Same type, same payload
        EXPECT_EQ(e.code, 7);
        EXPECT_STREQ(e.what(), "lookup failed");
    }

    auto s = engine->summarize("op_processing_time");
    ASSERT_EQ(s.count, 1u);
    EXPECT_GE(*s.max, 0.012);
    EXPECT_LT(*s.max, 1.0);
    ASSERT_TRUE(engine->get_counter("op_error_total").has_value());
    EXPECT_EQ(*engine->get_counter("op_error_total"), 1u);
}

TEST_F(InstrumentTest, VoidOperation) {
    bool ran = false;
    instrument(*engine, "void_op", [&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_EQ(engine->summarize("void_op_processing_time").count, 1u);
}

TEST_F(InstrumentTest, ReferenceResultPassedThrough) {
    std::string stored = "value";
    std::string& ref = instrument(*engine, "ref_op", [&]() -> std::string& { return stored; });
    EXPECT_EQ(&ref, &stored);
}

TEST_F(InstrumentTest, LabelsApplyToBothSeries) {
    const Labels labels{{"map_id", "m7"}};
    EXPECT_THROW(instrument(*engine, "map_load", labels, []() -> int { throw std::runtime_error("x"); }),
                 std::runtime_error);
    EXPECT_EQ(engine->summarize("map_load_processing_time", labels).count, 1u);
    EXPECT_EQ(*engine->get_counter("map_load_error_total", labels), 1u);
    EXPECT_FALSE(engine->get_counter("map_load_error_total").has_value());
}

TEST_F(InstrumentTest, ScopedTimerMarkFailed) {
    {
        ScopedTimer timer(*engine, "returns_code");
        timer.mark_failed();
    }
    EXPECT_EQ(*engine->get_counter("returns_code_error_total"), 1u);
    EXPECT_EQ(engine->summarize("returns_code_processing_time").count, 1u);
}

TEST_F(InstrumentTest, TimerDuringUnwindingIsNotAFailure) {
    // A timer created inside a destructor while another exception unwinds
    struct TimedCleanup {
        MetricsEngine& engine;
        ~TimedCleanup() { ScopedTimer timer(engine, "cleanup"); }
    };
    try {
        TimedCleanup cleanup{*engine};
        throw std::runtime_error("outer");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(engine->get_counter("cleanup_error_total").has_value());
    EXPECT_EQ(engine->summarize("cleanup_processing_time").count, 1u);
}

TEST_F(InstrumentTest, InvalidNameDoesNotMaskOperationResult) {
    // "bad name" cannot become a metric; recording fails quietly, the result still arrives
    int result = 0;
    EXPECT_NO_THROW(result = instrument(*engine, "bad name", [] { return 5; }));
    EXPECT_EQ(result, 5);

    EXPECT_THROW(instrument(*engine, "bad name", []() -> int { throw std::logic_error("boom"); }),
                 std::logic_error);
}
