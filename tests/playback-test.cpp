#include <random>
#include <vector>

#include <gtest/gtest.h>

#include "codec.hpp"
#include "config.hpp"
#include "fakes.hpp"
#include "playback.hpp"

namespace {
auto make_frame(const size_t samples, const float value) -> std::string {
    return codec::encode(std::vector<float>(samples, value));
}

struct PlaybackTest : ::testing::Test {
    fake::Backend            backend;
    playback::Scheduler      scheduler;
    std::vector<float>       levels;
    std::vector<error::Kind> errors;

    auto SetUp() -> void override {
        scheduler.backend   = &backend;
        scheduler.on_volume = [this](const float level) { levels.push_back(level); };
        scheduler.on_error  = [this](const error::Kind kind, std::string_view) { errors.push_back(kind); };
    }

    auto render(const size_t frames) -> std::vector<float> {
        auto out = std::vector<float>(frames, 1.0f);
        scheduler.render(out);
        return out;
    }
};

TEST_F(PlaybackTest, OpensDeviceAtPlaybackRate) {
    ASSERT_TRUE(scheduler.start());
    EXPECT_TRUE(backend.playback_open);
    EXPECT_EQ(backend.playback_rate, uint32_t(config::playback_rate));
    scheduler.stop();
    EXPECT_FALSE(backend.playback_open);
}

TEST_F(PlaybackTest, ReportsUnavailableDevice) {
    backend.playback_available = false;
    EXPECT_FALSE(scheduler.start());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], error::Kind::DeviceUnavailable);
}

TEST_F(PlaybackTest, FramesArriveBackToBack) {
    const auto first  = scheduler.enqueue(make_frame(2400, 0.25f));
    const auto second = scheduler.enqueue(make_frame(2400, 0.25f));
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->start, 0);
    EXPECT_EQ(first->end, 2400);
    EXPECT_EQ(second->start, 2400);
    EXPECT_EQ(second->end, 4800);
    EXPECT_EQ(scheduler.next_cursor(), 4800);
    EXPECT_EQ(scheduler.active_count(), 2u);
}

TEST_F(PlaybackTest, LateFrameStartsNow) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.25f)));
    render(1000);
    EXPECT_EQ(scheduler.now(), 1000);
    const auto late = scheduler.enqueue(make_frame(100, 0.25f));
    ASSERT_TRUE(late);
    EXPECT_EQ(late->start, 1000);
    EXPECT_EQ(late->end, 1100);
}

TEST_F(PlaybackTest, SchedulesNeverOverlapOrStartInThePast) {
    auto engine   = std::mt19937(42);
    auto length   = std::uniform_int_distribution<size_t>(0, 3000);
    auto previous = int64_t(0);
    for(auto i = 0; i < 200; i += 1) {
        if(engine() % 2 == 0) {
            render(length(engine));
        }
        const auto now    = scheduler.now();
        const auto result = scheduler.enqueue(make_frame(length(engine), 0.1f));
        ASSERT_TRUE(result);
        EXPECT_GE(result->start, previous);
        EXPECT_GE(result->start, now);
        EXPECT_GE(result->end, result->start);
        previous = result->end;
    }
}

TEST_F(PlaybackTest, MalformedFrameLeavesTimelineUntouched) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(480, 0.25f)));
    const auto cursor = scheduler.next_cursor();
    const auto active = scheduler.active_count();

    EXPECT_FALSE(scheduler.enqueue("AAAA"));   // three bytes, odd length
    EXPECT_FALSE(scheduler.enqueue("AA*AAA")); // not base64
    EXPECT_EQ(scheduler.next_cursor(), cursor);
    EXPECT_EQ(scheduler.active_count(), active);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], error::Kind::MalformedFrame);
    EXPECT_EQ(errors[1], error::Kind::MalformedFrame);
}

TEST_F(PlaybackTest, RendersScheduledSamplesThenSilence) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.5f)));
    const auto out = render(150);
    for(auto i = 0uz; i < 100; i += 1) {
        EXPECT_FLOAT_EQ(out[i], 0.5f) << "frame " << i;
    }
    for(auto i = 100uz; i < out.size(); i += 1) {
        EXPECT_EQ(out[i], 0.0f) << "frame " << i;
    }
}

TEST_F(PlaybackTest, BlockSpanningRenderCallsPlaysContinuously) {
    auto samples = std::vector<float>(300);
    for(auto i = 0uz; i < samples.size(); i += 1) {
        samples[i] = float(i) / 1024;
    }
    ASSERT_TRUE(scheduler.enqueue(codec::encode(samples)));
    auto played = std::vector<float>();
    for(auto i = 0; i < 3; i += 1) {
        const auto out = render(128);
        played.insert(played.end(), out.begin(), out.end());
    }
    for(auto i = 0uz; i < samples.size(); i += 1) {
        EXPECT_FLOAT_EQ(played[i], samples[i]) << "frame " << i;
    }
    EXPECT_EQ(played[300], 0.0f);
}

TEST_F(PlaybackTest, SilentWhenNothingScheduled) {
    const auto out = render(64);
    for(const auto sample : out) {
        EXPECT_EQ(sample, 0.0f);
    }
    EXPECT_TRUE(levels.empty());
}

TEST_F(PlaybackTest, LevelDropsToZeroWhenIdle) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.5f)));
    render(50);
    EXPECT_EQ(scheduler.active_count(), 1u);
    ASSERT_EQ(levels.size(), 1u);
    EXPECT_NEAR(levels[0], 0.5f, 1e-6);

    render(50);
    EXPECT_EQ(scheduler.active_count(), 0u);
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[1], 0.0f);
}

TEST_F(PlaybackTest, StaysActiveUntilLastEntryEnds) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.5f)));
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.5f)));
    render(100);
    EXPECT_EQ(scheduler.active_count(), 1u);
    EXPECT_GT(levels.back(), 0.0f);
    render(100);
    EXPECT_EQ(scheduler.active_count(), 0u);
    EXPECT_EQ(levels.back(), 0.0f);
}

TEST_F(PlaybackTest, ResetDropsEverything) {
    ASSERT_TRUE(scheduler.enqueue(make_frame(2400, 0.5f)));
    ASSERT_TRUE(scheduler.enqueue(make_frame(2400, 0.5f)));
    render(10);
    scheduler.reset();
    EXPECT_EQ(scheduler.active_count(), 0u);
    EXPECT_EQ(scheduler.now(), 10);
    EXPECT_EQ(scheduler.next_cursor(), 10);
    ASSERT_FALSE(levels.empty());
    EXPECT_EQ(levels.back(), 0.0f);

    // nothing scheduled before the reset is heard afterwards
    const auto out = render(100);
    for(const auto sample : out) {
        EXPECT_EQ(sample, 0.0f);
    }
    const auto next = scheduler.enqueue(make_frame(10, 0.5f));
    ASSERT_TRUE(next);
    EXPECT_EQ(next->start, 110);
}

TEST_F(PlaybackTest, ResetWhenIdleIsSilent) {
    scheduler.reset();
    EXPECT_TRUE(levels.empty());
    EXPECT_EQ(scheduler.next_cursor(), 0);
}

TEST_F(PlaybackTest, FinishedSlotsAreReused) {
    const auto first = scheduler.enqueue(make_frame(10, 0.5f));
    ASSERT_TRUE(first);
    EXPECT_EQ(first->handle.index, 0u);
    render(10);
    const auto second = scheduler.enqueue(make_frame(10, 0.5f));
    ASSERT_TRUE(second);
    EXPECT_EQ(second->handle.index, 0u);
}

TEST_F(PlaybackTest, EmptyFrameCompletesOnNextRender) {
    const auto empty = scheduler.enqueue("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->start, empty->end);
    EXPECT_EQ(scheduler.active_count(), 1u);
    render(1);
    EXPECT_EQ(scheduler.active_count(), 0u);
}

TEST_F(PlaybackTest, DeviceDrivesTheClock) {
    ASSERT_TRUE(scheduler.start());
    ASSERT_TRUE(scheduler.enqueue(make_frame(100, 0.25f)));
    auto buffer = std::vector<float>(256);
    backend.pull(buffer);
    EXPECT_EQ(scheduler.now(), 256);
    EXPECT_FLOAT_EQ(buffer[0], 0.25f);
    EXPECT_EQ(buffer[200], 0.0f);
    EXPECT_EQ(scheduler.active_count(), 0u);
}
} // namespace
