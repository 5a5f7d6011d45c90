#include <cmath>
#include <vector>

#include <gtest/gtest.h>

#include "config.hpp"
#include "volume.hpp"

namespace {
TEST(Volume, SilentBlockIsZero) {
    const auto block = std::vector<float>(config::samples_per_block, 0.0f);
    EXPECT_EQ(volume::level(block, config::default_gain), 0.0f);
}

TEST(Volume, SingleFullScaleSample) {
    auto block = std::vector<float>(config::samples_per_block, 0.0f);
    block[0]   = 1.0f;
    const auto expected = std::sqrt(1.0f / config::samples_per_block) * config::default_gain;
    EXPECT_NEAR(volume::level(block, config::default_gain), expected, 1e-6);
}

TEST(Volume, EmptyBlockIsZero) {
    EXPECT_EQ(volume::level({}, 5.0f), 0.0f);
}

TEST(Volume, RmsOfConstantSignal) {
    EXPECT_NEAR(volume::level(std::vector<float>(64, -0.5f)), 0.5f, 1e-6);
    EXPECT_NEAR(volume::level(std::vector<float>{0.5f, -0.5f, 0.5f, -0.5f}, 2.0f), 1.0f, 1e-6);
}

TEST(Volume, NeverNegative) {
    EXPECT_GE(volume::level(std::vector<float>{-1.0f, -0.25f}, -3.0f), 0.0f);
}

TEST(Volume, ParsesFractionalGain) {
    EXPECT_EQ(volume::parse_gain("5"), 5.0f);
    EXPECT_EQ(volume::parse_gain("2.5"), 2.5f);
    EXPECT_EQ(volume::parse_gain("0"), 0.0f);
}

TEST(Volume, RejectsInvalidGain) {
    EXPECT_FALSE(volume::parse_gain(""));
    EXPECT_FALSE(volume::parse_gain("loud"));
    EXPECT_FALSE(volume::parse_gain("2.5x"));
    EXPECT_FALSE(volume::parse_gain("-1"));
    EXPECT_FALSE(volume::parse_gain("inf"));
}
} // namespace
