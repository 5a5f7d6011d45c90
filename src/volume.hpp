#pragma once
#include <optional>
#include <span>
#include <string_view>

namespace volume {
// root-mean-square of the block times gain, 0 for an empty block
auto level(std::span<const float> samples, float gain = 1.0f) -> float;

// non-negative decimal such as "5" or "2.5"
auto parse_gain(std::string_view text) -> std::optional<float>;
} // namespace volume
