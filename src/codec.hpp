#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codec {
struct AudioBlock {
    std::vector<float> samples; // mono, [-1, 1]
    uint32_t           rate;

    auto duration() const -> size_t {
        return samples.size();
    }
};

// little-endian int16, 2 bytes per sample
auto to_pcm16(std::span<const float> samples) -> std::vector<std::byte>;
auto from_pcm16(std::span<const std::byte> bytes) -> std::optional<std::vector<float>>;

auto base64_encode(std::span<const std::byte> bytes) -> std::string;
auto base64_decode(std::string_view text) -> std::optional<std::vector<std::byte>>;

auto encode(std::span<const float> samples) -> std::string;
auto decode(std::string_view frame, uint32_t rate) -> std::optional<AudioBlock>;
} // namespace codec
