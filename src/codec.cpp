#include <algorithm>
#include <bit>
#include <cmath>

#include <mbedtls/base64.h>

#include "codec.hpp"
#include "config.hpp"
#include "macros/assert.hpp"

namespace codec {
auto to_pcm16(const std::span<const float> samples) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>(samples.size() * 2);
    for(auto i = 0uz; i < samples.size(); i += 1) {
        const auto sample = std::isnan(samples[i]) ? 0.0f : std::clamp(samples[i], -1.0f, 1.0f);
        // truncate toward zero, +1.0 saturates to 32767
        const auto value = std::min(int32_t(sample * config::pcm_scale), int32_t(INT16_MAX));
        const auto bits  = uint16_t(int16_t(value));
        out[i * 2 + 0]   = std::byte(bits & 0xff);
        out[i * 2 + 1]   = std::byte(bits >> 8);
    }
    return out;
}

auto from_pcm16(const std::span<const std::byte> bytes) -> std::optional<std::vector<float>> {
    ensure(bytes.size() % 2 == 0, "odd pcm16 payload length {}", bytes.size());
    auto out = std::vector<float>(bytes.size() / 2);
    for(auto i = 0uz; i < out.size(); i += 1) {
        const auto bits = uint16_t(uint16_t(bytes[i * 2 + 0]) | uint16_t(bytes[i * 2 + 1]) << 8);
        out[i]          = int16_t(bits) / config::pcm_scale;
    }
    return out;
}

auto base64_encode(const std::span<const std::byte> bytes) -> std::string {
    const auto src  = std::bit_cast<const unsigned char*>(bytes.data());
    auto       size = size_t(0);
    // first call reports the required size including the terminator
    auto ret = mbedtls_base64_encode(NULL, 0, &size, src, bytes.size());
    if(ret == 0) {
        return {};
    }
    ensure(ret == MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL, "base64 size query failed: {}", ret);
    auto out = std::string(size, '\0');
    ret      = mbedtls_base64_encode(std::bit_cast<unsigned char*>(out.data()), out.size(), &size, src, bytes.size());
    ensure(ret == 0, "base64 encode failed: {}", ret);
    out.resize(size);
    return out;
}

auto base64_decode(const std::string_view text) -> std::optional<std::vector<std::byte>> {
    const auto src  = std::bit_cast<const unsigned char*>(text.data());
    auto       size = size_t(0);
    // validates the whole input before reporting the size
    auto ret = mbedtls_base64_decode(NULL, 0, &size, src, text.size());
    if(ret == 0) {
        return std::vector<std::byte>();
    }
    ensure(ret == MBEDTLS_ERR_BASE64_BUFFER_TOO_SMALL, "invalid base64: {}", ret);
    auto out = std::vector<std::byte>(size);
    ret      = mbedtls_base64_decode(std::bit_cast<unsigned char*>(out.data()), out.size(), &size, src, text.size());
    ensure(ret == 0, "invalid base64: {}", ret);
    out.resize(size);
    return out;
}

auto encode(const std::span<const float> samples) -> std::string {
    return base64_encode(to_pcm16(samples));
}

auto decode(const std::string_view frame, const uint32_t rate) -> std::optional<AudioBlock> {
    const auto bytes = base64_decode(frame);
    ensure(bytes, "frame is not valid base64");
    auto samples = from_pcm16(*bytes);
    ensure(samples);
    return AudioBlock{std::move(*samples), rate};
}
} // namespace codec
