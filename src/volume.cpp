#include <charconv>
#include <cmath>

#include "macros/assert.hpp"
#include "volume.hpp"

namespace volume {
auto level(const std::span<const float> samples, const float gain) -> float {
    if(samples.empty()) {
        return 0;
    }
    auto sum = 0.0;
    for(const auto sample : samples) {
        sum += double(sample) * sample;
    }
    const auto rms = std::sqrt(sum / samples.size());
    return float(rms * std::abs(gain));
}

auto parse_gain(const std::string_view text) -> std::optional<float> {
    auto       gain      = 0.0f;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), gain);
    ensure(ec == std::errc() && ptr == text.data() + text.size(), "invalid gain {}", text);
    ensure(std::isfinite(gain) && gain >= 0, "gain out of range {}", text);
    return gain;
}
} // namespace volume
