#pragma once
#include <chrono>
#include <cstddef>

namespace config {
// audio processing
constexpr auto capture_rate      = 16000; // Hz, uplink
constexpr auto playback_rate     = 24000; // Hz, downlink
constexpr auto samples_per_block = 4096;  // capture block, ~256ms at capture_rate
constexpr auto pcm_scale         = 32768.0f;
constexpr auto default_gain      = 5.0f; // microphones are usually quiet

// networking
constexpr auto default_server_url = "ws://localhost:8768";
constexpr auto max_buffered_bytes = size_t(64 * 1024); // drop capture frames above this
constexpr auto max_message_bytes  = size_t(10 * 1024 * 1024); // a whole spoken reply fits in one audio message
constexpr auto ping_interval      = std::chrono::seconds(20);
constexpr auto ping_timeout       = std::chrono::seconds(60);
} // namespace config
