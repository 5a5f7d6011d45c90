#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "macros/logger.hpp"
#include "sound.hpp"
#include "util/critical.hpp"

namespace capture {
struct Engine {
    static inline auto logger = Logger("VOCALINK_CAPTURE");

    sound::Backend* backend = nullptr;
    float           gain    = config::default_gain;

    std::function<void(float level)> on_volume;
    // hands one encoded block to the transport, false if it was not accepted
    std::function<bool(std::string frame)> send_frame;
    error::Callback                        on_error;

    Critical<std::unique_ptr<sound::Stream>> critical_stream;
    std::atomic_bool                         stream_failed = false; // set by the device, start() reopens
    std::vector<float>                       pending; // device thread only while running
    std::atomic<size_t>                      sent_blocks    = 0;
    std::atomic<size_t>                      dropped_blocks = 0;

    // device thread
    auto push_samples(std::span<const float> samples) -> void;
    auto process_block(std::span<const float> block) -> void;

    auto start() -> bool;
    auto stop() -> void;
    auto is_running() -> bool;
};
} // namespace capture
