#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "codec.hpp"
#include "error.hpp"
#include "macros/logger.hpp"
#include "sound.hpp"
#include "util/critical.hpp"

namespace playback {
// all times are frame counts on the output clock at config::playback_rate

struct Handle {
    size_t index;
};

struct Entry {
    codec::AudioBlock buffer;
    int64_t           start;

    auto end() const -> int64_t {
        return start + int64_t(buffer.duration());
    }
};

struct Schedule {
    Handle  handle;
    int64_t start;
    int64_t end;
};

// active set. slots are reused, a handle stays valid until its entry finishes or is reset
struct Timeline {
    std::vector<std::optional<Entry>> entries;
    size_t                            active      = 0;
    int64_t                           now         = 0;
    int64_t                           next_cursor = 0;

    auto allocate() -> size_t;
    auto insert(codec::AudioBlock block) -> Schedule;
    auto mix(std::span<float> out) const -> void;
    auto remove(Handle handle) -> bool;
    auto collect_finished() -> size_t;
    auto clear() -> size_t;
};

struct Scheduler {
    static inline auto logger = Logger("VOCALINK_PLAYBACK");

    sound::Backend* backend = nullptr;
    float           gain    = 1.0f;

    std::function<void(float level)> on_volume;
    error::Callback                  on_error;

    Critical<Timeline>                       critical_timeline;
    Critical<std::unique_ptr<sound::Stream>> critical_stream;

    auto start() -> bool;
    auto stop() -> void;

    // transport thread
    auto enqueue(std::string_view frame) -> std::optional<Schedule>;
    auto schedule(codec::AudioBlock block) -> Schedule;
    auto reset() -> void;

    // output clock, device thread
    auto render(std::span<float> out) -> void;

    auto now() -> int64_t;
    auto next_cursor() -> int64_t;
    auto active_count() -> size_t;
};
} // namespace playback
