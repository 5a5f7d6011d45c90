#include <algorithm>

#include "config.hpp"
#include "playback.hpp"
#include "volume.hpp"

namespace playback {
auto Timeline::allocate() -> size_t {
    for(auto i = 0uz; i < entries.size(); i += 1) {
        if(!entries[i]) {
            return i;
        }
    }
    entries.emplace_back();
    return entries.size() - 1;
}

auto Timeline::insert(codec::AudioBlock block) -> Schedule {
    // never before the cursor (no overlap), never in the past (late frames play now)
    const auto start    = std::max(next_cursor, now);
    const auto duration = int64_t(block.duration());
    const auto index    = allocate();
    entries[index]      = Entry{std::move(block), start};
    next_cursor         = start + duration;
    active += 1;
    return Schedule{{index}, start, next_cursor};
}

auto Timeline::mix(const std::span<float> out) const -> void {
    const auto window_end = now + int64_t(out.size());
    for(const auto& slot : entries) {
        if(!slot) {
            continue;
        }
        const auto& entry = *slot;
        const auto  begin = std::max(entry.start, now);
        const auto  end   = std::min(entry.end(), window_end);
        for(auto t = begin; t < end; t += 1) {
            out[t - now] += entry.buffer.samples[t - entry.start];
        }
    }
}

auto Timeline::remove(const Handle handle) -> bool {
    if(handle.index >= entries.size() || !entries[handle.index]) {
        return false;
    }
    entries[handle.index].reset();
    active -= 1;
    return true;
}

auto Timeline::collect_finished() -> size_t {
    auto count = 0uz;
    for(auto i = 0uz; i < entries.size(); i += 1) {
        if(entries[i] && entries[i]->end() <= now) {
            remove({i});
            count += 1;
        }
    }
    return count;
}

auto Timeline::clear() -> size_t {
    const auto count = active;
    entries.clear();
    active      = 0;
    next_cursor = now;
    return count;
}

auto Scheduler::start() -> bool {
    {
        auto [lock, stream] = critical_stream.access();
        if(stream) {
            return true;
        }
        if(backend != nullptr) {
            stream = backend->open_playback(
                config::playback_rate,
                [this](const std::span<float> out) { render(out); },
                [this] {
                    if(on_error) {
                        on_error(error::Kind::DeviceUnavailable, "playback stream failed");
                    }
                });
        }
        if(stream) {
            LOG_INFO(logger, "playback started rate={}", config::playback_rate);
            return true;
        }
    }
    LOG_ERROR(logger, "failed to open playback device");
    if(on_error) {
        on_error(error::Kind::DeviceUnavailable, "failed to open playback device");
    }
    return false;
}

auto Scheduler::stop() -> void {
    auto [lock, stream] = critical_stream.access();
    if(stream) {
        stream.reset();
        LOG_INFO(logger, "playback stopped");
    }
}

auto Scheduler::enqueue(const std::string_view frame) -> std::optional<Schedule> {
    auto block = codec::decode(frame, config::playback_rate);
    if(!block) {
        LOG_WARN(logger, "dropping malformed frame length={}", frame.size());
        if(on_error) {
            on_error(error::Kind::MalformedFrame, "inbound audio frame could not be decoded");
        }
        return std::nullopt;
    }
    return schedule(std::move(*block));
}

auto Scheduler::schedule(codec::AudioBlock block) -> Schedule {
    auto [lock, timeline] = critical_timeline.access();
    const auto result     = timeline.insert(std::move(block));
    LOG_DEBUG(logger, "scheduled start={} end={} now={} active={}", result.start, result.end, timeline.now, timeline.active);
    return result;
}

auto Scheduler::reset() -> void {
    auto dropped = 0uz;
    {
        auto [lock, timeline] = critical_timeline.access();
        dropped               = timeline.clear();
    }
    if(dropped == 0) {
        return;
    }
    LOG_INFO(logger, "reset timeline, dropped {} entries", dropped);
    if(on_volume) {
        on_volume(0);
    }
}

auto Scheduler::render(const std::span<float> out) -> void {
    std::ranges::fill(out, 0.0f);

    auto finished = 0uz;
    auto active   = 0uz;
    {
        auto [lock, timeline] = critical_timeline.access();
        timeline.mix(out);
        timeline.now += int64_t(out.size());
        finished = timeline.collect_finished();
        active   = timeline.active;
    }

    if(!on_volume) {
        return;
    }
    if(active > 0) {
        on_volume(volume::level(out, gain));
    } else if(finished > 0) {
        // went idle
        on_volume(0);
    }
}

auto Scheduler::now() -> int64_t {
    auto [lock, timeline] = critical_timeline.access();
    return timeline.now;
}

auto Scheduler::next_cursor() -> int64_t {
    auto [lock, timeline] = critical_timeline.access();
    return timeline.next_cursor;
}

auto Scheduler::active_count() -> size_t {
    auto [lock, timeline] = critical_timeline.access();
    return timeline.active;
}
} // namespace playback
