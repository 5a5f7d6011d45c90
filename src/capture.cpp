#include <algorithm>

#include "capture.hpp"
#include "codec.hpp"
#include "volume.hpp"

namespace capture {
auto Engine::push_samples(std::span<const float> samples) -> void {
    constexpr auto block_size = size_t(config::samples_per_block);

    while(!samples.empty()) {
        const auto take = std::min(samples.size(), block_size - pending.size());
        pending.insert(pending.end(), samples.begin(), samples.begin() + take);
        samples = samples.subspan(take);
        if(pending.size() == block_size) {
            process_block(pending);
            pending.clear();
        }
    }
}

auto Engine::process_block(const std::span<const float> block) -> void {
    if(on_volume) {
        on_volume(volume::level(block, gain));
    }

    auto frame = codec::encode(block);
    if(!send_frame || !send_frame(std::move(frame))) {
        dropped_blocks += 1;
        LOG_DEBUG(logger, "sink not ready, dropped block dropped={}", dropped_blocks.load());
        return;
    }
    sent_blocks += 1;
    LOG_DEBUG(logger, "sent block samples={} sent={}", block.size(), sent_blocks.load());
}

auto Engine::start() -> bool {
    {
        auto [lock, stream] = critical_stream.access();
        if(stream && !stream_failed) {
            return true;
        }
        if(stream) {
            LOG_WARN(logger, "reopening failed capture stream");
            stream.reset();
        }
        stream_failed = false;
        if(backend != nullptr) {
            pending.clear();
            pending.reserve(config::samples_per_block);
            stream = backend->open_capture(
                config::capture_rate,
                [this](const std::span<const float> samples) { push_samples(samples); },
                [this] {
                    stream_failed = true;
                    if(on_error) {
                        on_error(error::Kind::DeviceUnavailable, "capture stream failed");
                    }
                });
        }
        if(stream) {
            LOG_INFO(logger, "capture started rate={} block={}", config::capture_rate, config::samples_per_block);
            return true;
        }
    }
    LOG_ERROR(logger, "failed to open capture device");
    if(on_error) {
        on_error(error::Kind::DeviceUnavailable, "failed to open capture device");
    }
    return false;
}

auto Engine::stop() -> void {
    auto [lock, stream] = critical_stream.access();
    if(!stream) {
        return;
    }
    stream.reset();
    // partial block is discarded
    pending.clear();
    LOG_INFO(logger, "capture stopped sent={} dropped={}", sent_blocks.load(), dropped_blocks.load());
}

auto Engine::is_running() -> bool {
    auto [lock, stream] = critical_stream.access();
    return stream && !stream_failed;
}
} // namespace capture
