#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace sound {
// callbacks run on the device thread and must not block
using CaptureCallback  = std::function<void(std::span<const float> samples)>; // mono
using PlaybackCallback = std::function<void(std::span<float> buffer)>;        // mono, fill completely
using FailureCallback  = std::function<void()>;

// an open device stream. destroying it disconnects the device, no callback fires afterwards
struct Stream {
    virtual ~Stream() = default;
};

struct Backend {
    // returns null when the device cannot be opened
    virtual auto open_capture(uint32_t rate, CaptureCallback on_samples, FailureCallback on_failure) -> std::unique_ptr<Stream>    = 0;
    virtual auto open_playback(uint32_t rate, PlaybackCallback on_request, FailureCallback on_failure) -> std::unique_ptr<Stream> = 0;

    virtual ~Backend() = default;
};
} // namespace sound
