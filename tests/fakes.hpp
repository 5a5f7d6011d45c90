#pragma once
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "sound.hpp"
#include "transport.hpp"

namespace fake {
struct Stream : sound::Stream {
    bool* open;

    Stream(bool* open)
        : open(open) {
        *open = true;
    }

    ~Stream() override {
        *open = false;
    }
};

struct Backend : sound::Backend {
    bool capture_available  = true;
    bool playback_available = true;
    bool capture_open       = false;
    bool playback_open      = false;

    size_t   capture_opens = 0;
    uint32_t capture_rate  = 0;
    uint32_t playback_rate = 0;

    sound::CaptureCallback  on_samples;
    sound::PlaybackCallback on_request;
    sound::FailureCallback  capture_failure;

    auto open_capture(const uint32_t rate, sound::CaptureCallback callback, sound::FailureCallback failure) -> std::unique_ptr<sound::Stream> override {
        if(!capture_available) {
            return nullptr;
        }
        capture_rate    = rate;
        on_samples      = std::move(callback);
        capture_failure = std::move(failure);
        capture_opens += 1;
        return std::make_unique<Stream>(&capture_open);
    }

    auto open_playback(const uint32_t rate, sound::PlaybackCallback callback, sound::FailureCallback /*failure*/) -> std::unique_ptr<sound::Stream> override {
        if(!playback_available) {
            return nullptr;
        }
        playback_rate = rate;
        on_request    = std::move(callback);
        return std::make_unique<Stream>(&playback_open);
    }

    // what the device thread would do
    auto deliver(const std::span<const float> samples) -> void {
        if(capture_open) {
            on_samples(samples);
        }
    }

    auto pull(const std::span<float> buffer) -> void {
        if(playback_open) {
            on_request(buffer);
        }
    }
};

struct Wire {
    std::string              url;
    transport::Events        events;
    std::vector<std::string> sent;
    bool                     open_ok = true;
    bool                     accept  = true;
    bool                     closed  = false;
};

struct Transport : transport::Transport {
    std::shared_ptr<Wire> wire;

    auto open(const std::string& url, transport::Events events) -> bool override {
        wire->url    = url;
        wire->events = std::move(events);
        return wire->open_ok;
    }

    auto send(std::string message) -> bool override {
        if(!wire->accept) {
            return false;
        }
        wire->sent.push_back(std::move(message));
        return true;
    }

    auto close() -> void override {
        wire->closed = true;
    }
};

// hands out transports and keeps their wires so tests can fire events, even stale ones
struct Network {
    std::vector<std::shared_ptr<Wire>> wires;
    bool                               open_ok = true;

    auto factory() -> transport::Factory {
        return [this] {
            auto wire     = std::make_shared<Wire>();
            wire->open_ok = open_ok;
            wires.push_back(wire);
            auto transport  = std::make_unique<Transport>();
            transport->wire = wire;
            return std::unique_ptr<transport::Transport>(std::move(transport));
        };
    }

    auto last() -> Wire& {
        return *wires.back();
    }
};
} // namespace fake
