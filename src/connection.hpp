#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "capture.hpp"
#include "error.hpp"
#include "macros/logger.hpp"
#include "playback.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "util/critical.hpp"

namespace conn {
enum class State {
    Disconnected,
    Connecting,
    Connected,
};

auto to_string(State state) -> const char*;

struct Observers {
    std::function<void(State state)>                on_state;
    std::function<void(const std::string& text)>    on_text;
    std::function<void(double level)>               on_remote_volume; // diagnostic only
    // the remote agent's readiness. it pauses and resumes audio but leaves State untouched
    std::function<void(const proto::Status& status)> on_peer_status;
    error::Callback                                  on_error;
};

struct Session {
    State    state      = State::Disconnected;
    uint64_t generation = 0; // bumped whenever a session ends, stale callbacks compare against it
    bool     peer_ready = true;
    bool     synced     = false; // sync goes out once per transport, on open

    std::unique_ptr<transport::Transport> transport;
    // ended from a transport callback, destroyed later on a caller thread
    std::vector<std::unique_ptr<transport::Transport>> retired;
};

struct Manager {
    static inline auto logger = Logger("VOCALINK_CONN");

    transport::Factory   create_transport;
    capture::Engine*     capture  = nullptr;
    playback::Scheduler* playback = nullptr;
    Observers            observers;

    Critical<Session> critical_session;

    auto notify(State state) -> void;
    auto report(error::Kind kind, std::string_view detail) -> void;
    auto cleanup() -> void;
    auto start_capture(uint64_t generation) -> void;
    auto apply_peer_status(bool connected) -> void;

    // transport events
    auto handle_open(uint64_t generation) -> void;
    auto handle_message(uint64_t generation, std::string message) -> void;
    auto handle_closed(uint64_t generation, std::optional<std::string> reason) -> void;

    // inbound messages
    auto handle(const proto::Status& status) -> void;
    auto handle(const proto::Connection& connection) -> void;
    auto handle(const proto::Text& text) -> void;
    auto handle(const proto::Audio& audio) -> void;
    auto handle(const proto::Volume& volume) -> void;
    auto handle(const proto::Response& response) -> void;
    auto handle(const proto::Unknown& unknown) -> void;

    auto send_raw(std::string message) -> bool;

    template <class T>
    auto send(const T& message) -> bool {
        return send_raw(proto::build(message));
    }

    auto connect(const std::string& url) -> bool;
    auto disconnect() -> void;
    auto resync() -> bool;
    auto dispatch(std::string_view raw) -> void;
    auto state() -> State;

    auto toggle_mic(bool enabled) -> bool;
    auto toggle_cam(bool enabled) -> bool;
    auto toggle_think(bool enabled) -> bool;
    auto show_feed() -> bool;
    auto send_text(std::string text) -> bool;
    auto send_audio(std::string audio_base64) -> bool;
    auto send_video_frame(std::string frame_base64) -> bool;

    ~Manager();
};
} // namespace conn
