#include <variant>

#include "connection.hpp"

namespace conn {
auto to_string(const State state) -> const char* {
    switch(state) {
    case State::Disconnected:
        return "disconnected";
    case State::Connecting:
        return "connecting";
    case State::Connected:
        return "connected";
    }
    return "unknown";
}

auto Manager::notify(const State state) -> void {
    LOG_INFO(logger, "state {}", to_string(state));
    if(observers.on_state) {
        observers.on_state(state);
    }
}

auto Manager::report(const error::Kind kind, const std::string_view detail) -> void {
    LOG_ERROR(logger, "{}: {}", error::to_string(kind), detail);
    if(observers.on_error) {
        observers.on_error(kind, detail);
    }
}

auto Manager::cleanup() -> void {
    if(capture != nullptr) {
        capture->stop();
    }
    if(playback != nullptr) {
        playback->reset();
    }
}

auto Manager::start_capture(const uint64_t generation) -> void {
    if(capture == nullptr || !capture->start()) {
        return;
    }
    // the session may have ended while the device was opening
    auto current = false;
    {
        auto [lock, session] = critical_session.access();
        current              = session.generation == generation && session.state == State::Connected && session.peer_ready;
    }
    if(!current) {
        capture->stop();
    }
}

auto Manager::apply_peer_status(const bool connected) -> void {
    enum class Action {
        None,
        Connected,
        Resume,
        Pause,
    };

    auto action     = Action::None;
    auto generation = uint64_t(0);
    {
        auto [lock, session] = critical_session.access();
        generation           = session.generation;
        if(session.state == State::Disconnected) {
            return;
        }
        if(connected) {
            if(session.state == State::Connecting) {
                session.state = State::Connected;
                action        = Action::Connected;
            } else if(!session.peer_ready) {
                action = Action::Resume;
            }
            session.peer_ready = true;
        } else if(session.peer_ready) {
            session.peer_ready = false;
            action             = Action::Pause;
        }
    }

    switch(action) {
    case Action::None:
        break;
    case Action::Connected:
        notify(State::Connected);
        start_capture(generation);
        break;
    case Action::Resume:
        LOG_INFO(logger, "peer ready, resuming capture");
        start_capture(generation);
        break;
    case Action::Pause:
        LOG_INFO(logger, "peer not ready, pausing audio");
        cleanup();
        break;
    }
}

auto Manager::handle_open(const uint64_t generation) -> void {
    auto connected = false;
    {
        auto [lock, session] = critical_session.access();
        if(session.generation != generation || session.state == State::Disconnected || session.synced) {
            return;
        }
        // announce presence, even if a peer status already completed the handshake
        session.synced = true;
        if(!session.transport || !session.transport->send(proto::build(proto::Sync()))) {
            LOG_WARN(logger, "failed to send sync");
        }
        if(session.state == State::Connecting) {
            session.state = State::Connected;
            connected     = true;
        }
    }
    if(connected) {
        notify(State::Connected);
        start_capture(generation);
    }
}

auto Manager::handle_message(const uint64_t generation, std::string message) -> void {
    {
        auto [lock, session] = critical_session.access();
        if(session.generation != generation || session.state == State::Disconnected) {
            return;
        }
    }
    dispatch(message);
}

auto Manager::handle_closed(const uint64_t generation, const std::optional<std::string> reason) -> void {
    {
        auto [lock, session] = critical_session.access();
        if(session.generation != generation || session.state == State::Disconnected) {
            return;
        }
        session.state = State::Disconnected;
        session.generation += 1;
        if(session.transport) {
            session.retired.push_back(std::move(session.transport));
        }
    }
    cleanup();
    notify(State::Disconnected);
    if(reason) {
        report(error::Kind::TransportError, *reason);
    }
}

auto Manager::handle(const proto::Status& status) -> void {
    LOG_DEBUG(logger, "peer status connected={}", status.connected);
    if(observers.on_peer_status) {
        observers.on_peer_status(status);
    }
    apply_peer_status(status.connected);
}

auto Manager::handle(const proto::Connection& connection) -> void {
    handle(proto::Status{.connected = connection.is_connected()});
}

auto Manager::handle(const proto::Text& text) -> void {
    LOG_DEBUG(logger, "text length={}", text.text.size());
    if(observers.on_text) {
        observers.on_text(text.text);
    }
}

auto Manager::handle(const proto::Audio& audio) -> void {
    if(playback != nullptr) {
        playback->enqueue(audio.audio_base64);
    }
}

auto Manager::handle(const proto::Volume& volume) -> void {
    if(observers.on_remote_volume) {
        observers.on_remote_volume(volume.level);
    }
}

auto Manager::handle(const proto::Response& response) -> void {
    LOG_INFO(logger, "server response: {}", response.data.dump());
}

auto Manager::handle(const proto::Unknown& unknown) -> void {
    LOG_DEBUG(logger, "ignoring message type={}", unknown.type);
}

auto Manager::send_raw(std::string message) -> bool {
    auto [lock, session] = critical_session.access();
    if(session.state != State::Connected || !session.transport) {
        return false;
    }
    return session.transport->send(std::move(message));
}

auto Manager::connect(const std::string& url) -> bool {
    // never double-connect, the previous session is fully cleaned up first
    disconnect();

    auto generation = uint64_t(0);
    auto socket     = (transport::Transport*)(nullptr);
    {
        auto [lock, session] = critical_session.access();
        session.generation += 1;
        session.transport  = create_transport();
        session.state      = State::Connecting;
        session.peer_ready = true;
        session.synced     = false;
        generation         = session.generation;
        socket             = session.transport.get();
    }
    notify(State::Connecting);

    if(socket == nullptr) {
        handle_closed(generation, "no transport available");
        return false;
    }
    auto events = transport::Events{
        .on_open    = [this, generation] { handle_open(generation); },
        .on_message = [this, generation](std::string message) { handle_message(generation, std::move(message)); },
        .on_closed  = [this, generation] { handle_closed(generation, std::nullopt); },
        .on_error   = [this, generation](std::string reason) { handle_closed(generation, std::move(reason)); },
    };
    if(!socket->open(url, std::move(events))) {
        handle_closed(generation, "failed to open " + url);
        return false;
    }
    return true;
}

auto Manager::disconnect() -> void {
    auto dead    = std::vector<std::unique_ptr<transport::Transport>>();
    auto changed = false;
    {
        auto [lock, session] = critical_session.access();
        dead                 = std::move(session.retired);
        session.retired.clear();
        if(session.transport) {
            dead.push_back(std::move(session.transport));
        }
        if(session.state != State::Disconnected) {
            session.state = State::Disconnected;
            session.generation += 1;
            changed = true;
        }
    }
    // closing waits for running callbacks, which need the session lock
    for(auto& socket : dead) {
        socket->close();
    }
    dead.clear();
    if(changed) {
        cleanup();
        notify(State::Disconnected);
    }
}

auto Manager::resync() -> bool {
    return send(proto::Sync());
}

auto Manager::dispatch(const std::string_view raw) -> void {
    const auto message = proto::parse(raw);
    if(!message) {
        report(error::Kind::MalformedFrame, "unparsable message");
        return;
    }
    std::visit([this](const auto& m) { handle(m); }, *message);
}

auto Manager::state() -> State {
    auto [lock, session] = critical_session.access();
    return session.state;
}

auto Manager::toggle_mic(const bool enabled) -> bool {
    return send(proto::ToggleMic{enabled});
}

auto Manager::toggle_cam(const bool enabled) -> bool {
    return send(proto::ToggleCam{enabled});
}

auto Manager::toggle_think(const bool enabled) -> bool {
    return send(proto::ToggleThink{enabled});
}

auto Manager::show_feed() -> bool {
    return send(proto::ShowFeed());
}

auto Manager::send_text(std::string text) -> bool {
    return send(proto::Text{std::move(text)});
}

auto Manager::send_audio(std::string audio_base64) -> bool {
    return send(proto::Audio{std::move(audio_base64)});
}

auto Manager::send_video_frame(std::string frame_base64) -> bool {
    return send(proto::VideoFrame{std::move(frame_base64)});
}

Manager::~Manager() {
    disconnect();
}
} // namespace conn
