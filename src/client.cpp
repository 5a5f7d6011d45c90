#include <array>
#include <bit>
#include <fstream>
#include <print>

#include <coop/io.hpp>
#include <coop/thread.hpp>
#include <unistd.h>

#include "codec.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "macros/logger.hpp"
#include "pipewire.hpp"
#include "volume.hpp"
#include "util/argument-parser.hpp"
#include "websocket.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/coop-unwrap.hpp"

namespace {
auto logger = Logger("VOCALINK");

auto server_url  = config::default_server_url;
auto gain_arg    = "5";
auto gain        = config::default_gain;
auto no_playback = false;

auto parse_switch(const std::string_view arg) -> std::optional<bool> {
    if(arg == "on") {
        return true;
    } else if(arg == "off") {
        return false;
    } else {
        return std::nullopt;
    }
}

auto read_file(const std::string& path) -> std::optional<std::vector<std::byte>> {
    auto file = std::ifstream(path, std::ios::binary | std::ios::ate);
    ensure(file, "cannot open {}", path);
    const auto size = size_t(file.tellg());
    auto       data = std::vector<std::byte>(size);
    file.seekg(0);
    ensure(file.read(std::bit_cast<char*>(data.data()), size), "failed to read {}", path);
    return data;
}

auto on_error(const error::Kind kind, const std::string_view detail) -> void {
    LOG_ERROR(logger, "{}: {}", error::to_string(kind), detail);
}

struct Context {
    std::unique_ptr<sound::Backend> backend;
    playback::Scheduler             scheduler;
    capture::Engine                 engine;
    conn::Manager                   manager;
    bool                            running = true;

    auto init() -> bool;
    auto handle_command(std::string_view line) -> void;
    auto read_commands() -> coop::Async<void>;
};

auto Context::init() -> bool {
    backend = sound::create_pipewire_backend();
    if(!backend) {
        LOG_ERROR(logger, "audio backend unavailable, running without audio");
    }

    scheduler.backend  = backend.get();
    scheduler.on_error = on_error;
    scheduler.on_volume = [](const float level) {
        LOG_DEBUG(logger, "speaker level {:.3f}", level);
    };

    engine.backend  = backend.get();
    engine.gain     = gain;
    engine.on_error = on_error;
    engine.on_volume = [](const float level) {
        LOG_DEBUG(logger, "mic level {:.3f}", level);
    };
    engine.send_frame = [this](std::string frame) -> bool {
        return manager.send_audio(std::move(frame));
    };

    manager.create_transport = [] { return transport::create_websocket(config::max_buffered_bytes); };
    manager.capture          = &engine;
    manager.playback         = &scheduler;
    manager.observers.on_state = [](const conn::State state) {
        std::println("* {}", conn::to_string(state));
    };
    manager.observers.on_text = [](const std::string& text) {
        std::println("< {}", text);
    };
    manager.observers.on_remote_volume = [](const double level) {
        LOG_DEBUG(logger, "remote level {:.3f}", level);
    };
    manager.observers.on_peer_status = [](const proto::Status& status) {
        LOG_INFO(logger, "peer connected={} mic={} cam={}", status.connected, status.mic_on.value_or(false), status.cam_on.value_or(false));
    };
    manager.observers.on_error = on_error;

    if(!no_playback) {
        // failure is reported, the client still works for text
        scheduler.start();
    }
    return true;
}

auto Context::handle_command(const std::string_view line) -> void {
    if(line.empty()) {
        return;
    }
    if(line[0] != '/') {
        if(!manager.send_text(std::string(line))) {
            LOG_WARN(logger, "not connected, text dropped");
        }
        return;
    }

    const auto space   = line.find(' ');
    const auto command = line.substr(0, space);
    const auto arg     = space == line.npos ? std::string_view() : line.substr(space + 1);
    auto       sent    = true;
    if(command == "/quit") {
        running = false;
    } else if(command == "/connect") {
        manager.connect(server_url);
    } else if(command == "/disconnect") {
        manager.disconnect();
    } else if(command == "/sync") {
        sent = manager.resync();
    } else if(command == "/mic" || command == "/cam" || command == "/think") {
        const auto enabled = parse_switch(arg);
        if(!enabled) {
            std::println("usage: {} on|off", command);
            return;
        }
        sent = command == "/mic" ? manager.toggle_mic(*enabled) : command == "/cam" ? manager.toggle_cam(*enabled)
                                                                                   : manager.toggle_think(*enabled);
    } else if(command == "/feed") {
        sent = manager.show_feed();
    } else if(command == "/frame") {
        const auto data = read_file(std::string(arg));
        if(!data) {
            return;
        }
        sent = manager.send_video_frame(codec::base64_encode(*data));
    } else {
        std::println("unknown command {}", command);
        return;
    }
    if(!sent) {
        LOG_WARN(logger, "not connected, {} dropped", command);
    }
}

auto Context::read_commands() -> coop::Async<void> {
    auto line   = std::string();
    auto buffer = std::array<char, 4096>();
    while(running) {
        if((co_await coop::wait_for_file(STDIN_FILENO, true, false)).error) {
            LOG_ERROR(logger, "stdin aborted");
            co_return;
        }
        const auto len = read(STDIN_FILENO, buffer.data(), buffer.size());
        if(len <= 0) {
            // eof
            co_return;
        }
        line.append(buffer.data(), len);
        for(auto pos = line.find('\n'); pos != line.npos && running; pos = line.find('\n')) {
            handle_command(std::string_view(line).substr(0, pos));
            line.erase(0, pos + 1);
        }
    }
}

auto async_main() -> coop::Async<bool> {
    auto context = Context();
    coop_ensure(context.init());
    // a failed first attempt is reported, /connect retries
    context.manager.connect(server_url);
    co_await context.read_commands();
    co_return true;
}
} // namespace

auto main(const int argc, const char* const* argv) -> int {
    {
        auto parser = args::Parser<uint16_t>();
        auto help   = false;
        parser.kwarg(&server_url, {"-s", "--server"}, "URL", "websocket url of the bridge server", {.state = args::State::DefaultValue});
        parser.kwarg(&gain_arg, {"-g", "--gain"}, "GAIN", "microphone level gain, decimals allowed", {.state = args::State::DefaultValue});
        parser.kwflag(&no_playback, {"--no-playback"}, "do not open the speaker", {});
        parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
        if(!parser.parse(argc, argv) || help) {
            std::println("usage: vocalink {}", parser.get_help());
            return 0;
        }
        const auto parsed = volume::parse_gain(gain_arg);
        if(!parsed) {
            std::println("invalid gain {}", gain_arg);
            return 1;
        }
        gain = *parsed;
    }
    auto runner = coop::Runner();
    runner.push_task(async_main());
    runner.run();
    return 0;
}
