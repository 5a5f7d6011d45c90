#include <rtc/rtc.hpp>

#include "config.hpp"
#include "macros/logger.hpp"
#include "websocket.hpp"

namespace transport {
namespace {
auto logger = Logger("VOCALINK_WS");

struct WebSocket : Transport {
    std::shared_ptr<rtc::WebSocket> ws;
    size_t                          max_buffered;

    auto open(const std::string& url, Events events) -> bool override;
    auto send(std::string message) -> bool override;
    auto close() -> void override;

    WebSocket(size_t max_buffered);
    ~WebSocket() override;
};

auto WebSocket::open(const std::string& url, Events events) -> bool {
    close();
    ws = std::make_shared<rtc::WebSocket>(websocket_configuration());
    ws->onOpen([on_open = std::move(events.on_open)] {
        if(on_open) {
            on_open();
        }
    });
    ws->onClosed([on_closed = std::move(events.on_closed)] {
        if(on_closed) {
            on_closed();
        }
    });
    ws->onError([on_error = std::move(events.on_error)](std::string error) {
        if(on_error) {
            on_error(std::move(error));
        }
    });
    ws->onMessage([on_message = std::move(events.on_message)](std::variant<rtc::binary, rtc::string> message) {
        auto text = std::get_if<rtc::string>(&message);
        if(text == nullptr) {
            LOG_WARN(logger, "ignoring binary message");
            return;
        }
        if(on_message) {
            on_message(std::move(*text));
        }
    });

    try {
        ws->open(url);
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "failed to open {}: {}", url, e.what());
        ws->resetCallbacks();
        ws.reset();
        return false;
    }
    LOG_INFO(logger, "connecting to {}", url);
    return true;
}

auto WebSocket::send(std::string message) -> bool {
    if(!ws || !ws->isOpen()) {
        return false;
    }
    if(const auto buffered = ws->bufferedAmount(); buffered > max_buffered) {
        LOG_WARN(logger, "send buffer full buffered={}", buffered);
        return false;
    }
    try {
        return ws->send(std::move(message));
    } catch(const std::exception& e) {
        LOG_ERROR(logger, "send failed: {}", e.what());
        return false;
    }
}

auto WebSocket::close() -> void {
    if(!ws) {
        return;
    }
    // waits for a running callback, so nothing fires after this
    ws->resetCallbacks();
    ws->close();
}

WebSocket::WebSocket(const size_t max_buffered)
    : max_buffered(max_buffered) {}

WebSocket::~WebSocket() {
    close();
}
} // namespace

auto websocket_configuration() -> rtc::WebSocket::Configuration {
    auto conf                = rtc::WebSocket::Configuration();
    conf.maxMessageSize      = config::max_message_bytes;
    conf.pingInterval        = std::chrono::duration_cast<std::chrono::milliseconds>(config::ping_interval);
    conf.maxOutstandingPings = int(config::ping_timeout / config::ping_interval);
    return conf;
}

auto create_websocket(const size_t max_buffered) -> std::unique_ptr<Transport> {
    return std::make_unique<WebSocket>(max_buffered);
}
} // namespace transport
