#pragma once
#include <cstddef>

#include <rtc/websocket.hpp>

#include "transport.hpp"

namespace transport {
// message size limit and keepalive of the bridge connection
auto websocket_configuration() -> rtc::WebSocket::Configuration;

// text websocket. send() refuses when more than max_buffered bytes are still queued
auto create_websocket(size_t max_buffered) -> std::unique_ptr<Transport>;
} // namespace transport
