#pragma once
#include <functional>
#include <memory>
#include <string>

namespace transport {
// invoked from the transport's own threads
struct Events {
    std::function<void()>                    on_open;
    std::function<void(std::string message)> on_message;
    std::function<void()>                    on_closed;
    std::function<void(std::string error)>   on_error;
};

struct Transport {
    // false if the connection attempt could not be started
    virtual auto open(const std::string& url, Events events) -> bool = 0;
    // false if the socket is not open or refuses more data
    virtual auto send(std::string message) -> bool = 0;
    // after close() returns no event fires anymore
    virtual auto close() -> void = 0;

    virtual ~Transport() = default;
};

using Factory = std::function<std::unique_ptr<Transport>()>;
} // namespace transport
