#pragma once
#include <functional>
#include <string_view>

namespace error {
enum class Kind {
    DeviceUnavailable,
    MalformedFrame,
    TransportError,
};

using Callback = std::function<void(Kind kind, std::string_view detail)>;

inline auto to_string(const Kind kind) -> const char* {
    switch(kind) {
    case Kind::DeviceUnavailable:
        return "device unavailable";
    case Kind::MalformedFrame:
        return "malformed frame";
    case Kind::TransportError:
        return "transport error";
    }
    return "unknown";
}
} // namespace error
