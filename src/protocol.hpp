#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

namespace proto {
// every message is a json object whose "type" field is the tag below

// client -> server
struct Sync {
    constexpr static auto type = "sync";
};

struct ToggleMic {
    constexpr static auto type = "toggle_mic";

    bool enabled;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ToggleMic, enabled);
};

struct ToggleCam {
    constexpr static auto type = "toggle_cam";

    bool enabled;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ToggleCam, enabled);
};

struct ToggleThink {
    constexpr static auto type = "toggle_think";

    bool enabled;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ToggleThink, enabled);
};

struct ShowFeed {
    constexpr static auto type = "show_feed";
};

struct VideoFrame {
    constexpr static auto type = "video_frame";

    std::string frame_base64;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(VideoFrame, frame_base64);
};

// both directions
struct Text {
    constexpr static auto type = "text";

    std::string text;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Text, text);
};

// uplink 16kHz, downlink 24kHz pcm16
struct Audio {
    constexpr static auto type = "audio";

    std::string audio_base64;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Audio, audio_base64);
};

// server -> client
struct Status {
    constexpr static auto type = "status";

    bool                connected = false;
    std::optional<bool> mic_on;
    std::optional<bool> cam_on;
};

struct Connection {
    constexpr static auto type = "connection";

    std::string status;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Connection, status);

    auto is_connected() const -> bool {
        return status == "connected";
    }
};

struct Volume {
    constexpr static auto type = "volume";

    double level;
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Volume, level);
};

struct Response {
    constexpr static auto type = "response";

    nlohmann::json data;
};

// well-formed message with a tag this client does not handle
struct Unknown {
    std::string type;
};

using Inbound = std::variant<Status, Connection, Text, Audio, Volume, Response, Unknown>;

auto from_json(const nlohmann::json& json, Status& status) -> void;
auto from_json(const nlohmann::json& json, Response& response) -> void;

template <class T>
auto build(const T& message) -> std::string {
    auto json = nlohmann::json::object();
    if constexpr(!std::is_empty_v<T>) {
        json = message;
    }
    json["type"] = T::type;
    return json.dump();
}

// returns nullopt if the payload is not json or a known tag misses its fields
auto parse(std::string_view raw) -> std::optional<Inbound>;
} // namespace proto
