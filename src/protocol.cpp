#include "protocol.hpp"
#include "macros/assert.hpp"
#include "macros/logger.hpp"

namespace proto {
namespace {
auto logger = Logger("VOCALINK_PROTO");

auto read_flag(const nlohmann::json& json, const char* const key) -> std::optional<bool> {
    if(const auto it = json.find(key); it != json.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return std::nullopt;
}
} // namespace

auto from_json(const nlohmann::json& json, Status& status) -> void {
    json.at("connected").get_to(status.connected);
    status.mic_on = read_flag(json, "mic_on");
    status.cam_on = read_flag(json, "cam_on");
}

auto from_json(const nlohmann::json& json, Response& response) -> void {
    response.data = json.value("data", nlohmann::json());
}

auto parse(const std::string_view raw) -> std::optional<Inbound> {
    try {
        const auto json = nlohmann::json::parse(raw);
        ensure(json.is_object(), "message is not an object");
        const auto type = json.at("type").get<std::string>();
        if(type == Status::type) {
            return json.get<Status>();
        } else if(type == Connection::type) {
            return json.get<Connection>();
        } else if(type == Text::type) {
            return json.get<Text>();
        } else if(type == Audio::type) {
            return json.get<Audio>();
        } else if(type == Volume::type) {
            return json.get<Volume>();
        } else if(type == Response::type) {
            return json.get<Response>();
        } else {
            return Unknown{type};
        }
    } catch(const nlohmann::json::exception& e) {
        LOG_WARN(logger, "malformed message: {}", e.what());
        return std::nullopt;
    }
}
} // namespace proto
