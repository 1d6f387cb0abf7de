#include "Events.hpp"
#include "../helpers/Base64.hpp"

std::string NEvents::dump(const nlohmann::json& j, int indent) {
    // strings can carry raw bytes from a socket client or a compositor
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json NEvents::colorInfo(const SColorInfo& info) {
    return nlohmann::json{{"hex", info.hex}, {"rgb", info.rgb}, {"x", info.x}, {"y", info.y}};
}

std::string NEvents::colorPicked(const SColorInfo& info) {
    auto j     = colorInfo(info);
    j["event"] = "color-picked";
    return dump(j);
}

std::string NEvents::zoomPreview(const SPreviewFrame& frame, int x, int y) {
    const SColorInfo CENTER = {.hex = frame.center.hex, .rgb = frame.center.rgb, .x = x, .y = y};

    const nlohmann::json j = {
        {"event", "zoom-preview"},
        {"image_data", NBase64::encode(frame.image)},
        {"center_color", colorInfo(CENTER)},
        {"width", frame.width},
        {"height", frame.height},
    };

    return dump(j);
}

std::string NEvents::pickModeStarted() {
    return dump(nlohmann::json{{"event", "pick-mode-started"}});
}

std::string NEvents::pickModeStopped(const std::optional<SPickError>& error) {
    nlohmann::json j = {{"event", "pick-mode-stopped"}};

    if (error)
        j["error"] = {{"kind", errorKindName(error->kind)}, {"message", error->message}};

    return dump(j);
}
