#pragma once

#include "../picker/Types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// One JSON object per line, for --json-events and the control socket
namespace NEvents {
    // invalid UTF-8 becomes U+FFFD instead of throwing
    std::string    dump(const nlohmann::json& j, int indent = -1);

    nlohmann::json colorInfo(const SColorInfo& info);

    std::string    colorPicked(const SColorInfo& info);
    // x and y are the global logical position the frame was taken at
    std::string    zoomPreview(const SPreviewFrame& frame, int x, int y);
    std::string    pickModeStarted();
    std::string    pickModeStopped(const std::optional<SPickError>& error);
};
