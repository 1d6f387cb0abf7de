#include "Notify.hpp"
#include "../debug/Log.hpp"

#include <format>
#include <hyprutils/os/Process.hpp>

void NNotify::send(const std::string& hexColor, const std::string& formattedColor) {
    const std::string NOTIFYBODY = std::format("<span>You selected the color: <span color='{}'><b>{}</b></span></span>", hexColor, formattedColor);

    Hyprutils::OS::CProcess notify("notify-send", {"-t", "5000", "-i", "color-select-symbolic", "-a", "hyprsnap", "Color Picker", NOTIFYBODY});

    if (!notify.runAsync())
        Debug::log(WARN, "Couldn't run notify-send");
}

void NNotify::sendError(const std::string& message) {
    Hyprutils::OS::CProcess notify("notify-send", {"-u", "critical", "-t", "5000", "-i", "dialog-error-symbolic", "-a", "hyprsnap", "Color Picker", message});

    if (!notify.runAsync())
        Debug::log(WARN, "Couldn't run notify-send");
}
