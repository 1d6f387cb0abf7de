#include "Clipboard.hpp"
#include "../debug/Log.hpp"

#include <hyprutils/os/Process.hpp>

void NClipboard::copy(const std::string& text) {
    Hyprutils::OS::CProcess copy("wl-copy", {text});

    if (!copy.runAsync())
        Debug::log(ERR, "Couldn't run wl-copy, is wl-clipboard installed?");
}
