#include "GlobalShortcut.hpp"

constexpr const char* SHORTCUT_APP_ID      = "hyprsnap";
constexpr const char* SHORTCUT_ID          = "pick";
constexpr const char* SHORTCUT_DESCRIPTION = "Pick a color from the screen";

CGlobalShortcut::CGlobalShortcut(SP<CCHyprlandGlobalShortcutsManagerV1> manager, const std::string& id, const std::string& description, const std::string& trigger,
                                 std::function<void()> onPressed) : m_sTrigger(trigger), m_onPressed(onPressed) {
    m_pShortcut = makeShared<CCHyprlandGlobalShortcutV1>(manager->sendRegisterShortcut(id.c_str(), SHORTCUT_APP_ID, description.c_str(), trigger.c_str()));

    m_pShortcut->setPressed([this](CCHyprlandGlobalShortcutV1* r, uint32_t tv_sec_hi, uint32_t tv_sec_lo, uint32_t tv_nsec) {
        Debug::log(TRACE, "Global shortcut %s pressed", m_sTrigger.c_str());

        if (m_onPressed)
            m_onPressed();
    });

    // acting on press is enough, a held key must not toggle twice
    m_pShortcut->setReleased([](CCHyprlandGlobalShortcutV1* r, uint32_t tv_sec_hi, uint32_t tv_sec_lo, uint32_t tv_nsec) { ; });
}

CGlobalShortcut::~CGlobalShortcut() {
    m_pShortcut.reset();
}

CPickResult<SP<CGlobalShortcut>> CGlobalShortcut::registerShortcut(SP<CCHyprlandGlobalShortcutsManagerV1> manager, const std::string& trigger,
                                                                    std::function<void()> onPressed) {
    if (!manager)
        return pickError(PICK_ERROR_HOTKEY_REGISTRATION_FAILED, "the compositor doesn't support hyprland_global_shortcuts_v1");

    if (trigger.empty())
        return pickError(PICK_ERROR_HOTKEY_REGISTRATION_FAILED, "empty shortcut label");

    auto shortcut = makeShared<CGlobalShortcut>(manager, SHORTCUT_ID, SHORTCUT_DESCRIPTION, trigger, onPressed);

    Debug::log(LOG, "Registered global shortcut %s:%s (%s), bind it with: bind = <mods>, <key>, global, %s:%s", SHORTCUT_APP_ID, SHORTCUT_ID, shortcut->trigger().c_str(),
               SHORTCUT_APP_ID, SHORTCUT_ID);

    return shortcut;
}

const std::string& CGlobalShortcut::trigger() const {
    return m_sTrigger;
}
