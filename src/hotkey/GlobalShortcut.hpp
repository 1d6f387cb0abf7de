#pragma once

#include "../defines.hpp"
#include "../picker/Types.hpp"

#include <functional>

// A hyprland_global_shortcuts_v1 shortcut. The compositor owns the key
// binding, we only learn about presses.
class CGlobalShortcut {
  public:
    CGlobalShortcut(SP<CCHyprlandGlobalShortcutsManagerV1> manager, const std::string& id, const std::string& description, const std::string& trigger,
                    std::function<void()> onPressed);
    ~CGlobalShortcut();

    static CPickResult<SP<CGlobalShortcut>> registerShortcut(SP<CCHyprlandGlobalShortcutsManagerV1> manager, const std::string& trigger, std::function<void()> onPressed);

    const std::string&                      trigger() const;

  private:
    SP<CCHyprlandGlobalShortcutV1> m_pShortcut;
    std::string                    m_sTrigger;
    std::function<void()>          m_onPressed;
};
