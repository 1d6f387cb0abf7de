#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

// a fresh directory under /tmp, removed with everything in it
class CTempDir {
  public:
    CTempDir() {
        std::string templ = (std::filesystem::temp_directory_path() / "hyprsnap-test-XXXXXX").string();
        if (mkdtemp(templ.data()))
            m_path = templ;
    }

    ~CTempDir() {
        std::error_code ec;
        if (!m_path.empty())
            std::filesystem::remove_all(m_path, ec);
    }

    std::string path(const std::string& name) const {
        return (m_path / name).string();
    }

    bool good() const {
        return !m_path.empty();
    }

  private:
    std::filesystem::path m_path;
};
