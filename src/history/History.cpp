#include "History.hpp"
#include "../debug/Log.hpp"
#include "../helpers/Color.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <unistd.h>

void to_json(nlohmann::json& j, const SColorEntry& entry) {
    j = nlohmann::json{{"id", entry.id}, {"hex", entry.hex}, {"rgb", entry.rgb}, {"timestamp", entry.timestamp}};
    if (entry.label)
        j["label"] = *entry.label;
}

static bool isValidUTF8(const std::string& str) {
    try {
        (void)nlohmann::json(str).dump();
    } catch (const nlohmann::json::type_error& e) {
        Debug::log(TRACE, "History: rejected a string: %s", e.what());
        return false;
    }
    return true;
}

static uint64_t unixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

CHistoryStore::CHistoryStore(std::string path, size_t capacity) : m_sPath(std::move(path)), m_iCapacity(std::max<size_t>(1, capacity)), m_rng(std::random_device{}()) {
    m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>());
    m_clock = unixMillis;
}

std::string CHistoryStore::defaultPath() {
    const auto XDGDATAHOME = getenv("XDG_DATA_HOME");
    if (XDGDATAHOME && XDGDATAHOME[0] == '/')
        return std::string(XDGDATAHOME) + "/hyprsnap/color_history.json";

    const auto HOME = getenv("HOME");
    if (!HOME) {
        Debug::log(WARN, "Neither XDG_DATA_HOME nor HOME are set, keeping history in /tmp");
        return "/tmp/hyprsnap/color_history.json";
    }

    return std::string(HOME) + "/.local/share/hyprsnap/color_history.json";
}

void CHistoryStore::setClock(std::function<uint64_t()> clock) {
    std::lock_guard<std::mutex> lg(m_mtWrite);
    m_clock = clock ? clock : unixMillis;
}

CHistorySnapshot CHistoryStore::snapshot() const {
    return m_pSnapshot.load();
}

std::vector<SColorEntry> CHistoryStore::entries() const {
    return *m_pSnapshot.load();
}

size_t CHistoryStore::size() const {
    return m_pSnapshot.load()->size();
}

const std::string& CHistoryStore::path() const {
    return m_sPath;
}

std::optional<SColorEntry> CHistoryStore::entryFromJson(const nlohmann::json& j) {
    if (!j.is_object())
        return std::nullopt;

    const auto ID         = j.find("id");
    const auto COMPONENTS = j.find("rgb");
    const auto TS         = j.find("timestamp");

    if (ID == j.end() || !ID->is_string() || ID->get<std::string>().empty())
        return std::nullopt;

    if (COMPONENTS == j.end() || !COMPONENTS->is_array() || COMPONENTS->size() != 3)
        return std::nullopt;

    SColorEntry entry;
    entry.id = ID->get<std::string>();

    for (size_t i = 0; i < 3; ++i) {
        const auto& C = (*COMPONENTS)[i];
        if (!C.is_number_integer() || C.get<int64_t>() < 0 || C.get<int64_t>() > 255)
            return std::nullopt;
        entry.rgb[i] = (uint8_t)C.get<int64_t>();
    }

    if (TS == j.end() || !TS->is_number_integer() || TS->get<int64_t>() < 0)
        return std::nullopt;
    entry.timestamp = TS->get<uint64_t>();

    if (const auto LABEL = j.find("label"); LABEL != j.end() && !LABEL->is_null()) {
        if (!LABEL->is_string())
            return std::nullopt;
        if (!LABEL->get<std::string>().empty())
            entry.label = LABEL->get<std::string>();
    }

    // stored hex is only a convenience for readers of the file
    entry.hex = CColor::fromRGB(entry.rgb).toHex();

    return entry;
}

std::vector<SColorEntry> CHistoryStore::entriesFromJson(const nlohmann::json& j, size_t* skipped) {
    std::vector<SColorEntry>        result;
    std::unordered_set<std::string> seen;
    size_t                          bad = 0;

    if (j.is_array()) {
        for (auto& el : j) {
            auto entry = entryFromJson(el);
            if (!entry || seen.contains(entry->id)) {
                bad++;
                continue;
            }

            seen.insert(entry->id);
            result.emplace_back(std::move(*entry));
        }
    }

    if (skipped)
        *skipped = bad;

    return result;
}

CPickResult<size_t> CHistoryStore::load() {
    std::lock_guard<std::mutex> lg(m_mtWrite);

    std::error_code             ec;
    if (!std::filesystem::exists(m_sPath, ec)) {
        Debug::log(LOG, "History: no history at %s yet", m_sPath.c_str());
        m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>());
        return 0;
    }

    std::ifstream ifs(m_sPath, std::ios::binary);
    if (!ifs.good()) {
        Debug::log(ERR, "History: couldn't open %s, starting empty", m_sPath.c_str());
        m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>());
        return 0;
    }

    std::stringstream ss;
    ss << ifs.rdbuf();
    ifs.close();

    const auto CONTENT = ss.str();
    if (CONTENT.find_first_not_of(" \t\r\n") == std::string::npos) {
        m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>());
        return 0;
    }

    const auto DOC = nlohmann::json::parse(CONTENT, nullptr, false);
    if (DOC.is_discarded() || !DOC.is_array()) {
        const auto ASIDE = m_sPath + ".corrupt";
        if (rename(m_sPath.c_str(), ASIDE.c_str()) != 0)
            Debug::log(ERR, "History: %s is corrupt and couldn't be moved aside: %s", m_sPath.c_str(), strerror(errno));
        else
            Debug::log(ERR, "History: %s is corrupt, moved it to %s", m_sPath.c_str(), ASIDE.c_str());

        m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>());
        return 0;
    }

    size_t skipped = 0;
    auto   loaded  = entriesFromJson(DOC, &skipped);

    if (skipped)
        Debug::log(WARN, "History: skipped %zu malformed entries in %s", skipped, m_sPath.c_str());

    if (loaded.size() > m_iCapacity) {
        Debug::log(WARN, "History: %s holds %zu entries, keeping the newest %zu", m_sPath.c_str(), loaded.size(), m_iCapacity);
        loaded.resize(m_iCapacity);
    }

    for (auto& e : loaded) {
        m_iLastTimestamp = std::max(m_iLastTimestamp, e.timestamp);
    }

    const auto COUNT = loaded.size();
    m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>(std::move(loaded)));

    Debug::log(LOG, "History: loaded %zu entries from %s", COUNT, m_sPath.c_str());

    return COUNT;
}

uint64_t CHistoryStore::nextTimestamp() {
    m_iLastTimestamp = std::max(m_clock(), m_iLastTimestamp + 1);
    return m_iLastTimestamp;
}

std::string CHistoryStore::generateId(uint64_t timestamp) {
    constexpr const char*              DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, 35);

    std::string                        id = std::format("{}-", timestamp);
    for (int i = 0; i < 9; ++i) {
        id += DIGITS[dist(m_rng)];
    }

    return id;
}

CPickResult<SColorEntry> CHistoryStore::add(const SColorSample& sample) {
    return addRGB(sample.rgb);
}

CPickResult<SColorEntry> CHistoryStore::add(const SColorInfo& info) {
    return addRGB(info.rgb);
}

CPickResult<SColorEntry> CHistoryStore::addRGB(const RGB& rgb) {
    std::lock_guard<std::mutex> lg(m_mtWrite);

    const auto                  PREVTIMESTAMP = m_iLastTimestamp;
    const auto                  TIMESTAMP     = nextTimestamp();

    SColorEntry                 entry = {.id = generateId(TIMESTAMP), .hex = CColor::fromRGB(rgb).toHex(), .rgb = rgb, .timestamp = TIMESTAMP};

    const auto                  CURRENT = m_pSnapshot.load();
    std::vector<SColorEntry>    next;
    next.reserve(std::min(CURRENT->size() + 1, m_iCapacity));
    next.push_back(entry);
    for (auto& e : *CURRENT) {
        if (next.size() >= m_iCapacity)
            break;
        next.push_back(e);
    }

    if (auto res = commit(std::move(next)); !res) {
        m_iLastTimestamp = PREVTIMESTAMP;
        return std::unexpected(res.error());
    }

    Debug::log(TRACE, "History: added %s (%s)", entry.hex.c_str(), entry.id.c_str());

    return entry;
}

CPickResult<void> CHistoryStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lg(m_mtWrite);

    const auto                  CURRENT = m_pSnapshot.load();
    if (std::none_of(CURRENT->begin(), CURRENT->end(), [&](const auto& e) { return e.id == id; })) {
        Debug::log(TRACE, "History: remove of unknown id %s", id.c_str());
        return {};
    }

    std::vector<SColorEntry> next;
    next.reserve(CURRENT->size());
    std::copy_if(CURRENT->begin(), CURRENT->end(), std::back_inserter(next), [&](const auto& e) { return e.id != id; });

    return commit(std::move(next));
}

CPickResult<void> CHistoryStore::relabel(const std::string& id, const std::string& text) {
    if (!isValidUTF8(text))
        return pickError(PICK_ERROR_INVALID_ARGUMENT, "labels must be valid UTF-8");

    std::lock_guard<std::mutex> lg(m_mtWrite);

    const auto                  CURRENT = m_pSnapshot.load();
    std::vector<SColorEntry>    next    = *CURRENT;

    const auto                  IT = std::find_if(next.begin(), next.end(), [&](const auto& e) { return e.id == id; });
    if (IT == next.end())
        return pickError(PICK_ERROR_INVALID_ARGUMENT, std::format("no history entry with id {}", id));

    if (text.empty())
        IT->label.reset();
    else
        IT->label = text;

    return commit(std::move(next));
}

CPickResult<void> CHistoryStore::clear() {
    std::lock_guard<std::mutex> lg(m_mtWrite);
    return commit({});
}

CPickResult<void> CHistoryStore::replace(const std::vector<SColorEntry>& entries) {
    std::lock_guard<std::mutex>     lg(m_mtWrite);

    std::vector<SColorEntry>        next;
    std::unordered_set<std::string> seen;

    for (auto& e : entries) {
        if (next.size() >= m_iCapacity)
            break;

        if (e.id.empty() || seen.contains(e.id)) {
            Debug::log(WARN, "History: dropping entry with %s id from replace", e.id.empty() ? "an empty" : "a duplicate");
            continue;
        }

        seen.insert(e.id);
        auto& added = next.emplace_back(e);
        added.hex   = CColor::fromRGB(e.rgb).toHex();
        if (added.label && added.label->empty())
            added.label.reset();
    }

    uint64_t newest = 0;
    for (auto& e : next) {
        newest = std::max(newest, e.timestamp);
    }

    if (auto res = commit(std::move(next)); !res)
        return res;

    m_iLastTimestamp = std::max(m_iLastTimestamp, newest);
    return {};
}

CPickResult<void> CHistoryStore::flush() {
    std::lock_guard<std::mutex> lg(m_mtWrite);
    return writeDocument(*m_pSnapshot.load());
}

CPickResult<void> CHistoryStore::commit(std::vector<SColorEntry>&& next) {
    if (auto res = writeDocument(next); !res)
        return res;

    m_pSnapshot.store(std::make_shared<const std::vector<SColorEntry>>(std::move(next)));
    return {};
}

CPickResult<void> CHistoryStore::writeDocument(const std::vector<SColorEntry>& entries) {
    const std::filesystem::path TARGET = m_sPath;
    const auto                  DIR    = TARGET.has_parent_path() ? TARGET.parent_path() : std::filesystem::path{"."};

    std::error_code             ec;
    std::filesystem::create_directories(DIR, ec);
    if (ec)
        return pickError(PICK_ERROR_PERSISTENCE_WRITE_FAILED, std::format("couldn't create {}: {}", DIR.string(), ec.message()));

    const std::string DOC = nlohmann::json(entries).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";

    std::string       tmpPath = m_sPath + ".XXXXXX";
    const int         FD      = mkstemp(tmpPath.data());
    if (FD < 0)
        return pickError(PICK_ERROR_PERSISTENCE_WRITE_FAILED, std::format("couldn't create a temp file next to {}: {}", m_sPath, strerror(errno)));

    const auto FAIL = [&](const char* what) {
        const auto MSG = std::format("{} failed for {}: {}", what, tmpPath, strerror(errno));
        close(FD);
        unlink(tmpPath.c_str());
        Debug::log(ERR, "History: %s", MSG.c_str());
        return pickError(PICK_ERROR_PERSISTENCE_WRITE_FAILED, MSG);
    };

    size_t written = 0;
    while (written < DOC.size()) {
        const auto RET = write(FD, DOC.data() + written, DOC.size() - written);
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            return FAIL("write");
        }
        written += RET;
    }

    if (fsync(FD) != 0)
        return FAIL("fsync");

    if (close(FD) != 0) {
        const auto MSG = std::format("close failed for {}: {}", tmpPath, strerror(errno));
        unlink(tmpPath.c_str());
        return pickError(PICK_ERROR_PERSISTENCE_WRITE_FAILED, MSG);
    }

    if (rename(tmpPath.c_str(), m_sPath.c_str()) != 0) {
        const auto MSG = std::format("couldn't move {} over {}: {}", tmpPath, m_sPath, strerror(errno));
        unlink(tmpPath.c_str());
        Debug::log(ERR, "History: %s", MSG.c_str());
        return pickError(PICK_ERROR_PERSISTENCE_WRITE_FAILED, MSG);
    }

    // the rename itself is only durable once the directory is
    const int DIRFD = open(DIR.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (DIRFD >= 0) {
        if (fsync(DIRFD) != 0)
            Debug::log(WARN, "History: fsync of %s failed: %s", DIR.c_str(), strerror(errno));
        close(DIRFD);
    } else
        Debug::log(WARN, "History: couldn't open %s to sync it: %s", DIR.c_str(), strerror(errno));

    Debug::log(TRACE, "History: wrote %zu entries to %s", entries.size(), m_sPath.c_str());

    return {};
}
