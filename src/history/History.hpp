#pragma once

#include "../picker/Types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

constexpr size_t HISTORY_CAPACITY = 100;

struct SColorEntry {
    std::string                id;
    std::string                hex;
    RGB                        rgb       = {0, 0, 0};
    uint64_t                   timestamp = 0; // unix ms
    std::optional<std::string> label;

    bool                       operator==(const SColorEntry&) const = default;
};

void to_json(nlohmann::json& j, const SColorEntry& entry);

using CHistorySnapshot = std::shared_ptr<const std::vector<SColorEntry>>;

// Newest first, bounded, persisted as one JSON array. Every mutation is
// written to disk before it becomes visible in memory.
class CHistoryStore {
  public:
    CHistoryStore(std::string path, size_t capacity = HISTORY_CAPACITY);

    // Replaces the in-memory state with the file contents. A missing file is
    // an empty history, a corrupt one is moved aside to <path>.corrupt.
    // Returns the number of entries loaded.
    CPickResult<size_t>      load();

    CPickResult<SColorEntry> add(const SColorSample& sample);
    CPickResult<SColorEntry> add(const SColorInfo& info);

    // unknown ids are fine and don't touch the file
    CPickResult<void>        remove(const std::string& id);
    // empty text drops the label
    CPickResult<void>        relabel(const std::string& id, const std::string& text);
    CPickResult<void>        clear();
    CPickResult<void>        replace(const std::vector<SColorEntry>& entries);

    // rewrites the current snapshot
    CPickResult<void>        flush();

    CHistorySnapshot         snapshot() const;
    std::vector<SColorEntry> entries() const;
    size_t                   size() const;
    const std::string&       path() const;

    // for tests, returns unix ms
    void                     setClock(std::function<uint64_t()> clock);

    // $XDG_DATA_HOME/hyprsnap/color_history.json, or under ~/.local/share
    static std::string                  defaultPath();

    static std::optional<SColorEntry>   entryFromJson(const nlohmann::json& j);
    // malformed elements are skipped and counted, hex is always re-derived
    static std::vector<SColorEntry>     entriesFromJson(const nlohmann::json& j, size_t* skipped = nullptr);

  private:
    CPickResult<SColorEntry> addRGB(const RGB& rgb);
    CPickResult<void>        commit(std::vector<SColorEntry>&& next);
    CPickResult<void>        writeDocument(const std::vector<SColorEntry>& entries);
    uint64_t                 nextTimestamp();
    std::string              generateId(uint64_t timestamp);

    std::string                           m_sPath;
    size_t                                m_iCapacity = HISTORY_CAPACITY;

    std::atomic<CHistorySnapshot>         m_pSnapshot;

    // held for the whole read-modify-write of a mutation
    std::mutex                            m_mtWrite;

    std::function<uint64_t()>             m_clock;
    uint64_t                              m_iLastTimestamp = 0;
    std::mt19937                          m_rng;
};
