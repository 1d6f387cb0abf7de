#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

// Single slot, latest wins. The producer never waits for the consumer; an
// unconsumed value is simply replaced and counted as dropped.
template <typename T>
class CFrameChannel {
  public:
    void publish(T&& value) {
        std::function<void()> wake;
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            if (m_slot)
                m_iDropped++;
            m_slot = std::move(value);
            m_iPublished++;
            wake = m_wake;
        }

        if (wake)
            wake();
    }

    std::optional<T> take() {
        std::lock_guard<std::mutex> lg(m_mutex);
        std::optional<T>            out = std::move(m_slot);
        m_slot.reset();
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_slot.reset();
    }

    // called from the producer's thread after every publish
    void setWakeCallback(std::function<void()> wake) {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_wake = wake;
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lg(m_mutex);
        return m_iDropped;
    }

    uint64_t published() const {
        std::lock_guard<std::mutex> lg(m_mutex);
        return m_iPublished;
    }

  private:
    mutable std::mutex    m_mutex;
    std::optional<T>      m_slot;
    std::function<void()> m_wake;
    uint64_t              m_iDropped   = 0;
    uint64_t              m_iPublished = 0;
};
