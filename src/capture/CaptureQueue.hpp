#pragma once

#include "../picker/Sampler.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

// One capture somebody is waiting for. Shared between the waiter and the
// thread that talks to the compositor.
struct SCaptureRequest {
    int                                    monitor = -1;
    CBox                                   region; // device pixels

    // set by the waiter once it stopped waiting
    std::atomic<bool>                      abandoned = false;

    // first call wins
    void                                   finish(CPickResult<SPixelBlock> result);

    std::promise<CPickResult<SPixelBlock>> promise;

  private:
    std::atomic<bool>                      m_bFinished = false;
};

// Hands capture requests from waiting threads to the one thread that can
// serve them. A request whose waiter timed out is never started.
class CCaptureQueue {
  public:
    // Any thread. Queues the request, calls wake and waits up to timeout.
    CPickResult<SPixelBlock>         submit(int monitor, const CBox& region, std::chrono::milliseconds timeout, const std::function<void()>& wake);

    // Serving thread. The oldest request that still has a waiter, or null.
    // Abandoned requests in front of it are failed and dropped.
    std::shared_ptr<SCaptureRequest> next();

    // fails everything queued, later submits fail right away
    void                             close(const std::string& reason);
    bool                             closed() const;

    size_t                           queued();

  private:
    std::mutex                                   m_mtQueue;
    std::deque<std::shared_ptr<SCaptureRequest>> m_queue;
    std::atomic<bool>                            m_bClosed = false;
    std::string                                  m_sCloseReason;
};
