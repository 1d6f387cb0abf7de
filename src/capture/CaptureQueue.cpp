#include "CaptureQueue.hpp"
#include "../debug/Log.hpp"

#include <format>

void SCaptureRequest::finish(CPickResult<SPixelBlock> result) {
    if (m_bFinished.exchange(true))
        return;

    promise.set_value(std::move(result));
}

CPickResult<SPixelBlock> CCaptureQueue::submit(int monitor, const CBox& region, std::chrono::milliseconds timeout, const std::function<void()>& wake) {
    auto request     = std::make_shared<SCaptureRequest>();
    request->monitor = monitor;
    request->region  = region;
    auto future      = request->promise.get_future();

    {
        std::lock_guard<std::mutex> lg(m_mtQueue);
        if (m_bClosed)
            return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, m_sCloseReason);
        m_queue.emplace_back(request);
    }

    if (wake)
        wake();

    if (future.wait_for(timeout) != std::future_status::ready) {
        request->abandoned = true;

        // let the serving thread drop it now rather than on the next request
        if (wake)
            wake();

        return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, std::format("the compositor didn't deliver a frame within {}ms", timeout.count()));
    }

    return future.get();
}

std::shared_ptr<SCaptureRequest> CCaptureQueue::next() {
    std::lock_guard<std::mutex> lg(m_mtQueue);

    while (!m_queue.empty()) {
        auto request = std::move(m_queue.front());
        m_queue.pop_front();

        if (!request->abandoned)
            return request;

        Debug::log(TRACE, "Capture: dropping a request nobody waits for anymore");
        request->finish(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "request abandoned"));
    }

    return nullptr;
}

void CCaptureQueue::close(const std::string& reason) {
    std::deque<std::shared_ptr<SCaptureRequest>> pending;

    {
        std::lock_guard<std::mutex> lg(m_mtQueue);
        m_bClosed      = true;
        m_sCloseReason = reason;
        pending.swap(m_queue);
    }

    for (auto& request : pending) {
        request->finish(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, reason));
    }
}

bool CCaptureQueue::closed() const {
    return m_bClosed;
}

size_t CCaptureQueue::queued() {
    std::lock_guard<std::mutex> lg(m_mtQueue);
    return m_queue.size();
}
