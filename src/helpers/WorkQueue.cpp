#include "WorkQueue.hpp"

CWorkQueue::CWorkQueue() {
    m_thread = std::thread([this]() { run(); });
}

CWorkQueue::~CWorkQueue() {
    stop();
}

bool CWorkQueue::push(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lg(m_mtQueue);
        if (m_bStopping)
            return false;
        m_qJobs.emplace_back(std::move(job));
    }

    m_cvQueue.notify_one();
    return true;
}

size_t CWorkQueue::pending() {
    std::lock_guard<std::mutex> lg(m_mtQueue);
    return m_qJobs.size();
}

void CWorkQueue::stop() {
    {
        std::lock_guard<std::mutex> lg(m_mtQueue);
        m_bStopping = true;
    }
    m_cvQueue.notify_all();

    if (!m_thread.joinable())
        return;

    if (m_thread.get_id() == std::this_thread::get_id())
        m_thread.detach();
    else
        m_thread.join();
}

void CWorkQueue::run() {
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lk(m_mtQueue);
            m_cvQueue.wait(lk, [this] { return m_bStopping || !m_qJobs.empty(); });

            if (m_qJobs.empty())
                return;

            job = std::move(m_qJobs.front());
            m_qJobs.pop_front();
        }

        job();
    }
}
