#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// One background thread running jobs in the order they were pushed.
class CWorkQueue {
  public:
    CWorkQueue();
    ~CWorkQueue();

    // false once stopped, the job is dropped
    bool   push(std::function<void()> job);
    // runs what is already queued, then joins
    void   stop();

    size_t pending();

  private:
    void                              run();

    std::mutex                        m_mtQueue;
    std::condition_variable           m_cvQueue;
    std::deque<std::function<void()>> m_qJobs;
    bool                              m_bStopping = false;
    std::thread                       m_thread;
};
