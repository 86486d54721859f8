#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace classnote {

// Runs posted tasks one at a time, in order, on a dedicated thread.
class serial_queue {
public:
    using task = std::function<void()>;

    serial_queue();
    ~serial_queue();

    serial_queue(const serial_queue &) = delete;
    serial_queue & operator=(const serial_queue &) = delete;

    // returns false once the queue has been stopped
    bool post(task t);

    // block until every task posted before this call has run
    void drain();

    // run the remaining tasks and join the worker
    void stop();

    // true when called from a task running on this queue
    bool is_current() const;

private:
    void worker_loop();

    std::deque<task>        m_tasks;
    bool                    m_stopped = false;
    bool                    m_busy    = false;
    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_cv_idle;
    std::thread             m_thread;
};

} // namespace classnote
