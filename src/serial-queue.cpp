#include "classnote/serial-queue.h"
#include "classnote/log.h"

#include <exception>

namespace classnote {

serial_queue::serial_queue() {
    m_thread = std::thread(&serial_queue::worker_loop, this);
}

serial_queue::~serial_queue() {
    stop();
}

bool serial_queue::post(task t) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return false;
        }
        m_tasks.push_back(std::move(t));
    }
    m_cv.notify_one();
    return true;
}

void serial_queue::drain() {
    if (is_current()) {
        // would wait for ourselves
        return;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv_idle.wait(lock, [&]{ return m_tasks.empty() && !m_busy; });
}

void serial_queue::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

bool serial_queue::is_current() const {
    return std::this_thread::get_id() == m_thread.get_id();
}

void serial_queue::worker_loop() {
    while (true) {
        task t;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]{ return m_stopped || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                // stopped and nothing left to run
                m_cv_idle.notify_all();
                return;
            }
            t = std::move(m_tasks.front());
            m_tasks.pop_front();
            m_busy = true;
        }

        try {
            t();
        } catch (const std::exception & e) {
            CLASSNOTE_LOG_ERROR("%s: task failed: %s\n", __func__, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            if (m_tasks.empty()) {
                m_cv_idle.notify_all();
            }
        }
    }
}

} // namespace classnote
