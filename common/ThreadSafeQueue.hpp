#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace switch_watch::common
{
    // Multi-producer FIFO. After Shutdown, Pop keeps returning queued items
    // and yields nullopt only once the queue is empty.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_shutdown = false;

    public:
        // Returns false once the queue has been shut down.
        bool Push(T value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown)
                return false;
            m_queue.push(std::move(value));
            m_cv.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        void Shutdown()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_shutdown = true;
            m_cv.notify_all();
        }

        void Reopen()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_shutdown = false;
        }

        bool Empty() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }
    };
}
