#pragma once

#include <atomic>
#include <thread>
#include <vector>
#include "../common/ThreadSafeQueue.hpp"
#include "../history/HistoryRecorder.hpp"

namespace switch_watch::monitor
{
    // Hands change events to a HistoryRecorder on a worker thread so the
    // monitoring tick never waits on persistence. Delivery is FIFO.
    class EventDispatcher
    {
    public:
        explicit EventDispatcher(history::HistoryRecorder &recorder);
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher &) = delete;
        EventDispatcher &operator=(const EventDispatcher &) = delete;

        void Start();

        // Delivers everything already queued, then joins the worker.
        void Stop();

        bool Dispatch(common::ChangeEvent event);
        std::size_t Pending() const;
        bool IsRunning() const { return m_running; }

    private:
        void Run();

        history::HistoryRecorder &m_recorder;
        common::ThreadSafeQueue<common::ChangeEvent> m_queue;
        std::atomic<bool> m_running;
        std::thread m_worker;
    };
}
