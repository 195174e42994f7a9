#include "EventDispatcher.hpp"
#include <iostream>

namespace switch_watch::monitor
{
    EventDispatcher::EventDispatcher(history::HistoryRecorder &recorder)
        : m_recorder(recorder), m_running(false)
    {
    }

    EventDispatcher::~EventDispatcher()
    {
        Stop();
    }

    void EventDispatcher::Start()
    {
        if (m_running)
            return;
        m_queue.Reopen();
        m_running = true;
        m_worker = std::thread(&EventDispatcher::Run, this);
    }

    void EventDispatcher::Stop()
    {
        m_queue.Shutdown();
        if (m_worker.joinable())
            m_worker.join();
        m_running = false;
    }

    bool EventDispatcher::Dispatch(common::ChangeEvent event)
    {
        if (!m_queue.Push(std::move(event)))
        {
            std::cerr << "[EventDispatcher] Stopped, event dropped\n";
            return false;
        }
        return true;
    }

    std::size_t EventDispatcher::Pending() const
    {
        return m_queue.Size();
    }

    void EventDispatcher::Run()
    {
        while (auto event = m_queue.Pop())
        {
            try
            {
                m_recorder.Record(*event);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[EventDispatcher] Recorder failed on " << event->entity_type << " "
                          << event->entity_key << ": " << e.what() << "\n";
            }
        }
    }
}
