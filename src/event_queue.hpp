#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

struct Event {
    enum Type { TICK, KEY, INTERRUPT };

    Type type = TICK;
    std::chrono::milliseconds delta{0};
    char key = 0;
};

// Single-consumer queue feeding the session engine. Producers are the ticker and input threads.
class EventQueue {
  public:
    void Push(const Event &event) {
        {
            std::lock_guard<std::mutex> lk(m_Mutex);
            m_Events.push_back(event);
        }
        m_Cv.notify_one();
    }

    Event WaitPop() {
        std::unique_lock<std::mutex> lk(m_Mutex);
        m_Cv.wait(lk, [&] { return !m_Events.empty(); });
        Event e = m_Events.front();
        m_Events.pop_front();
        return e;
    }

  private:
    std::mutex m_Mutex;
    std::condition_variable m_Cv;
    std::deque<Event> m_Events;
};
