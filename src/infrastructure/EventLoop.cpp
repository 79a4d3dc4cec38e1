/**
 * @file EventLoop.cpp
 * @brief Implementation of EventLoop.
 */

#include "infrastructure/EventLoop.hpp"

#include <thread>

namespace scribeline::infrastructure {

EventLoop::TaskId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds{0};
    }
    const TaskId id = m_nextId++;
    const Key key{now() + delay, id};
    m_queue.emplace(key, std::move(task));
    m_index.emplace(id, key);
    return id;
}

bool EventLoop::cancel(TaskId id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }
    m_queue.erase(it->second);
    m_index.erase(it);
    return true;
}

EventLoop::Clock::time_point EventLoop::now() const {
    return Clock::now();
}

void EventLoop::run() {
    m_stopped = false;
    while (!m_stopped && !m_queue.empty()) {
        auto first = m_queue.begin();
        const auto due = first->first.first;
        const auto current = now();
        if (due > current) {
            std::this_thread::sleep_for(due - current);
            continue;
        }
        Task task = std::move(first->second);
        m_index.erase(first->first.second);
        m_queue.erase(first);
        task();
    }
}

} // namespace scribeline::infrastructure
