#include "GraphExecutor.hpp"

#include <stdexcept>

namespace graph
{

GraphExecutor::GraphExecutor()
{
    m_worker = std::thread(&GraphExecutor::processLoop, this);
}

GraphExecutor::~GraphExecutor()
{
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_stop = true;
    }
    m_condition.notify_all();
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

void GraphExecutor::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        if (m_stop)
        {
            throw std::runtime_error("enqueue on stopped GraphExecutor");
        }
        m_tasks.push(std::move(task));
    }
    m_condition.notify_one();
}

void GraphExecutor::processLoop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
            // Drain what was issued before shutdown so no consumer waits forever.
            if (m_stop && m_tasks.empty())
            {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }
        task();
    }
}

} // namespace graph
