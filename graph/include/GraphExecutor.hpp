#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace graph
{

/// Single worker thread running submitted graph runs in FIFO order.
class GraphExecutor
{
public:
    GraphExecutor();
    ~GraphExecutor();

    GraphExecutor(const GraphExecutor&) = delete;
    GraphExecutor& operator=(const GraphExecutor&) = delete;

    /// Enqueues a run and returns immediately. Pending runs finish before destruction.
    void enqueue(std::function<void()> task);

private:
    void processLoop();

    std::thread m_worker;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_queueMutex;
    std::condition_variable m_condition;
    bool m_stop = false;
};

} // namespace graph
