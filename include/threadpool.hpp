#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

// Worker pool for batch image analysis.
// A pool is created per batch and owned by the caller; tasks must not throw (batch tasks catch per image).
class ThreadPool {
public:
    // Launch 'numThreads' worker threads (at least one)
    explicit ThreadPool(size_t numThreads);

    // Add a task to the queue
    template<class F>
    void enqueue(F&& f);

    // Block until the queue is empty and no task is running
    void waitUntilEmpty();

    size_t size() const { return workers.size(); }

    // Stop all threads once the queue is drained, and join them
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void workerLoop();

    std::vector<std::thread> workers;        // Worker threads
    std::queue<std::function<void()>> tasks; // Task queue
    std::mutex queueMutex;                   // Protects tasks, activeTasks and stop
    std::condition_variable condition;       // Notify workers
    std::condition_variable emptyCondition;  // Notify waiters when everything is done
    bool stop = false;                       // Signal to stop workers
    int activeTasks = 0;                     // Tasks taken from the queue and still running
};

// Number of workers to use for a batch: the requested count, or the hardware concurrency when 0
inline unsigned int batchThreadCount(unsigned int requested) {
    if (requested > 0) return requested;
    unsigned int numThreads = std::thread::hardware_concurrency();
    return numThreads == 0 ? 4 : numThreads; // hardware_concurrency may be unknown
}

inline ThreadPool::ThreadPool(size_t numThreads) {
    if (numThreads == 0) numThreads = 1;
    for (size_t i = 0; i < numThreads; ++i)
        workers.emplace_back([this]() { workerLoop(); });
}

inline void ThreadPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            condition.wait(lock, [this]() { return stop || !tasks.empty(); });

            if (stop && tasks.empty())
                return;

            task = std::move(tasks.front());
            tasks.pop();
            // Counted under the same lock as the pop, so waitUntilEmpty never sees an empty queue
            // while a task is between the queue and its execution
            ++activeTasks;
        }

        task();

        {
            std::unique_lock<std::mutex> lock(queueMutex);
            --activeTasks;
            if (tasks.empty() && activeTasks == 0)
                emptyCondition.notify_all();
        }
    }
}

inline void ThreadPool::waitUntilEmpty() {
    std::unique_lock<std::mutex> lock(queueMutex);
    emptyCondition.wait(lock, [this]() { return tasks.empty() && activeTasks == 0; });
}

template<class F>
inline void ThreadPool::enqueue(F&& f) {
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        tasks.emplace(std::forward<F>(f));
    }
    condition.notify_one();
}

inline ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        stop = true;
    }
    condition.notify_all();
    for (auto& t : workers)
        t.join();
}
