#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

// Fixed number of workers over one bounded FIFO. Submit blocks while the queue is full.
// Join closes the queue, lets the workers drain it and waits for every one of them to exit.
class ThreadPool
{
public:
    ThreadPool(size_t ThreadCount, size_t QueueCapacity);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    bool Submit(std::function<void()> Job);

    void Close();
    void Join();

    size_t GetThreadCount() const { return Workers.size(); }

private:
    std::vector<std::thread> Workers;
    std::queue<std::function<void()>> Jobs;
    size_t Capacity;

    std::mutex ThreadPoolMutex;
    std::condition_variable JobAvailable_CV;
    std::condition_variable SpaceAvailable_CV;
    bool ThreadPoolClosed = false;

    void WorkerThread();
};
