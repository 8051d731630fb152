#include "ThreadPool.hpp"
#include "Logger.hpp"

#include <exception>

ThreadPool::ThreadPool(size_t ThreadCount, size_t QueueCapacity): Capacity(QueueCapacity == 0 ? 1 : QueueCapacity)
{
    for (size_t i = 0; i < ThreadCount; ++i)
    {
        Workers.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool()
{
    Join();
}

bool ThreadPool::Submit(std::function<void()> Job)
{
    {
        std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
        SpaceAvailable_CV.wait(Lock, [this] { return ThreadPoolClosed || Jobs.size() < Capacity; });
        if (ThreadPoolClosed)
        {
            return false;
        }
        Jobs.push(std::move(Job));
    }
    JobAvailable_CV.notify_one();
    return true;
}

void ThreadPool::Close()
{
    {
        std::lock_guard<std::mutex> Lock(ThreadPoolMutex);
        ThreadPoolClosed = true;
    }
    JobAvailable_CV.notify_all();
    SpaceAvailable_CV.notify_all();
}

void ThreadPool::Join()
{
    Close();
    for (std::thread& Worker : Workers)
    {
        if (Worker.joinable())
        {
            Worker.join();
        }
    }
}

void ThreadPool::WorkerThread()
{
    while (true)
    {
        std::function<void()> Job;
        {
            std::unique_lock<std::mutex> Lock(ThreadPoolMutex);
            JobAvailable_CV.wait(Lock, [this] { return ThreadPoolClosed || !Jobs.empty(); });
            if (Jobs.empty())
            {
                return; //Closed and drained
            }
            Job = std::move(Jobs.front());
            Jobs.pop();
        }
        SpaceAvailable_CV.notify_one();

        try
        {
            Job();
        }
        catch (const std::exception& e)
        {
            Log.Error(std::string("[ThreadPool] Job threw: ") + e.what());
        }
    }
}
