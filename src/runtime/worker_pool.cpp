#include <remoteimage/runtime/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace remoteimage
{

WorkerPool::WorkerPool(size_t threads)
{
    if (threads == 0)
    {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }

    _threads.reserve(threads);
    for (size_t i = 0; i < threads; i++)
    {
        _threads.emplace_back([this]() { run(); });
    }
    spdlog::debug("Started worker pool with {} threads", threads);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(Task task)
{
    {
        std::lock_guard<std::mutex> guard(_queue_mutex);
        if (_stopping)
        {
            return false;
        }
        _tasks.emplace_back(std::move(task));
    }
    _queue_condition_variable.notify_one();
    return true;
}

void WorkerPool::shutdown()
{
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> guard(_queue_mutex);
        if (_stopping)
        {
            return;
        }
        _stopping = true;
        dropped = _tasks.size();
        _tasks.clear();
    }
    _queue_condition_variable.notify_all();

    for (auto &t : _threads)
    {
        if (t.joinable())
        {
            t.join();
        }
    }

    if (dropped > 0)
    {
        spdlog::debug("Worker pool shut down, dropped {} queued tasks", dropped);
    }
}

size_t WorkerPool::pending() const
{
    std::lock_guard<std::mutex> guard(_queue_mutex);
    return _tasks.size();
}

void WorkerPool::run()
{
    while (true)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(_queue_mutex);
            _queue_condition_variable.wait(lock, [this]() { return _stopping || !_tasks.empty(); });
            if (_stopping)
            {
                return;
            }
            task = std::move(_tasks.front());
            _tasks.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception &e)
        {
            spdlog::error("Worker task threw: {}", e.what());
        }
        catch (...)
        {
            spdlog::error("Worker task threw an unknown exception");
        }
    }
}

} // namespace remoteimage
