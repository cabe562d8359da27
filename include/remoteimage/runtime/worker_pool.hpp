#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace remoteimage
{

class WorkerPool
{
  public:
    using Task = std::function<void()>;

    WorkerPool(size_t threads = 0); // threads = 0 --> one per hardware thread
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // false once shutdown has started
    bool submit(Task task);

    // Stops accepting work, drops tasks that have not started and joins the threads.
    // Safe to call more than once.
    void shutdown();

    size_t size() const
    {
        return _threads.size();
    }

    size_t pending() const;

  private:
    void run();

    std::vector<std::thread> _threads;

    mutable std::mutex _queue_mutex;
    std::condition_variable _queue_condition_variable;
    std::deque<Task> _tasks;
    bool _stopping = false;
};

} // namespace remoteimage
