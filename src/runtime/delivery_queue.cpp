#include <remoteimage/runtime/delivery_queue.hpp>

#include <iterator>

namespace remoteimage
{

void DeliveryQueue::post(Notification notification)
{
    {
        std::lock_guard<std::mutex> guard(_mutex);
        _notifications.emplace_back(std::move(notification));
    }
    _condition_variable.notify_all();
}

size_t DeliveryQueue::run_pending()
{
    std::deque<Notification> batch;
    {
        std::lock_guard<std::mutex> guard(_mutex);
        batch.swap(_notifications);
    }

    // run outside the lock so notifications can post follow-ups
    size_t ran = 0;
    try
    {
        while (!batch.empty())
        {
            Notification n = std::move(batch.front());
            batch.pop_front();
            n();
            ran++;
        }
    }
    catch (...)
    {
        // hand the rest back so the next drain still delivers it
        std::lock_guard<std::mutex> guard(_mutex);
        _notifications.insert(_notifications.begin(), std::make_move_iterator(batch.begin()),
                              std::make_move_iterator(batch.end()));
        throw;
    }
    return ran;
}

size_t DeliveryQueue::wait_and_run(std::chrono::milliseconds timeout)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition_variable.wait_for(lock, timeout, [this]() { return !_notifications.empty(); });
    }
    return run_pending();
}

size_t DeliveryQueue::pending() const
{
    std::lock_guard<std::mutex> guard(_mutex);
    return _notifications.size();
}

} // namespace remoteimage
