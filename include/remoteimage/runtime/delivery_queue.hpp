#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace remoteimage
{

/**
 * The consumer's delivery context. Any thread may post notifications, they
 * only ever run on the thread that drains the queue.
 */
class DeliveryQueue
{
  public:
    using Notification = std::function<void()>;

    void post(Notification notification);

    // Runs everything queued so far on the calling thread. If a notification
    // throws, the exception propagates and the ones after it stay queued.
    size_t run_pending();

    // Waits up to timeout for something to arrive, then runs everything queued
    size_t wait_and_run(std::chrono::milliseconds timeout);

    size_t pending() const;

  private:
    mutable std::mutex _mutex;
    std::condition_variable _condition_variable;
    std::deque<Notification> _notifications;
};

} // namespace remoteimage
