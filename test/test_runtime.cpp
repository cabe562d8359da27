#include <remoteimage/runtime/delivery_queue.hpp>
#include <remoteimage/runtime/worker_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace remoteimage;
using namespace std::chrono_literals;

TEST(worker_pool, runs_submitted_tasks)
{
    std::atomic<int> counter{0};
    {
        WorkerPool pool(3);
        EXPECT_EQ(pool.size(), 3u);

        std::vector<std::promise<void>> done(20);
        std::vector<std::future<void>> finished;
        for (auto &d : done)
        {
            finished.push_back(d.get_future());
        }
        for (auto &d : done)
        {
            ASSERT_TRUE(pool.submit([&counter, &d]() {
                counter++;
                d.set_value();
            }));
        }
        for (auto &f : finished)
        {
            f.wait();
        }
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(worker_pool, zero_threads_means_hardware_concurrency)
{
    WorkerPool pool(0);
    EXPECT_GE(pool.size(), 1u);
}

TEST(worker_pool, rejects_work_after_shutdown)
{
    WorkerPool pool(1);
    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.submit([]() {}));
}

TEST(worker_pool, shutdown_drops_queued_tasks)
{
    // GIVEN: a single worker blocked on a task with more work queued behind it
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> started;
    std::future<void> has_started = started.get_future();
    std::atomic<int> ran{0};

    WorkerPool pool(1);
    pool.submit([&started, released]() {
        started.set_value();
        released.wait();
    });
    has_started.wait();
    for (int i = 0; i < 5; i++)
    {
        pool.submit([&ran]() { ran++; });
    }
    EXPECT_EQ(pool.pending(), 5u);

    // WHEN: the pool shuts down while the first task is still running
    std::thread stopper([&pool]() { pool.shutdown(); });
    while (pool.pending() != 0)
    {
        std::this_thread::yield();
    }
    release.set_value();
    stopper.join();

    // THEN: the queued tasks never ran
    EXPECT_EQ(ran.load(), 0);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(delivery_queue, runs_notifications_on_draining_thread)
{
    DeliveryQueue queue;
    std::thread::id ran_on;

    std::thread producer([&queue, &ran_on]() { queue.post([&ran_on]() { ran_on = std::this_thread::get_id(); }); });
    producer.join();

    EXPECT_EQ(queue.pending(), 1u);
    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(ran_on, std::this_thread::get_id());
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(delivery_queue, preserves_post_order)
{
    DeliveryQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 5; i++)
    {
        queue.post([&order, i]() { order.push_back(i); });
    }
    queue.run_pending();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(delivery_queue, wait_and_run_wakes_on_post)
{
    DeliveryQueue queue;
    bool ran = false;

    std::thread producer([&queue, &ran]() {
        std::this_thread::sleep_for(20ms);
        queue.post([&ran]() { ran = true; });
    });

    size_t count = 0;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (count == 0 && std::chrono::steady_clock::now() < deadline)
    {
        count = queue.wait_and_run(1s);
    }
    producer.join();

    EXPECT_EQ(count, 1u);
    EXPECT_TRUE(ran);
}

TEST(delivery_queue, wait_and_run_times_out_when_idle)
{
    DeliveryQueue queue;
    EXPECT_EQ(queue.wait_and_run(5ms), 0u);
}

TEST(delivery_queue, follow_up_posts_run_on_next_drain)
{
    DeliveryQueue queue;
    int runs = 0;
    queue.post([&queue, &runs]() {
        runs++;
        queue.post([&runs]() { runs++; });
    });

    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(delivery_queue, throwing_notification_keeps_the_rest_queued)
{
    // GIVEN: a notification that throws with others queued behind it
    DeliveryQueue queue;
    std::vector<int> order;
    queue.post([&order]() { order.push_back(0); });
    queue.post([]() { throw std::runtime_error("observer failed"); });
    queue.post([&order]() { order.push_back(2); });
    queue.post([&order]() { order.push_back(3); });

    // WHEN: the queue is drained
    EXPECT_THROW(queue.run_pending(), std::runtime_error);

    // THEN: nothing after the failure is lost, the next drain runs it in order
    EXPECT_EQ(order, (std::vector<int>{0}));
    EXPECT_EQ(queue.pending(), 2u);
    EXPECT_EQ(queue.run_pending(), 2u);
    EXPECT_EQ(order, (std::vector<int>{0, 2, 3}));
}

TEST(worker_pool, throwing_task_does_not_kill_the_worker)
{
    WorkerPool pool(1);
    std::promise<void> done;
    std::future<void> finished = done.get_future();

    ASSERT_TRUE(pool.submit([]() { throw std::runtime_error("task failed"); }));
    ASSERT_TRUE(pool.submit([]() { throw 7; }));
    ASSERT_TRUE(pool.submit([&done]() { done.set_value(); }));

    EXPECT_EQ(finished.wait_for(5s), std::future_status::ready);
}
