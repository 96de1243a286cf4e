/**
 * @file ut_QueueEvent.cpp
 * @brief Google Test suite for QueueEvent signaling.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "stratum/CpuQueue.hpp"
#include "stratum/Errors.hpp"
#include "stratum/QueueEvent.hpp"

using namespace stratum;

namespace Test
{

/**
 * @test QUEUE_EVENT.starts_unsignaled
 */
TEST(QUEUE_EVENT, starts_unsignaled)
{
    QueueEvent e;
    EXPECT_FALSE(e.is_signaled());
    EXPECT_FALSE(e.get_recorded_time().has_value());
}

/**
 * @test QUEUE_EVENT.ids_are_unique
 */
TEST(QUEUE_EVENT, ids_are_unique)
{
    QueueEvent a;
    QueueEvent b;
    EXPECT_NE(a.get_id(), b.get_id());
}

/**
 * @test QUEUE_EVENT.signal_releases_waiter
 * @brief A thread blocked in wait() resumes once another thread signals.
 */
TEST(QUEUE_EVENT, signal_releases_waiter)
{
    QueueEvent e;
    bool resumed = false;
    std::thread waiter([&]()
    {
        e.wait();
        resumed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    e.signal();
    waiter.join();

    EXPECT_TRUE(resumed);
    EXPECT_TRUE(e.is_signaled());
}

/**
 * @test QUEUE_EVENT.reset_rearms
 */
TEST(QUEUE_EVENT, reset_rearms)
{
    QueueEvent e;
    e.signal();
    ASSERT_TRUE(e.is_signaled());
    e.reset();
    EXPECT_FALSE(e.is_signaled());
}

/**
 * @test QUEUE_EVENT.timing_records_signal_time
 */
TEST(QUEUE_EVENT, timing_records_signal_time)
{
    QueueEvent start(QueueEventOptions::TIMING);
    QueueEvent stop(QueueEventOptions::TIMING);
    start.signal();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    stop.signal();

    ASSERT_TRUE(start.get_recorded_time().has_value());
    EXPECT_GT(stop.elapsed_since(start), 0.0);
}

/**
 * @test QUEUE_EVENT.elapsed_without_timing_throws
 */
TEST(QUEUE_EVENT, elapsed_without_timing_throws)
{
    QueueEvent a;
    QueueEvent b;
    a.signal();
    b.signal();
    EXPECT_FALSE(a.get_recorded_time().has_value());
    EXPECT_THROW(b.elapsed_since(a), validation_error);
}

/**
 * @test QUEUE_EVENT.disabled_never_blocks
 */
TEST(QUEUE_EVENT, disabled_never_blocks)
{
    QueueEvent e(QueueEventOptions::DISABLED);
    e.wait();
    EXPECT_FALSE(e.is_signaled());
}

/**
 * @test QUEUE_EVENT.options_combine
 */
TEST(QUEUE_EVENT, options_combine)
{
    const QueueEventOptions opts =
        QueueEventOptions::TIMING | QueueEventOptions::INTERPROCESS;
    EXPECT_TRUE(has_option(opts, QueueEventOptions::TIMING));
    EXPECT_TRUE(has_option(opts, QueueEventOptions::INTERPROCESS));
    EXPECT_FALSE(has_option(opts, QueueEventOptions::DISABLED));

    QueueEvent e(opts);
    EXPECT_EQ(e.get_options(), opts);
}

/**
 * @test QUEUE_EVENT.sync_record_signals_before_return
 */
TEST(QUEUE_EVENT, sync_record_signals_before_return)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto e = q.record(q.create_event());
    EXPECT_TRUE(e->is_signaled());
}

/**
 * @test QUEUE_EVENT.record_rearms_signaled_event
 * @brief A fresh record on an async queue resets the event until the
 * queue reaches it.
 */
TEST(QUEUE_EVENT, record_rearms_signaled_event)
{
    AsyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto gate = std::make_shared<QueueEvent>();
    auto e = std::make_shared<QueueEvent>();
    e->signal();

    q.wait(gate);
    q.record(e);
    EXPECT_FALSE(e->is_signaled());

    gate->signal();
    q.wait_for_completion();
    EXPECT_TRUE(e->is_signaled());
}

/**
 * @test QUEUE_EVENT.stale_generation_does_not_satisfy_wait
 */
TEST(QUEUE_EVENT, stale_generation_does_not_satisfy_wait)
{
    QueueEvent e;
    const uint64_t first = e.get_armed_generation();
    const uint64_t second = e.reset();
    EXPECT_GT(second, first);

    e.signal(first);
    EXPECT_FALSE(e.is_signaled());

    e.signal(second);
    EXPECT_TRUE(e.is_signaled());

    e.signal(first);
    EXPECT_TRUE(e.is_signaled());
}

/**
 * @test QUEUE_EVENT.reused_event_orders_latest_record
 * @brief An event recorded twice on a held producer releases the
 * consumer only after the work queued before the second record.
 */
TEST(QUEUE_EVENT, reused_event_orders_latest_record)
{
    AsyncQueue producer(0, "dev:0_q0", MemoryKind::UNIFIED);
    AsyncQueue consumer(0, "dev:0_q1", MemoryKind::UNIFIED);

    constexpr int rounds = 100;
    int stale = 0;
    for (int round = 0; round < rounds; ++round)
    {
        auto gate = std::make_shared<QueueEvent>();
        auto e = producer.create_event();
        std::atomic<int> value {0};
        std::atomic<int> seen {-1};

        producer.wait(gate);
        producer.submit([&value]() { value.store(1); });
        producer.record(e);
        producer.submit([&value]()
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            value.store(2);
        });
        producer.record(e);

        consumer.wait(e);
        consumer.submit([&value, &seen]() { seen.store(value.load()); });

        gate->signal();
        producer.wait_for_completion();
        consumer.wait_for_completion();

        if (seen.load() != 2)
        {
            ++stale;
        }
    }
    EXPECT_EQ(stale, 0);
}

/**
 * @test QUEUE_EVENT.disabled_record_is_noop
 */
TEST(QUEUE_EVENT, disabled_record_is_noop)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto e = q.record(q.create_event(QueueEventOptions::DISABLED));
    EXPECT_FALSE(e->is_signaled());
    q.wait(e);
}

/**
 * @test QUEUE_EVENT.default_options_from_queue
 */
TEST(QUEUE_EVENT, default_options_from_queue)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    q.set_default_event_options(QueueEventOptions::TIMING);
    auto e = q.record(q.create_event());
    EXPECT_TRUE(e->get_recorded_time().has_value());
}

} // namespace Test
