/**
 * @file ut_DeviceQueue.cpp
 * @brief Google Test suite for the host CPU queues.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "stratum/CpuQueue.hpp"
#include "stratum/Errors.hpp"

using namespace stratum;

namespace Test
{

namespace
{

std::vector<float> read_floats(const DeviceMemory& m)
{
    std::vector<float> out(m.get_byte_count() / sizeof(float));
    std::memcpy(out.data(), m.get_data(), m.get_byte_count());
    return out;
}

void write_floats(DeviceMemory& m, const std::vector<float>& v)
{
    std::memcpy(m.get_data(), v.data(), v.size() * sizeof(float));
}

} // namespace

/**
 * @test DEVICE_QUEUE.allocate_host_memory
 */
TEST(DEVICE_QUEUE, allocate_host_memory)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto m = q.allocate(64);

    ASSERT_NE(m->get_data(), nullptr);
    EXPECT_EQ(m->get_byte_count(), 64u);
    EXPECT_EQ(m->get_device_index(), 0u);
    EXPECT_EQ(m->get_kind(), MemoryKind::UNIFIED);
    EXPECT_TRUE(m->is_host_accessible());
    EXPECT_TRUE(q.can_access(*m));
}

/**
 * @test DEVICE_QUEUE.allocate_zero_bytes
 */
TEST(DEVICE_QUEUE, allocate_zero_bytes)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto m = q.allocate(0);
    EXPECT_EQ(m->get_byte_count(), 0u);
}

/**
 * @test DEVICE_QUEUE.allocate_rejects_heap_index
 */
TEST(DEVICE_QUEUE, allocate_rejects_heap_index)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    EXPECT_THROW(q.allocate(16, 1), validation_error);
}

/**
 * @test DEVICE_QUEUE.host_memory_limit
 * @brief Requests over the configured limit raise allocation_error.
 */
TEST(DEVICE_QUEUE, host_memory_limit)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    q.set_host_memory_limit(128);

    EXPECT_EQ(q.max_allocation_bytes(), 128u);
    EXPECT_NO_THROW(q.allocate(128));
    EXPECT_THROW(q.allocate(129), allocation_error);
}

/**
 * @test DEVICE_QUEUE.memory_space
 */
TEST(DEVICE_QUEUE, memory_space)
{
    SyncQueue unified(3, "dev:3_q0", MemoryKind::UNIFIED);
    SyncQueue discrete(3, "dev:3_q1", MemoryKind::DISCRETE);
    EXPECT_EQ(unified.get_memory_space(), 0u);
    EXPECT_EQ(discrete.get_memory_space(), 3u);
}

/**
 * @test DEVICE_QUEUE.sync_copy_runs_inline
 */
TEST(DEVICE_QUEUE, sync_copy_runs_inline)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto src = q.allocate(4 * sizeof(float));
    auto dst = q.allocate(4 * sizeof(float));
    write_floats(*src, {1.0f, 2.0f, 3.0f, 4.0f});

    q.copy_async(src, dst);
    EXPECT_EQ(read_floats(*dst), (std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f}));
}

/**
 * @test DEVICE_QUEUE.copy_size_mismatch
 */
TEST(DEVICE_QUEUE, copy_size_mismatch)
{
    SyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto src = q.allocate(16);
    auto dst = q.allocate(8);
    EXPECT_THROW(q.copy_async(src, dst), validation_error);
    EXPECT_THROW(q.copy_async(nullptr, dst), validation_error);
}

/**
 * @test DEVICE_QUEUE.zero_fill
 */
TEST(DEVICE_QUEUE, zero_fill)
{
    AsyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    auto m = q.allocate(3 * sizeof(float));
    write_floats(*m, {5.0f, 6.0f, 7.0f});

    q.zero_async(m);
    q.wait_for_completion();
    EXPECT_EQ(read_floats(*m), (std::vector<float>{0.0f, 0.0f, 0.0f}));
}

/**
 * @test DEVICE_QUEUE.async_runs_in_order
 */
TEST(DEVICE_QUEUE, async_runs_in_order)
{
    AsyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    std::vector<int> seen;
    for (int i = 0; i < 100; ++i)
    {
        q.submit([&seen, i]() { seen.push_back(i); });
    }
    q.wait_for_completion();

    ASSERT_EQ(seen.size(), 100u);
    for (int i = 0; i < 100; ++i)
    {
        EXPECT_EQ(seen[i], i);
    }
    EXPECT_EQ(q.get_pending(), 0u);
}

/**
 * @test DEVICE_QUEUE.empty_wait_for_completion
 */
TEST(DEVICE_QUEUE, empty_wait_for_completion)
{
    AsyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    EXPECT_NO_THROW(q.wait_for_completion());

    SyncQueue s(0, "dev:0_sync", MemoryKind::UNIFIED);
    EXPECT_NO_THROW(s.wait_for_completion());
}

/**
 * @test DEVICE_QUEUE.failed_work_reported_once
 * @brief A throwing unit of work surfaces as device_error from the next
 * completion wait, and later work still runs.
 */
TEST(DEVICE_QUEUE, failed_work_reported_once)
{
    AsyncQueue q(0, "dev:0_test", MemoryKind::UNIFIED);
    bool ran_after = false;
    q.submit([]() { throw std::runtime_error("boom"); });
    q.submit([&ran_after]() { ran_after = true; });

    EXPECT_THROW(q.wait_for_completion(), device_error);
    EXPECT_TRUE(ran_after);
    EXPECT_NO_THROW(q.wait_for_completion());
}

/**
 * @test DEVICE_QUEUE.async_non_standard_failure
 * @brief Work throwing a type outside std::exception is reported as a
 * device_error and does not stop the worker.
 */
TEST(DEVICE_QUEUE, async_non_standard_failure)
{
    AsyncQueue q(0, "dev:0_q0", MemoryKind::UNIFIED);
    std::atomic<bool> ran_after {false};

    q.submit([]() { throw 42; });
    q.submit([&ran_after]() { ran_after = true; });

    EXPECT_THROW(q.wait_for_completion(), device_error);
    EXPECT_TRUE(ran_after.load());
    EXPECT_NO_THROW(q.wait_for_completion());
}

/**
 * @test DEVICE_QUEUE.cross_queue_ordering
 * @brief A consumer waiting on the producer's event sees the producer's
 * writes, across many rounds.
 */
TEST(DEVICE_QUEUE, cross_queue_ordering)
{
    AsyncQueue producer(0, "dev:0_q0", MemoryKind::UNIFIED);
    AsyncQueue consumer(0, "dev:0_q1", MemoryKind::UNIFIED);

    std::atomic<int> value {0};
    std::vector<int> observed;

    for (int round = 1; round <= 200; ++round)
    {
        producer.submit([&value, round]()
        {
            value.store(round, std::memory_order_relaxed);
        });
        consumer.wait(producer.record(producer.create_event()));
        consumer.submit([&value, &observed]()
        {
            observed.push_back(value.load(std::memory_order_relaxed));
        });
        producer.wait(consumer.record(consumer.create_event()));
    }
    producer.wait_for_completion();
    consumer.wait_for_completion();

    ASSERT_EQ(observed.size(), 200u);
    for (int round = 1; round <= 200; ++round)
    {
        EXPECT_EQ(observed[round - 1], round);
    }
}

/**
 * @test DEVICE_QUEUE.sync_queue_blocks_on_wait
 */
TEST(DEVICE_QUEUE, sync_queue_blocks_on_wait)
{
    AsyncQueue producer(0, "dev:0_q0", MemoryKind::UNIFIED);
    SyncQueue consumer(0, "dev:0_sync", MemoryKind::UNIFIED);

    std::atomic<bool> done {false};
    producer.submit([&done]() { done.store(true); });
    consumer.wait(producer.record(producer.create_event()));

    EXPECT_TRUE(done.load());
}

/**
 * @test DEVICE_QUEUE.discrete_memory_access
 */
TEST(DEVICE_QUEUE, discrete_memory_access)
{
    SyncQueue host(0, "dev:0_sync", MemoryKind::UNIFIED);
    DeviceMemory foreign(5, nullptr, 0, MemoryKind::DISCRETE, false,
        DeviceMemory::release_fn{});
    EXPECT_FALSE(host.can_access(foreign));
}

} // namespace Test
