/**
 * @file ut_MapOps.cpp
 * @brief Google Test suite for the element-wise and reduction dispatcher.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>
#include <utility>
#include <vector>

#include "stratum/Errors.hpp"
#include "stratum/MapOps.hpp"
#include "stratum/Platform.hpp"

using namespace stratum;

namespace Test
{

/**
 * @brief Dispatcher tests run on an async CPU queue, so every result is
 * read back through the host hand-off.
 */
class MapOpsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        PlatformConfig cfg;
        cfg.queues_per_device = 2;
        cfg.cpu_queue_mode = QueueMode::ASYNC;
        Platform::initialize(cfg);
    }

    void TearDown() override { Platform::shutdown(); }

    DeviceQueue& queue(uint64_t i = 0)
    {
        return Platform::get().device(0).queue(i);
    }
};

/**
 * @test MapOpsTest.unary_flat
 */
TEST_F(MapOpsTest, unary_flat)
{
    Tensor<float> a({2, 2}, {1.0f, -2.0f, 3.0f, -4.0f});
    Tensor<float> out({2, 2});
    map_op(queue(), a, out, [](float v) { return v * 2.0f; });
    EXPECT_EQ(out.to_vector(), (std::vector<float>{2.0f, -4.0f, 6.0f, -8.0f}));
}

/**
 * @test MapOpsTest.binary_mixed_orders
 * @brief Operands in different element orders correspond by logical
 * index.
 */
TEST_F(MapOpsTest, binary_mixed_orders)
{
    Tensor<int32_t> a({2, 3}, {0, 1, 2, 3, 4, 5}, Order::ROW_MAJOR);
    Tensor<int32_t> b({2, 3}, {10, 20, 30, 40, 50, 60}, Order::COL_MAJOR);
    Tensor<int32_t> out({2, 3}, Order::COL_MAJOR);

    map_op(queue(), a, b, out, [](int32_t x, int32_t y) { return x + y; });
    EXPECT_EQ(out.to_vector(),
        (std::vector<int32_t>{10, 21, 32, 43, 54, 65}));
}

/**
 * @test MapOpsTest.transposed_operand
 */
TEST_F(MapOpsTest, transposed_operand)
{
    Tensor<int32_t> a({3, 2}, {0, 1, 2, 3, 4, 5});
    Tensor<int32_t> out({2, 3});
    map_op(queue(), a.transpose(), out, [](int32_t v) { return v; });
    EXPECT_EQ(out.to_vector(), (std::vector<int32_t>{0, 2, 4, 1, 3, 5}));
}

/**
 * @test MapOpsTest.strided_slice_operand
 */
TEST_F(MapOpsTest, strided_slice_operand)
{
    Tensor<int32_t> a({3, 4}, {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11});
    Tensor<int32_t> out({2, 2});
    map_op(queue(), a.slice({1, 1}, {2, 2}), out,
        [](int32_t v) { return -v; });
    EXPECT_EQ(out.to_vector(), (std::vector<int32_t>{-5, -6, -9, -10}));
}

/**
 * @test MapOpsTest.ternary
 */
TEST_F(MapOpsTest, ternary)
{
    Tensor<float> a({3}, {1.0f, 2.0f, 3.0f});
    Tensor<float> b({3}, {4.0f, 5.0f, 6.0f});
    Tensor<bool> c({3}, {true, false, true});
    Tensor<float> out({3});
    map_op(queue(), a, b, c, out,
        [](float x, float y, bool z) { return z ? y : x; });
    EXPECT_EQ(out.to_vector(), (std::vector<float>{4.0f, 2.0f, 6.0f}));
}

/**
 * @test MapOpsTest.dual_output
 */
TEST_F(MapOpsTest, dual_output)
{
    Tensor<float> a({2}, {1.0f, 2.0f});
    Tensor<float> b({2}, {3.0f, 4.0f});
    Tensor<float> c({2}, {5.0f, 6.0f});
    Tensor<float> sum({2});
    Tensor<float> prod({2});
    map_op(queue(), a, b, c, sum, prod,
        [](float x, float y, float z)
        {
            return std::make_pair(x + y + z, x * y * z);
        });
    EXPECT_EQ(sum.to_vector(), (std::vector<float>{9.0f, 12.0f}));
    EXPECT_EQ(prod.to_vector(), (std::vector<float>{15.0f, 48.0f}));
}

/**
 * @test MapOpsTest.dual_output_mixed_orders
 * @brief Each operand is walked through its own strides, so operands and
 * results of different orders still correspond index for index.
 */
TEST_F(MapOpsTest, dual_output_mixed_orders)
{
    Tensor<float> a({2, 2}, {1.0f, 2.0f, 3.0f, 4.0f});
    Tensor<float> b({2, 2}, {1.0f, 3.0f, 2.0f, 4.0f}, Order::COL_MAJOR);
    Tensor<float> o1({2, 2});
    Tensor<float> o2({2, 2}, Order::COL_MAJOR);
    map_op(queue(), a, b, a, o1, o2,
        [](float x, float y, float z)
        {
            return std::make_pair(x + y, y * z);
        });
    EXPECT_EQ(o1.to_vector(), (std::vector<float>{2.0f, 5.0f, 5.0f, 8.0f}));
    EXPECT_EQ(o2.to_vector(), (std::vector<float>{1.0f, 6.0f, 6.0f, 16.0f}));
}

/**
 * @test MapOpsTest.event_hand_off_stress
 * @brief The producer computes `c = a + b` after a random delay and
 * records an event; the consumer waits on it and reads every element of
 * `c` from its own queue.
 */
TEST_F(MapOpsTest, event_hand_off_stress)
{
    DeviceQueue& producer = queue(0);
    DeviceQueue& consumer = queue(1);
    ASSERT_NE(&producer, &consumer);

    constexpr int rounds = 300;
    constexpr int32_t n = 64;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> delay_us(0, 300);
    std::atomic<int> mismatches {0};
    std::atomic<int> checked {0};

    for (int round = 0; round < rounds; ++round)
    {
        std::vector<int32_t> av(n);
        std::vector<int32_t> bv(n);
        for (int32_t i = 0; i < n; ++i)
        {
            av[i] = i + round;
            bv[i] = 2 * i;
        }
        Tensor<int32_t> a({static_cast<uint64_t>(n)}, av);
        Tensor<int32_t> b({static_cast<uint64_t>(n)}, bv);
        Tensor<int32_t> c({static_cast<uint64_t>(n)});

        const int delay = delay_us(rng);
        producer.submit([delay]()
        {
            std::this_thread::sleep_for(std::chrono::microseconds(delay));
        });
        map_op(producer, a, b, c,
            [](int32_t x, int32_t y) { return x + y; });
        std::shared_ptr<const DeviceMemory> c_mem = c.read(producer);
        std::shared_ptr<QueueEvent> e =
            producer.record(producer.create_event());

        consumer.wait(e);
        consumer.submit([c_mem, round, &mismatches, &checked]()
        {
            const int32_t* p_c =
                static_cast<const int32_t*>(c_mem->get_data());
            for (int32_t i = 0; i < n; ++i)
            {
                if (p_c[i] != 3 * i + round)
                {
                    ++mismatches;
                }
            }
            ++checked;
        });
    }
    producer.wait_for_completion();
    consumer.wait_for_completion();

    EXPECT_EQ(checked.load(), rounds);
    EXPECT_EQ(mismatches.load(), 0);
}

/**
 * @test MapOpsTest.shape_mismatch
 */
TEST_F(MapOpsTest, shape_mismatch)
{
    Tensor<float> a({2, 3});
    Tensor<float> b({3, 2});
    Tensor<float> out({2, 3});
    EXPECT_THROW(map_op(queue(), a, b, out,
        [](float x, float y) { return x + y; }), validation_error);
    EXPECT_THROW(map_op(queue(), b, out, [](float x) { return x; }),
        validation_error);
}

/**
 * @test MapOpsTest.generator_logical_order
 * @brief Generators see elements in logical row-major order whatever
 * the layout.
 */
TEST_F(MapOpsTest, generator_logical_order)
{
    Tensor<int32_t> t({2, 3}, Order::COL_MAJOR);
    generator_op(queue(), t, [n = 0]() mutable { return n++; });
    EXPECT_EQ(t.to_vector(), (std::vector<int32_t>{0, 1, 2, 3, 4, 5}));

    Tensor<int32_t> base({3, 3});
    Tensor<int32_t> s = base.slice({0, 1}, {3, 2});
    generator_op(queue(), s, [n = 1]() mutable { return n++; });
    EXPECT_EQ(base.to_vector(),
        (std::vector<int32_t>{0, 1, 2, 0, 3, 4, 0, 5, 6}));
}

/**
 * @test MapOpsTest.in_place
 */
TEST_F(MapOpsTest, in_place)
{
    Tensor<int32_t> t({2, 2}, {1, 2, 3, 4});
    Tensor<int32_t> col = t.slice({0, 1}, {2, 1});
    in_place_op(queue(), col, [](int32_t v) { return v * 10; });
    EXPECT_EQ(t.to_vector(), (std::vector<int32_t>{1, 20, 3, 40}));
}

/**
 * @test MapOpsTest.reduction_rows_and_columns
 */
TEST_F(MapOpsTest, reduction_rows_and_columns)
{
    Tensor<int32_t> x({2, 3}, {1, 2, 3, 4, 5, 6});
    Tensor<int32_t> rows({2, 1});
    Tensor<int32_t> cols({1, 3});
    auto add = [](int32_t acc, int32_t v) { return acc + v; };

    reduction_op(queue(), x, rows, add);
    reduction_op(queue(), x, cols, add,
        [](int32_t acc) { return acc * 2; });

    EXPECT_EQ(rows.to_vector(), (std::vector<int32_t>{6, 15}));
    EXPECT_EQ(cols.to_vector(), (std::vector<int32_t>{10, 14, 18}));
}

/**
 * @test MapOpsTest.reduction_col_major
 */
TEST_F(MapOpsTest, reduction_col_major)
{
    Tensor<int32_t> x({2, 3}, {1, 2, 3, 4, 5, 6}, Order::COL_MAJOR);
    Tensor<int32_t> rows({2, 1}, Order::COL_MAJOR);
    reduction_op(queue(), x, rows,
        [](int32_t acc, int32_t v) { return acc + v; });
    EXPECT_EQ(rows.to_vector(), (std::vector<int32_t>{6, 15}));
}

/**
 * @test MapOpsTest.reduction_mixed_orders
 */
TEST_F(MapOpsTest, reduction_mixed_orders)
{
    auto add = [](int32_t acc, int32_t v) { return acc + v; };

    Tensor<int32_t> x({2, 3}, {1, 2, 3, 4, 5, 6});
    Tensor<int32_t> cols({1, 3}, Order::COL_MAJOR);
    reduction_op(queue(), x, cols, add);
    EXPECT_EQ(cols.to_vector(), (std::vector<int32_t>{5, 7, 9}));

    Tensor<int32_t> y({2, 3}, {1, 2, 3, 4, 5, 6}, Order::COL_MAJOR);
    Tensor<int32_t> rows({2, 1});
    reduction_op(queue(), y, rows, add);
    EXPECT_EQ(rows.to_vector(), (std::vector<int32_t>{6, 15}));
}

/**
 * @test MapOpsTest.reduction_bad_projection
 */
TEST_F(MapOpsTest, reduction_bad_projection)
{
    Tensor<float> x({2, 3});
    Tensor<float> wrong_extent({2, 2});
    Tensor<float> wrong_rank({3});
    auto add = [](float acc, float v) { return acc + v; };
    EXPECT_THROW(reduction_op(queue(), x, wrong_extent, add),
        validation_error);
    EXPECT_THROW(reduction_op(queue(), x, wrong_rank, add),
        validation_error);
}

/**
 * @test MapOpsTest.sync_queue_runs_inline
 * @brief The sync queue runs the same operations inline.
 */
TEST_F(MapOpsTest, sync_queue_runs_inline)
{
    DeviceQueue& sync = Platform::get().sync_queue();
    Tensor<double> a({3}, {1.0, 2.0, 3.0});
    Tensor<double> out({3});
    map_op(sync, a, a, out, [](double x, double y) { return x * y; });
    EXPECT_EQ(out.to_vector(), (std::vector<double>{1.0, 4.0, 9.0}));
}

} // namespace Test
