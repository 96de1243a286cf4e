/**
 * @file ut_Math.cpp
 * @brief Google Test suite for element-wise operators and fills.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <thread>
#include <vector>

#include "stratum/Errors.hpp"
#include "stratum/Math.hpp"
#include "stratum/Platform.hpp"
#include "stratum/Reductions.hpp"

using namespace stratum;

namespace Test
{

/**
 * @brief Host Platform with two async queues per device.
 */
class MathTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        PlatformConfig cfg;
        cfg.queues_per_device = 2;
        cfg.cpu_queue_mode = QueueMode::ASYNC;
        cfg.discrete_cpu_devices = 1;
        cfg.random_seed = 42;
        Platform::initialize(cfg);
    }

    void TearDown() override { Platform::shutdown(); }
};

template <typename value_t>
class MathTyped : public MathTest {};

using MathTypes = ::testing::Types<float, double, int32_t>;
TYPED_TEST_SUITE(MathTyped, MathTypes);

/**
 * @test MathTyped.arithmetic_operators
 */
TYPED_TEST(MathTyped, arithmetic_operators)
{
    using value_t = TypeParam;
    Tensor<value_t> a({2, 2}, {6, 8, 10, 12});
    Tensor<value_t> b({2, 2}, {1, 2, 5, 4});

    EXPECT_EQ((a + b).to_vector(), (std::vector<value_t>{7, 10, 15, 16}));
    EXPECT_EQ((a - b).to_vector(), (std::vector<value_t>{5, 6, 5, 8}));
    EXPECT_EQ((a * b).to_vector(), (std::vector<value_t>{6, 16, 50, 48}));
    EXPECT_EQ((a / b).to_vector(), (std::vector<value_t>{6, 4, 2, 3}));
    EXPECT_EQ((-b).to_vector(), (std::vector<value_t>{-1, -2, -5, -4}));
}

/**
 * @test MathTyped.shape_mismatch
 */
TYPED_TEST(MathTyped, shape_mismatch)
{
    using value_t = TypeParam;
    Tensor<value_t> a({2, 3});
    Tensor<value_t> b({3, 2});
    EXPECT_THROW(a + b, validation_error);
    EXPECT_THROW(math::fma(a, a, b), validation_error);
}

/**
 * @test MathTyped.result_keeps_first_operand_order
 */
TYPED_TEST(MathTyped, result_keeps_first_operand_order)
{
    using value_t = TypeParam;
    Tensor<value_t> a({2, 3}, {0, 1, 2, 3, 4, 5}, Order::COL_MAJOR);
    Tensor<value_t> b({2, 3}, {0, 1, 2, 3, 4, 5});
    Tensor<value_t> c = a + b;
    EXPECT_EQ(c.get_order(), Order::COL_MAJOR);
    EXPECT_EQ(c.to_vector(), (std::vector<value_t>{0, 2, 4, 6, 8, 10}));
}

/**
 * @test MathTyped.fill_and_index
 */
TYPED_TEST(MathTyped, fill_and_index)
{
    using value_t = TypeParam;
    Tensor<value_t> t({2, 3}, Order::COL_MAJOR);
    math::fill(t, value_t(7));
    EXPECT_EQ(t.to_vector(), std::vector<value_t>(6, value_t(7)));

    math::fill_with_index(t, value_t(1), value_t(2));
    EXPECT_EQ(t.to_vector(), (std::vector<value_t>{1, 3, 5, 7, 9, 11}));
}

/**
 * @test MathTyped.abs_fma_like
 */
TYPED_TEST(MathTyped, abs_fma_like)
{
    using value_t = TypeParam;
    Tensor<value_t> x({3}, {-2, 0, 3});
    EXPECT_EQ(math::abs(x).to_vector(), (std::vector<value_t>{2, 0, 3}));

    Tensor<value_t> y({3}, {1, 2, 3});
    EXPECT_EQ(math::fma(x, y, y).to_vector(),
        (std::vector<value_t>{-1, 2, 12}));

    EXPECT_EQ(math::ones_like(x).to_vector(), std::vector<value_t>(3, 1));
    EXPECT_EQ(math::zeros_like(x).to_vector(), std::vector<value_t>(3, 0));
}

/**
 * @test MathTyped.greater_and_replace
 */
TYPED_TEST(MathTyped, greater_and_replace)
{
    using value_t = TypeParam;
    Tensor<value_t> a({4}, {1, 5, 3, 0});
    Tensor<value_t> b({4}, {2, 2, 3, -1});
    Tensor<bool> gt = math::greater(a, b);
    EXPECT_EQ(gt.to_vector(), (std::vector<bool>{false, true, false, true}));
    EXPECT_EQ(math::replace(a, b, gt).to_vector(),
        (std::vector<value_t>{1, 2, 3, -1}));
}

/**
 * @test MathTyped.copy_between_layouts
 */
TYPED_TEST(MathTyped, copy_between_layouts)
{
    using value_t = TypeParam;
    Tensor<value_t> from({2, 3}, {0, 1, 2, 3, 4, 5});
    Tensor<value_t> to({3, 2}, Order::COL_MAJOR);
    math::copy(from.transpose(), to);
    EXPECT_EQ(to.to_vector(), (std::vector<value_t>{0, 3, 1, 4, 2, 5}));
}

/**
 * @test MathTest.async_queue_hand_off
 * @brief A result produced on one queue is consumed on another
 * without explicit synchronization.
 */
TEST_F(MathTest, async_queue_hand_off)
{
    Tensor<float> a({3, 2});
    Tensor<float> b({6});
    math::fill_with_index(a);
    math::fill_with_index(b);

    Tensor<float> c;
    Tensor<float> d;
    {
        QueueScope scope(0, 0);
        c = a + b.reshape({3, 2});
    }
    {
        QueueScope scope(0, 1);
        d = a + c;
    }
    EXPECT_EQ(d.to_vector(),
        (std::vector<float>{0.0f, 3.0f, 6.0f, 9.0f, 12.0f, 15.0f}));
}

/**
 * @test MathTest.chained_across_devices
 * @brief A chain alternating between the host and a discrete device
 * keeps every intermediate coherent.
 */
TEST_F(MathTest, chained_across_devices)
{
    Tensor<int32_t> x({256});
    math::fill_with_index(x);
    Tensor<int32_t> acc = x.clone();
    for (int i = 0; i < 8; ++i)
    {
        const uint64_t side = static_cast<uint64_t>(i % 2);
        QueueScope scope(side, side);
        acc = acc + x;
    }
    std::vector<int32_t> expected(256);
    for (int32_t i = 0; i < 256; ++i)
    {
        expected[i] = 9 * i;
    }
    EXPECT_EQ(acc.to_vector(), expected);
}

/**
 * @test MathTest.threads_use_own_queues
 */
TEST_F(MathTest, threads_use_own_queues)
{
    Tensor<double> x({128});
    math::fill(x, 1.0);

    Tensor<double> r0;
    Tensor<double> r1;
    std::thread t0([&]()
    {
        Platform::get().use(0, 0);
        r0 = x + x;
    });
    std::thread t1([&]()
    {
        Platform::get().use(0, 1);
        r1 = x * x;
    });
    t0.join();
    t1.join();

    EXPECT_DOUBLE_EQ(sum(r0).item(), 256.0);
    EXPECT_DOUBLE_EQ(sum(r1).item(), 128.0);
}

/**
 * @test MathTest.sqrt_exp
 */
TEST_F(MathTest, sqrt_exp)
{
    Tensor<double> x({3}, {0.0, 1.0, 4.0});
    EXPECT_EQ(math::sqrt(x).to_vector(), (std::vector<double>{0.0, 1.0, 2.0}));
    const std::vector<double> e = math::exp(x).to_vector();
    EXPECT_DOUBLE_EQ(e[0], 1.0);
    EXPECT_NEAR(e[1], std::exp(1.0), 1e-12);
}

/**
 * @test MathTest.random_reproducible
 * @brief The configured seed reproduces the same draws.
 */
TEST_F(MathTest, random_reproducible)
{
    const std::vector<float> first =
        math::random_uniform<float>({64}, -1.0f, 1.0f).to_vector();

    PlatformConfig cfg = Platform::get().config();
    Platform::initialize(cfg);
    const std::vector<float> second =
        math::random_uniform<float>({64}, -1.0f, 1.0f).to_vector();

    EXPECT_EQ(first, second);
    for (float v : first)
    {
        EXPECT_GE(v, -1.0f);
        EXPECT_LT(v, 1.0f);
    }

    const std::vector<float> third =
        math::random_uniform<float>({64}, -1.0f, 1.0f).to_vector();
    EXPECT_NE(second, third);
}

/**
 * @test MathTest.random_normal_moments
 */
TEST_F(MathTest, random_normal_moments)
{
    Tensor<double> r = math::random_normal<double>({20000}, 3.0, 0.5);
    EXPECT_NEAR(mean(r).item(), 3.0, 0.05);
    EXPECT_THROW(math::random_normal<double>({4}, 0.0, 0.0),
        validation_error);
    EXPECT_THROW(math::random_uniform<double>({4}, 1.0, 1.0),
        validation_error);
}

/**
 * @test MathTest.random_layout_independent
 * @brief Draws land at the same logical index whatever the layout.
 */
TEST_F(MathTest, random_layout_independent)
{
    const PlatformConfig cfg = Platform::get().config();
    Platform::initialize(cfg);
    const std::vector<float> expected =
        math::random_uniform<float>({4, 5}).to_vector();

    Platform::initialize(cfg);
    Tensor<float> col({4, 5}, Order::COL_MAJOR);
    math::copy(math::random_uniform<float>({4, 5}), col);
    EXPECT_EQ(col.to_vector(), expected);
}

} // namespace Test
