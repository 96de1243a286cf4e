/**
 * @file ut_Config.cpp
 * @brief Google Test suite for configuration parsing and logging setup.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "stratum/Config.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

using namespace stratum;

namespace Test
{

namespace
{

const std::vector<std::string> ENV_NAMES = {
    "STRATUM_QUEUES_PER_DEVICE",
    "STRATUM_CPU_QUEUE_MODE",
    "STRATUM_DISCRETE_CPU_DEVICES",
    "STRATUM_USE_ACCELERATORS",
    "STRATUM_HOST_MEMORY_LIMIT",
    "STRATUM_LOG_LEVEL",
    "STRATUM_LOG_CATEGORIES",
    "STRATUM_SEED"
};

/**
 * @brief Clears the STRATUM_* variables around each test.
 */
class ConfigEnv : public ::testing::Test
{
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        for (const std::string& name : ENV_NAMES)
        {
            unsetenv(name.c_str());
        }
    }
};

} // namespace

/**
 * @test CONFIG.parse_uint_accepts_digits
 */
TEST(CONFIG, parse_uint_accepts_digits)
{
    EXPECT_EQ(config::parse_uint("0", "x"), 0u);
    EXPECT_EQ(config::parse_uint(" 42 ", "x"), 42u);
    EXPECT_EQ(config::parse_uint("18446744073709551615", "x"),
        18446744073709551615ull);
}

/**
 * @test CONFIG.parse_uint_rejects_garbage
 */
TEST(CONFIG, parse_uint_rejects_garbage)
{
    EXPECT_THROW(config::parse_uint("", "x"), validation_error);
    EXPECT_THROW(config::parse_uint("-1", "x"), validation_error);
    EXPECT_THROW(config::parse_uint("12a", "x"), validation_error);
    EXPECT_THROW(config::parse_uint("18446744073709551616", "x"),
        validation_error);
}

/**
 * @test CONFIG.parse_bool_values
 */
TEST(CONFIG, parse_bool_values)
{
    EXPECT_TRUE(config::parse_bool("1", "x"));
    EXPECT_TRUE(config::parse_bool("TRUE", "x"));
    EXPECT_TRUE(config::parse_bool("on", "x"));
    EXPECT_FALSE(config::parse_bool("0", "x"));
    EXPECT_FALSE(config::parse_bool("False", "x"));
    EXPECT_FALSE(config::parse_bool("off", "x"));
    EXPECT_THROW(config::parse_bool("maybe", "x"), validation_error);
}

/**
 * @test CONFIG.validate_rejects_zero_queues
 */
TEST(CONFIG, validate_rejects_zero_queues)
{
    PlatformConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    cfg.queues_per_device = 0;
    EXPECT_THROW(cfg.validate(), validation_error);
}

/**
 * @test ConfigEnv.from_env_defaults
 */
TEST_F(ConfigEnv, from_env_defaults)
{
    const PlatformConfig cfg = PlatformConfig::from_env();
    const PlatformConfig def;
    EXPECT_EQ(cfg.queues_per_device, def.queues_per_device);
    EXPECT_EQ(cfg.cpu_queue_mode, def.cpu_queue_mode);
    EXPECT_EQ(cfg.discrete_cpu_devices, def.discrete_cpu_devices);
    EXPECT_EQ(cfg.use_accelerators, def.use_accelerators);
    EXPECT_EQ(cfg.random_seed, def.random_seed);
}

/**
 * @test ConfigEnv.from_env_overrides
 */
TEST_F(ConfigEnv, from_env_overrides)
{
    setenv("STRATUM_QUEUES_PER_DEVICE", "4", 1);
    setenv("STRATUM_CPU_QUEUE_MODE", "Sync", 1);
    setenv("STRATUM_DISCRETE_CPU_DEVICES", "2", 1);
    setenv("STRATUM_USE_ACCELERATORS", "false", 1);
    setenv("STRATUM_HOST_MEMORY_LIMIT", "1048576", 1);
    setenv("STRATUM_LOG_LEVEL", "debug", 1);
    setenv("STRATUM_LOG_CATEGORIES", "copies, queue_sync", 1);
    setenv("STRATUM_SEED", "7", 1);

    const PlatformConfig cfg = PlatformConfig::from_env();
    EXPECT_EQ(cfg.queues_per_device, 4u);
    EXPECT_EQ(cfg.cpu_queue_mode, QueueMode::SYNC);
    EXPECT_EQ(cfg.discrete_cpu_devices, 2u);
    EXPECT_FALSE(cfg.use_accelerators);
    EXPECT_EQ(cfg.host_memory_limit, 1048576u);
    EXPECT_EQ(cfg.log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.log_categories,
        static_cast<uint32_t>(log::Category::COPIES) |
        static_cast<uint32_t>(log::Category::QUEUE_SYNC));
    EXPECT_EQ(cfg.random_seed, 7u);
}

/**
 * @test ConfigEnv.from_env_malformed
 */
TEST_F(ConfigEnv, from_env_malformed)
{
    setenv("STRATUM_CPU_QUEUE_MODE", "parallel", 1);
    EXPECT_THROW(PlatformConfig::from_env(), validation_error);
    unsetenv("STRATUM_CPU_QUEUE_MODE");

    setenv("STRATUM_LOG_LEVEL", "loud", 1);
    EXPECT_THROW(PlatformConfig::from_env(), validation_error);
    unsetenv("STRATUM_LOG_LEVEL");

    setenv("STRATUM_QUEUES_PER_DEVICE", "0", 1);
    EXPECT_THROW(PlatformConfig::from_env(), validation_error);
}

/**
 * @test LOGGING.parse_categories
 */
TEST(LOGGING, parse_categories)
{
    EXPECT_EQ(log::parse_categories(""), 0u);
    EXPECT_EQ(log::parse_categories("none"), 0u);
    EXPECT_EQ(log::parse_categories("all"),
        static_cast<uint32_t>(log::Category::ALL));
    EXPECT_EQ(log::parse_categories("allocations,scheduling"),
        static_cast<uint32_t>(log::Category::ALLOCATIONS) |
        static_cast<uint32_t>(log::Category::SCHEDULING));
    EXPECT_THROW(log::parse_categories("allocations,gpu"), validation_error);
}

/**
 * @test LOGGING.category_gate
 * @brief A category is only enabled when its bit is set and the logger
 * emits debug messages.
 */
TEST(LOGGING, category_gate)
{
    const auto saved_level = log::get_logger()->level();
    const uint32_t saved_mask = log::get_categories();

    log::set_categories(static_cast<uint32_t>(log::Category::COPIES));
    log::set_level(spdlog::level::warn);
    EXPECT_FALSE(log::is_enabled(log::Category::COPIES));

    log::set_level(spdlog::level::debug);
    EXPECT_TRUE(log::is_enabled(log::Category::COPIES));
    EXPECT_FALSE(log::is_enabled(log::Category::ALLOCATIONS));

    log::set_level(saved_level);
    log::set_categories(saved_mask);
}

} // namespace Test
