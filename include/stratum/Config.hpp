/**
 * @file Config.hpp
 * @brief Platform configuration surface.
 *
 * Values are read once, when a Platform is initialized. Every field may be
 * overridden from the environment (see PlatformConfig::from_env()).
 */

#ifndef STRATUM_CONFIG_HPP
#define STRATUM_CONFIG_HPP

#include <cstdint>
#include <string>

#include <spdlog/common.h>

namespace stratum
{

/**
 * @brief Execution mode of a device queue.
 */
enum class QueueMode
{
    SYNC,   ///< work runs inline on the calling thread
    ASYNC   ///< work runs on the queue's background channel
};

/**
 * @brief Configuration read at Platform initialization.
 */
struct PlatformConfig
{
    /// Number of queues created on every device.
    uint64_t queues_per_device {2};

    /// Mode of the queues created on CPU devices.
    QueueMode cpu_queue_mode {QueueMode::ASYNC};

    /// Number of extra CPU devices whose memory is labelled DISCRETE.
    uint64_t discrete_cpu_devices {0};

    /// Enumerate SYCL GPU devices as accelerators.
    bool use_accelerators {false};

    /// Largest single host allocation in bytes, 0 means unlimited.
    uint64_t host_memory_limit {0};

    /// Logger level.
    spdlog::level::level_enum log_level {spdlog::level::warn};

    /// Enabled diagnostic categories (see log::Category).
    uint32_t log_categories {0};

    /// Global random seed, the origin of the Platform seed sequence.
    uint64_t random_seed {0x5eed};

    /**
     * @brief Builds a configuration from defaults and environment.
     *
     * Recognized variables:
     * - STRATUM_QUEUES_PER_DEVICE     positive integer
     * - STRATUM_CPU_QUEUE_MODE        "sync" or "async"
     * - STRATUM_DISCRETE_CPU_DEVICES  integer
     * - STRATUM_USE_ACCELERATORS      "0"/"1"/"true"/"false"
     * - STRATUM_HOST_MEMORY_LIMIT     integer, bytes
     * - STRATUM_LOG_LEVEL             spdlog level name
     * - STRATUM_LOG_CATEGORIES        comma separated category names
     * - STRATUM_SEED                  integer
     *
     * @throws validation_error if a variable holds a malformed value.
     */
    static PlatformConfig from_env();

    /**
     * @brief Checks field ranges.
     * @throws validation_error if queues_per_device is zero.
     */
    void validate() const;
};

namespace config
{

/**
 * @brief Parses a decimal unsigned integer, rejecting signs and garbage.
 * @throws validation_error naming @p what on failure.
 */
uint64_t parse_uint(const std::string& text, const std::string& what);

/**
 * @brief Parses "0", "1", "true", "false", "on", "off".
 * @throws validation_error naming @p what on failure.
 */
bool parse_bool(const std::string& text, const std::string& what);

} // namespace config

} // namespace stratum

#endif // STRATUM_CONFIG_HPP
