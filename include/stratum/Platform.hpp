/**
 * @file Platform.hpp
 * @brief Declaration of the Platform device registry and the thread-scoped
 * current queue selection.
 *
 * The Platform is created on first use (or explicitly through
 * Platform::initialize()) and owns every device and queue of the process.
 * Each thread selects the queue its operators run on; the selection
 * defaults to the host synchronous queue and is forgotten when the
 * Platform is shut down.
 */

#ifndef STRATUM_PLATFORM_HPP
#define STRATUM_PLATFORM_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "ComputeDevice.hpp"
#include "Config.hpp"
#include "DeviceQueue.hpp"

namespace stratum
{

class QueueScope;

/**
 * @brief Process-wide registry of compute devices.
 *
 * Device 0 is the host CPU with unified memory. It carries
 * `queues_per_device` queues in the configured CPU mode, plus one
 * synchronous queue used as the default. Indices >= 1 are the configured
 * discrete CPU devices, then SYCL GPU devices when accelerators are
 * enabled.
 *
 * Tensors must not outlive the Platform that allocated their storage.
 */
class Platform
{
public:

    /**
     * @brief Builds the device set described by @p config.
     *
     * Applies the configured log level and diagnostic categories.
     *
     * @throws validation_error if @p config is invalid.
     * @throws device_error if accelerators are requested and the SYCL
     * runtime fails to enumerate or open them.
     */
    explicit Platform(PlatformConfig config);

    /**
     * @brief Waits for every queue, then releases all devices.
     */
    ~Platform();

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    /**
     * @brief Replaces the process Platform with one built from @p config.
     *
     * Any previous Platform is shut down first.
     */
    static Platform& initialize(PlatformConfig config);

    /**
     * @brief Returns the process Platform, initializing it from the
     * environment on first use.
     */
    static Platform& get();

    /**
     * @brief Destroys the process Platform, if any.
     */
    static void shutdown();

    static bool is_initialized();

    uint64_t device_count() const noexcept
    {
        return static_cast<uint64_t>(m_devices.size());
    }

    /**
     * @throws bounds_error if @p i is not a valid device index.
     */
    ComputeDevice& device(uint64_t i) const;

    /**
     * @brief The host synchronous queue of device 0.
     *
     * Used for host reads and writes and as the default current queue.
     */
    DeviceQueue& sync_queue() const noexcept { return *m_sync_queue; }

    /**
     * @brief Queue selected by the calling thread, or the sync queue.
     */
    DeviceQueue& current_queue() const;

    /**
     * @brief Selects queue @p queue of device @p device for the calling
     * thread.
     *
     * @throws bounds_error if either index is invalid.
     */
    void use(uint64_t device, uint64_t queue);

    /**
     * @brief Selects the host sync queue for the calling thread.
     */
    void use_sync_queue();

    /**
     * @brief Next seed of the Platform seed sequence.
     *
     * The sequence is a deterministic function of the configured
     * random seed.
     */
    uint64_t next_random_seed();

    const PlatformConfig& config() const noexcept { return m_config; }

    /**
     * @brief Distinguishes Platform instances over the process lifetime.
     */
    uint64_t get_generation() const noexcept { return m_generation; }

    /**
     * @brief Blocks until every queue of every device is idle.
     */
    void wait_for_completion() const;

private:
    friend class QueueScope;

    void add_accelerators(uint64_t first_index);

    /// Sets the calling thread's selection, returning the previous one.
    DeviceQueue* exchange_current(DeviceQueue* queue);

    PlatformConfig                              m_config;
    uint64_t                                    m_generation;
    std::vector<std::unique_ptr<ComputeDevice>> m_devices;
    std::unique_ptr<DeviceQueue>                m_sync_queue;
    std::atomic<uint64_t>                       m_seed_counter {0};
};

/**
 * @brief Selects a queue for the calling thread for the lifetime of
 * the scope, restoring the previous selection on exit.
 *
 * Usage:
 * @code
 *   {
 *       QueueScope scope(0, 1);
 *       Tensor<float> d = a + c;   // runs on dev:0_q1
 *   }
 * @endcode
 */
class QueueScope
{
public:
    QueueScope(uint64_t device, uint64_t queue);
    explicit QueueScope(DeviceQueue& queue);
    ~QueueScope();

    QueueScope(const QueueScope&) = delete;
    QueueScope& operator=(const QueueScope&) = delete;

private:
    DeviceQueue* m_p_previous;
    uint64_t     m_generation;
};

/**
 * @brief Shorthand for `Platform::get().current_queue()`.
 */
DeviceQueue& current_queue();

} // namespace stratum

#endif // STRATUM_PLATFORM_HPP
