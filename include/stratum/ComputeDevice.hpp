/**
 * @file ComputeDevice.hpp
 * @brief Declaration of the ComputeDevice queue owner.
 */

#ifndef STRATUM_COMPUTEDEVICE_HPP
#define STRATUM_COMPUTEDEVICE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "DeviceMemory.hpp"
#include "DeviceQueue.hpp"

namespace stratum
{

/**
 * @brief One compute device and the ordered queues bound to it.
 *
 * Devices are created by the Platform at initialization and never
 * migrate; their queues live exactly as long as the device.
 */
class ComputeDevice
{
public:

    /**
     * @brief Takes ownership of @p queues.
     *
     * @param index Position of the device in the Platform.
     * @param kind Memory kind of every queue on the device.
     * @param description Human readable backend description.
     * @param queues Queues bound to the device, in index order.
     *
     * @throws validation_error if a queue is null or belongs to another
     * device.
     */
    ComputeDevice(uint64_t index,
                  MemoryKind kind,
                  std::string description,
                  std::vector<std::unique_ptr<DeviceQueue>> queues);

    ComputeDevice(const ComputeDevice&) = delete;
    ComputeDevice& operator=(const ComputeDevice&) = delete;

    uint64_t get_index() const noexcept { return m_index; }

    /// "dev:<index>"
    const std::string& get_name() const noexcept { return m_name; }

    const std::string& get_description() const noexcept
    {
        return m_description;
    }

    MemoryKind get_memory_kind() const noexcept { return m_kind; }

    uint64_t get_queue_count() const noexcept
    {
        return static_cast<uint64_t>(m_queues.size());
    }

    /**
     * @brief Queue @p i of the device.
     * @throws bounds_error if @p i is not a valid queue index.
     */
    DeviceQueue& queue(uint64_t i) const;

    /**
     * @brief Blocks until every queue of the device is idle.
     */
    void wait_for_completion() const;

    /**
     * @brief Conventional name of queue @p queue_index on @p device_index.
     */
    static std::string queue_name(uint64_t device_index,
                                  uint64_t queue_index);

private:
    uint64_t                                  m_index;
    std::string                               m_name;
    MemoryKind                                m_kind;
    std::string                               m_description;
    std::vector<std::unique_ptr<DeviceQueue>> m_queues;
};

} // namespace stratum

#endif // STRATUM_COMPUTEDEVICE_HPP
