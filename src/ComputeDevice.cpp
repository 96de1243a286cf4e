/**
 * @file ComputeDevice.cpp
 * @brief ComputeDevice definitions.
 */

#include "stratum/ComputeDevice.hpp"
#include "stratum/Errors.hpp"

#include <utility>

namespace stratum
{

ComputeDevice::ComputeDevice(uint64_t index,
                             MemoryKind kind,
                             std::string description,
                             std::vector<std::unique_ptr<DeviceQueue>> queues)
    : m_index(index),
      m_name("dev:" + std::to_string(index)),
      m_kind(kind),
      m_description(std::move(description)),
      m_queues(std::move(queues))
{
    for (const auto& q : m_queues)
    {
        STRATUM_CHECK(!q,
            validation_error,
            R"(ComputeDevice(constructor): null queue.)");

        STRATUM_CHECK(q->get_device_index() != m_index,
            validation_error,
            "ComputeDevice(constructor): queue " + q->get_name() +
            " does not belong to " + m_name);
    }
}

DeviceQueue& ComputeDevice::queue(uint64_t i) const
{
    STRATUM_CHECK(i >= m_queues.size(),
        bounds_error,
        "ComputeDevice(queue): " + m_name + " has no queue " +
        std::to_string(i));

    return *m_queues[i];
}

void ComputeDevice::wait_for_completion() const
{
    for (const auto& q : m_queues)
    {
        q->wait_for_completion();
    }
}

std::string ComputeDevice::queue_name(uint64_t device_index,
                                      uint64_t queue_index)
{
    return "dev:" + std::to_string(device_index) + "_q" +
        std::to_string(queue_index);
}

} // namespace stratum
