/**
 * @file DeviceMemory.cpp
 * @brief DeviceMemory definitions.
 */

#include "stratum/DeviceMemory.hpp"

#include <utility>

namespace stratum
{

DeviceMemory::DeviceMemory(uint64_t device_index,
                           void* p_data,
                           uint64_t byte_count,
                           MemoryKind kind,
                           bool host_accessible,
                           release_fn release)
    : m_device_index(device_index),
      m_p_data(p_data),
      m_byte_count(byte_count),
      m_kind(kind),
      m_host_accessible(host_accessible),
      m_release(std::move(release))
{
}

std::shared_ptr<DeviceMemory> DeviceMemory::wrap_host(void* p_data,
                                                      uint64_t byte_count)
{
    return std::make_shared<DeviceMemory>(0, p_data, byte_count,
        MemoryKind::UNIFIED, true, release_fn{});
}

DeviceMemory::~DeviceMemory()
{
    if (m_release && m_p_data)
    {
        m_release(m_p_data);
    }
}

} // namespace stratum
