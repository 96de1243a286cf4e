/**
 * @file DeviceQueue.cpp
 * @brief Default DeviceQueue behaviour shared by all backends.
 */

#include "stratum/DeviceQueue.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

#include <atomic>
#include <cstddef>
#include <cstring>
#include <new>
#include <utility>

namespace stratum
{

namespace
{

std::atomic<uint64_t> g_next_queue_id {0};

constexpr std::size_t HOST_ALIGNMENT = alignof(std::max_align_t);

} // namespace

DeviceQueue::DeviceQueue(uint64_t device_index,
                         std::string name,
                         MemoryKind kind,
                         QueueMode mode)
    : m_id(g_next_queue_id.fetch_add(1, std::memory_order_relaxed)),
      m_device_index(device_index),
      m_name(std::move(name)),
      m_memory_kind(kind),
      m_mode(mode)
{
}

std::shared_ptr<DeviceMemory>
DeviceQueue::allocate(uint64_t byte_count, uint64_t heap_index)
{
    STRATUM_CHECK(heap_index != 0,
        validation_error,
        R"(DeviceQueue(allocate): heap_index is reserved and must be 0.)");

    const uint64_t limit = max_allocation_bytes();
    STRATUM_CHECK(limit != 0 && byte_count > limit,
        allocation_error,
        "DeviceQueue(allocate): " + std::to_string(byte_count) +
        " bytes exceeds the capacity of " + m_name);

    if (byte_count == 0)
    {
        return std::make_shared<DeviceMemory>(m_device_index, nullptr, 0,
            m_memory_kind, true, DeviceMemory::release_fn{});
    }

    void* p = ::operator new(static_cast<std::size_t>(byte_count),
        std::align_val_t{HOST_ALIGNMENT}, std::nothrow);

    STRATUM_CHECK(p == nullptr,
        allocation_error,
        "DeviceQueue(allocate): out of memory allocating " +
        std::to_string(byte_count) + " bytes on " + m_name);

    log::diagnostic(log::Category::ALLOCATIONS,
        "allocate {} bytes on {}", byte_count, m_name);

    return std::make_shared<DeviceMemory>(m_device_index, p, byte_count,
        m_memory_kind, true,
        [](void* ptr)
        {
            ::operator delete(ptr, std::align_val_t{HOST_ALIGNMENT});
        });
}

void DeviceQueue::copy_async(std::shared_ptr<const DeviceMemory> src,
                             std::shared_ptr<DeviceMemory> dst)
{
    STRATUM_CHECK(!src || !dst,
        validation_error,
        R"(DeviceQueue(copy_async): null memory handle.)");

    STRATUM_CHECK(src->get_byte_count() != dst->get_byte_count(),
        validation_error,
        R"(DeviceQueue(copy_async): source and destination sizes differ.)");

    STRATUM_CHECK(!can_access(*src) || !can_access(*dst),
        validation_error,
        "DeviceQueue(copy_async): " + m_name +
        " cannot access both buffers");

    log::diagnostic(log::Category::COPIES,
        "copy {} bytes dev:{} -> dev:{} on {}", src->get_byte_count(),
        src->get_device_index(), dst->get_device_index(), m_name);

    submit([src, dst]()
    {
        if (src->get_byte_count() > 0)
        {
            std::memcpy(dst->get_data(), src->get_data(),
                static_cast<std::size_t>(src->get_byte_count()));
        }
    });
}

void DeviceQueue::zero_async(std::shared_ptr<DeviceMemory> dst)
{
    STRATUM_CHECK(!dst || !can_access(*dst),
        validation_error,
        "DeviceQueue(zero_async): " + m_name + " cannot access buffer");

    submit([dst]()
    {
        if (dst->get_byte_count() > 0)
        {
            std::memset(dst->get_data(), 0,
                static_cast<std::size_t>(dst->get_byte_count()));
        }
    });
}

std::shared_ptr<QueueEvent>
DeviceQueue::create_event(QueueEventOptions options)
{
    return std::make_shared<QueueEvent>(options);
}

std::shared_ptr<QueueEvent> DeviceQueue::create_event()
{
    return create_event(m_default_event_options);
}

std::shared_ptr<QueueEvent>
DeviceQueue::record(std::shared_ptr<QueueEvent> event)
{
    STRATUM_CHECK(!event,
        validation_error,
        R"(DeviceQueue(record): null event.)");

    if (has_option(event->get_options(), QueueEventOptions::DISABLED))
    {
        return event;
    }

    log::diagnostic(log::Category::QUEUE_SYNC,
        "record event({}) on {}", event->get_id(), m_name);

    const uint64_t generation = event->reset();
    submit([event, generation]()
    {
        event->signal(generation);
    });
    return event;
}

void DeviceQueue::wait(std::shared_ptr<QueueEvent> event)
{
    STRATUM_CHECK(!event,
        validation_error,
        R"(DeviceQueue(wait): null event.)");

    if (has_option(event->get_options(), QueueEventOptions::DISABLED))
    {
        return;
    }

    log::diagnostic(log::Category::QUEUE_SYNC,
        "{} will wait for event({})", m_name, event->get_id());

    const uint64_t generation = event->get_armed_generation();
    submit([event, generation]()
    {
        event->wait_for(generation);
    });
}

void DeviceQueue::wait_for_completion()
{
    // A synchronous queue completes work as it is submitted.
}

bool DeviceQueue::can_access(const DeviceMemory& memory) const
{
    return memory.is_host_accessible();
}

uint64_t DeviceQueue::max_allocation_bytes() const
{
    return m_host_memory_limit;
}

bool DeviceQueue::uses_cpu() const noexcept
{
    return true;
}

uint64_t DeviceQueue::get_memory_space() const noexcept
{
    if (m_memory_kind == MemoryKind::UNIFIED)
    {
        return 0;
    }
    return m_device_index;
}

} // namespace stratum
