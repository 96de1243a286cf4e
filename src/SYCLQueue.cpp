/**
 * @file SYCLQueue.cpp
 * @brief AcceleratorQueue definitions.
 */

#include "stratum/SYCLQueue.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

namespace stratum
{

AcceleratorQueue::AcceleratorQueue(uint64_t device_index,
                                   std::string name,
                                   const sycl::device& device,
                                   QueueMode mode)
    : DeviceQueue(device_index, std::move(name), MemoryKind::DISCRETE, mode),
      m_device(device),
      m_queue(device,
          sycl::async_handler{[this](sycl::exception_list errors)
          {
              on_async_errors(std::move(errors));
          }},
          sycl::property_list{sycl::property::queue::in_order{}})
{
    log::get_logger()->info("{}: SYCL queue on '{}'", m_name,
        m_device.get_info<sycl::info::device::name>());
}

AcceleratorQueue::~AcceleratorQueue()
{
    try
    {
        m_queue.wait_and_throw();
    }
    catch (const sycl::exception& e)
    {
        log::get_logger()->error("{}: SYCL error at teardown: {}",
            m_name, e.what());
    }
}

std::shared_ptr<DeviceMemory>
AcceleratorQueue::allocate(uint64_t byte_count, uint64_t heap_index)
{
    STRATUM_CHECK(heap_index != 0,
        validation_error,
        R"(AcceleratorQueue(allocate): heap_index is reserved and must be 0.)");

    STRATUM_CHECK(byte_count > max_allocation_bytes(),
        allocation_error,
        "AcceleratorQueue(allocate): " + std::to_string(byte_count) +
        " bytes exceeds device max_mem_alloc_size on " + m_name);

    if (byte_count == 0)
    {
        return std::make_shared<DeviceMemory>(m_device_index, nullptr, 0,
            MemoryKind::DISCRETE, false, DeviceMemory::release_fn{});
    }

    void* p = sycl::malloc_device(static_cast<size_t>(byte_count), m_queue);

    STRATUM_CHECK(p == nullptr,
        allocation_error,
        "AcceleratorQueue(allocate): out of device memory allocating " +
        std::to_string(byte_count) + " bytes on " + m_name);

    log::diagnostic(log::Category::ALLOCATIONS,
        "allocate {} device bytes on {}", byte_count, m_name);

    sycl::queue q = m_queue;
    return std::make_shared<DeviceMemory>(m_device_index, p, byte_count,
        MemoryKind::DISCRETE, false,
        [q](void* ptr)
        {
            // Commands using the buffer hold it through release_after(), so
            // the last reference drops after they complete.
            sycl::free(ptr, q);
        });
}

void AcceleratorQueue::copy_async(std::shared_ptr<const DeviceMemory> src,
                                  std::shared_ptr<DeviceMemory> dst)
{
    STRATUM_CHECK(!src || !dst,
        validation_error,
        R"(AcceleratorQueue(copy_async): null memory handle.)");

    STRATUM_CHECK(src->get_byte_count() != dst->get_byte_count(),
        validation_error,
        R"(AcceleratorQueue(copy_async): source and destination sizes differ.)");

    STRATUM_CHECK(!can_access(*src) || !can_access(*dst),
        validation_error,
        "AcceleratorQueue(copy_async): " + m_name +
        " cannot access both buffers");

    log::diagnostic(log::Category::COPIES,
        "copy {} bytes dev:{} -> dev:{} on {}", src->get_byte_count(),
        src->get_device_index(), dst->get_device_index(), m_name);

    if (src->get_byte_count() > 0)
    {
        m_queue.memcpy(dst->get_data(), src->get_data(),
            static_cast<size_t>(src->get_byte_count()));
    }
    release_after({src, dst});
}

void AcceleratorQueue::zero_async(std::shared_ptr<DeviceMemory> dst)
{
    STRATUM_CHECK(!dst || !can_access(*dst),
        validation_error,
        "AcceleratorQueue(zero_async): " + m_name + " cannot access buffer");

    if (dst->get_byte_count() > 0)
    {
        m_queue.memset(dst->get_data(), 0,
            static_cast<size_t>(dst->get_byte_count()));
    }
    release_after({dst});
}

void AcceleratorQueue::submit(work_fn work)
{
    m_queue.submit([&](sycl::handler& cgh)
    {
        cgh.host_task([work]()
        {
            work();
        });
    });
    finish_if_sync();
}

void AcceleratorQueue::wait_for_completion()
{
    log::diagnostic(log::Category::QUEUE_SYNC,
        "{} wait for completion", m_name);

    try
    {
        m_queue.wait_and_throw();
    }
    catch (const sycl::exception& e)
    {
        throw device_error(m_name + ": " + e.what());
    }

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(m_error_mutex);
        std::swap(error, m_error);
    }
    if (!error)
    {
        return;
    }

    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        throw device_error(m_name + ": queued work failed: " + e.what());
    }
}

bool AcceleratorQueue::can_access(const DeviceMemory& memory) const
{
    if (memory.is_host_accessible())
    {
        return true;
    }
    return memory.get_device_index() == m_device_index;
}

uint64_t AcceleratorQueue::max_allocation_bytes() const
{
    return static_cast<uint64_t>(
        m_device.get_info<sycl::info::device::max_mem_alloc_size>());
}

bool AcceleratorQueue::uses_cpu() const noexcept
{
    return false;
}

void AcceleratorQueue::release_after(
    std::vector<std::shared_ptr<const DeviceMemory>> held)
{
    m_queue.submit([&](sycl::handler& cgh)
    {
        cgh.host_task([held]() {});
    });
    finish_if_sync();
}

void AcceleratorQueue::finish_if_sync()
{
    if (m_mode == QueueMode::SYNC)
    {
        wait_for_completion();
    }
}

void AcceleratorQueue::on_async_errors(sycl::exception_list errors)
{
    for (auto& e : errors)
    {
        try
        {
            std::rethrow_exception(e);
        }
        catch (const std::exception& ex)
        {
            log::get_logger()->error("{}: SYCL async error: {}",
                m_name, ex.what());

            std::lock_guard<std::mutex> lock(m_error_mutex);
            if (!m_error)
            {
                m_error = std::current_exception();
            }
        }
    }
}

} // namespace stratum
