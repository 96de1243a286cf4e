/**
 * @file DeviceQueue.hpp
 * @brief Declaration of the DeviceQueue work submission interface.
 *
 * A DeviceQueue is an ordered channel bound to one device. Everything a
 * compute backend has to provide is declared here; the behaviour shared by
 * all backends (event record/wait, host allocation and copies) is
 * implemented once in terms of `submit()`, which runs work inline for a
 * synchronous queue and defers it for an asynchronous one.
 */

#ifndef STRATUM_DEVICEQUEUE_HPP
#define STRATUM_DEVICEQUEUE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "Config.hpp"
#include "DeviceMemory.hpp"
#include "QueueEvent.hpp"

namespace stratum
{

/**
 * @brief Abstract ordered work queue bound to one device.
 *
 * All work submitted to one queue runs in submission order. There is no
 * ordering between two queues except through record() on the producer
 * and wait() on the consumer.
 */
class DeviceQueue
{
public:

    /// A unit of queued work.
    using work_fn = std::function<void()>;

    /**
     * @brief Base queue constructor.
     *
     * @param device_index Index of the owning device.
     * @param name Diagnostic name, conventionally "dev:<d>_q<i>".
     * @param kind Memory kind of the owning device.
     * @param mode Whether work runs inline or deferred.
     */
    DeviceQueue(uint64_t device_index,
                std::string name,
                MemoryKind kind,
                QueueMode mode);

    virtual ~DeviceQueue() = default;

    DeviceQueue(const DeviceQueue&) = delete;
    DeviceQueue& operator=(const DeviceQueue&) = delete;

    /**
     * @brief Allocates @p byte_count bytes on the queue's device.
     *
     * The default allocates host memory aligned for any scalar type.
     *
     * @param byte_count Number of bytes.
     * @param heap_index Reserved, must be 0.
     * @return Shared handle to the new allocation.
     *
     * @throws allocation_error if the device cannot provide the storage.
     * @throws validation_error if @p heap_index is not 0.
     */
    virtual std::shared_ptr<DeviceMemory>
    allocate(uint64_t byte_count, uint64_t heap_index = 0);

    /**
     * @brief Queues a byte-exact copy from @p src to @p dst.
     *
     * The default performs a host memcpy as a unit of work; both buffers
     * must be host accessible.
     *
     * @throws validation_error if sizes differ or the queue cannot access
     * both buffers.
     */
    virtual void copy_async(std::shared_ptr<const DeviceMemory> src,
                            std::shared_ptr<DeviceMemory> dst);

    /**
     * @brief Queues a zero fill of @p dst.
     */
    virtual void zero_async(std::shared_ptr<DeviceMemory> dst);

    /**
     * @brief Creates an unsignaled event.
     */
    virtual std::shared_ptr<QueueEvent> create_event(QueueEventOptions options);

    /**
     * @brief Creates an event with the queue's default options.
     */
    std::shared_ptr<QueueEvent> create_event();

    /**
     * @brief Resets @p event and queues its signal after all prior work.
     *
     * A synchronous queue signals before returning.
     *
     * @return @p event, so calls can be nested.
     */
    virtual std::shared_ptr<QueueEvent>
    record(std::shared_ptr<QueueEvent> event);

    /**
     * @brief Orders later work on this queue after @p event.
     *
     * Asynchronous queues do not block the caller; a synchronous queue
     * blocks the caller until the event fires. Waiting on an event that is
     * never recorded blocks forever.
     */
    virtual void wait(std::shared_ptr<QueueEvent> event);

    /**
     * @brief Blocks until all previously submitted work has finished.
     *
     * No-op for a synchronous queue.
     *
     * @throws device_error carrying the first failure raised by a unit of
     * work since the last call.
     */
    virtual void wait_for_completion();

    /**
     * @brief Runs @p work inline or appends it to the work channel.
     */
    virtual void submit(work_fn work) = 0;

    /**
     * @brief True if work on this queue may dereference @p memory.
     */
    virtual bool can_access(const DeviceMemory& memory) const;

    /**
     * @brief Largest single allocation the device accepts, 0 = unlimited.
     */
    virtual uint64_t max_allocation_bytes() const;

    /**
     * @brief True if the queue executes its work on the host CPU.
     */
    virtual bool uses_cpu() const noexcept;

    /**
     * @brief Key of the memory space the queue's allocations live in.
     *
     * All unified devices share space 0, each discrete device has the
     * space of its own index.
     */
    uint64_t get_memory_space() const noexcept;

    uint64_t get_id() const noexcept { return m_id; }
    const std::string& get_name() const noexcept { return m_name; }
    uint64_t get_device_index() const noexcept { return m_device_index; }
    MemoryKind get_memory_kind() const noexcept { return m_memory_kind; }
    QueueMode get_mode() const noexcept { return m_mode; }

    QueueEventOptions get_default_event_options() const noexcept
    {
        return m_default_event_options;
    }

    void set_default_event_options(QueueEventOptions options) noexcept
    {
        m_default_event_options = options;
    }

    /**
     * @brief Sets the host allocation limit used by the default allocate().
     */
    void set_host_memory_limit(uint64_t bytes) noexcept
    {
        m_host_memory_limit = bytes;
    }

protected:
    uint64_t          m_id;
    uint64_t          m_device_index;
    std::string       m_name;
    MemoryKind        m_memory_kind;
    QueueMode         m_mode;
    QueueEventOptions m_default_event_options {QueueEventOptions::NONE};
    uint64_t          m_host_memory_limit {0};
};

} // namespace stratum

#endif // STRATUM_DEVICEQUEUE_HPP
