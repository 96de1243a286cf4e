/**
 * @file SYCLQueue.hpp
 * @brief Declaration of the SYCL accelerator queue.
 *
 * AcceleratorQueue wraps one in-order `sycl::queue`. Memory is allocated
 * as device USM, copies and fills are SYCL commands, and host-side units
 * of work (event signal and wait) run as host tasks so they keep their
 * place in the queue's order.
 */

#ifndef STRATUM_SYCLQUEUE_HPP
#define STRATUM_SYCLQUEUE_HPP

#include <sycl/sycl.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "DeviceQueue.hpp"

namespace stratum
{

/**
 * @brief Queue bound to a SYCL device with discrete memory.
 */
class AcceleratorQueue : public DeviceQueue
{
public:

    /**
     * @brief Creates an in-order SYCL queue on @p device.
     */
    AcceleratorQueue(uint64_t device_index,
                     std::string name,
                     const sycl::device& device,
                     QueueMode mode);

    ~AcceleratorQueue() override;

    std::shared_ptr<DeviceMemory>
    allocate(uint64_t byte_count, uint64_t heap_index = 0) override;

    void copy_async(std::shared_ptr<const DeviceMemory> src,
                    std::shared_ptr<DeviceMemory> dst) override;

    void zero_async(std::shared_ptr<DeviceMemory> dst) override;

    /**
     * @brief Runs @p work as a host task in queue order.
     */
    void submit(work_fn work) override;

    void wait_for_completion() override;

    bool can_access(const DeviceMemory& memory) const override;

    uint64_t max_allocation_bytes() const override;

    bool uses_cpu() const noexcept override;

    sycl::queue& get_sycl_queue() noexcept { return m_queue; }

    /**
     * @brief Launches @p kernel over `[0, count)` as one parallel_for.
     *
     * @p keep_alive is released by a host task ordered after the kernel,
     * so the buffers the kernel touches outlive it. A SYNC queue waits
     * for the kernel before returning.
     */
    template <typename kernel_t>
    void launch(uint64_t count,
                kernel_t kernel,
                std::vector<std::shared_ptr<const DeviceMemory>> keep_alive)
    {
        if (count > 0)
        {
            m_queue.parallel_for(sycl::range<1>(static_cast<size_t>(count)),
                [=](sycl::id<1> idx)
            {
                kernel(static_cast<uint64_t>(idx[0]));
            });
        }
        release_after(std::move(keep_alive));
    }

    /**
     * @brief Copies @p host_values into a fresh device buffer.
     *
     * The host vector is kept alive until the copy has run.
     */
    template <typename value_t>
    std::shared_ptr<DeviceMemory>
    stage_to_device(std::shared_ptr<std::vector<value_t>> host_values)
    {
        const uint64_t bytes =
            static_cast<uint64_t>(host_values->size() * sizeof(value_t));
        std::shared_ptr<DeviceMemory> staged = allocate(bytes);
        if (bytes > 0)
        {
            m_queue.memcpy(staged->get_data(), host_values->data(),
                static_cast<size_t>(bytes));
        }
        m_queue.submit([&](sycl::handler& cgh)
        {
            cgh.host_task([host_values]() {});
        });
        finish_if_sync();
        return staged;
    }

private:

    /// Queues a host task dropping @p held after prior commands.
    void release_after(std::vector<std::shared_ptr<const DeviceMemory>> held);

    /// Waits for the queue when in SYNC mode.
    void finish_if_sync();

    /// Stores the first asynchronous SYCL error.
    void on_async_errors(sycl::exception_list errors);

    sycl::device       m_device;
    sycl::queue        m_queue;
    std::mutex         m_error_mutex;
    std::exception_ptr m_error {};
};

} // namespace stratum

#endif // STRATUM_SYCLQUEUE_HPP
