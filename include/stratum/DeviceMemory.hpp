/**
 * @file DeviceMemory.hpp
 * @brief Declaration of the DeviceMemory allocation handle.
 */

#ifndef STRATUM_DEVICEMEMORY_HPP
#define STRATUM_DEVICEMEMORY_HPP

#include <cstdint>
#include <functional>
#include <memory>

namespace stratum
{

/**
 * @brief Kind of memory a device exposes.
 */
enum class MemoryKind
{
    UNIFIED,    ///< host visible, shared by all unified devices
    DISCRETE    ///< private to its device
};

/**
 * @brief An opaque, fixed-size allocation on one device.
 *
 * Instances are always owned through `std::shared_ptr` and shared by every
 * tensor view over the allocation; the release function runs when the last
 * reference is dropped. Size never changes after allocation.
 */
class DeviceMemory
{
public:

    /// Function releasing the buffer.
    using release_fn = std::function<void(void*)>;

    /**
     * @brief Wrap an existing buffer.
     *
     * @param device_index Index of the owning device.
     * @param p_data Buffer start (may be null when @p byte_count is 0).
     * @param byte_count Buffer size in bytes.
     * @param kind Memory kind of the owning device.
     * @param host_accessible True if the host may dereference @p p_data.
     * @param release Called with @p p_data on destruction, may be empty
     * for non-owning wrappers.
     */
    DeviceMemory(uint64_t device_index,
                 void* p_data,
                 uint64_t byte_count,
                 MemoryKind kind,
                 bool host_accessible,
                 release_fn release);

    /**
     * @brief Non-owning unified wrapper around caller host memory.
     *
     * Used to stage host data through the queue copy contract.
     */
    static std::shared_ptr<DeviceMemory> wrap_host(void* p_data,
                                                   uint64_t byte_count);

    DeviceMemory(const DeviceMemory&) = delete;
    DeviceMemory& operator=(const DeviceMemory&) = delete;

    ~DeviceMemory();

    void* get_data() noexcept { return m_p_data; }
    const void* get_data() const noexcept { return m_p_data; }
    uint64_t get_byte_count() const noexcept { return m_byte_count; }
    uint64_t get_device_index() const noexcept { return m_device_index; }
    MemoryKind get_kind() const noexcept { return m_kind; }
    bool is_host_accessible() const noexcept { return m_host_accessible; }

private:
    uint64_t   m_device_index;
    void*      m_p_data;
    uint64_t   m_byte_count;
    MemoryKind m_kind;
    bool       m_host_accessible;
    release_fn m_release;
};

} // namespace stratum

#endif // STRATUM_DEVICEMEMORY_HPP
