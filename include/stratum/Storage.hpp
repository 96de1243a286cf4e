/**
 * @file Storage.hpp
 * @brief Declaration of TensorStorage, the per-tensor buffer coherency
 * layer between queues and memory spaces.
 */

#ifndef STRATUM_STORAGE_HPP
#define STRATUM_STORAGE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "DeviceMemory.hpp"
#include "DeviceQueue.hpp"

namespace stratum
{

/**
 * @brief Element buffer of one or more tensor views, replicated across
 * memory spaces on demand.
 *
 * The storage keeps at most one replica per memory space (all unified
 * devices share space 0). The master replica is the one written last.
 * Every access names the queue that will use the buffer:
 *
 * - the queue is ordered after the last writer, and a writing queue also
 *   after every queue that read since, using QueueEvent record/wait;
 * - the replica of the queue's space is allocated lazily and is zero
 *   filled on first use of the storage;
 * - a stale replica is refreshed from the master, by the accessing queue
 *   when it can address both buffers, otherwise by the last writer.
 *
 * Concurrent mutation of one storage from two queues without an event
 * hand-off in between is the caller's responsibility.
 */
class TensorStorage
{
public:

    /**
     * @brief Storage of @p byte_count bytes; nothing is allocated yet.
     */
    explicit TensorStorage(uint64_t byte_count);

    TensorStorage(const TensorStorage&) = delete;
    TensorStorage& operator=(const TensorStorage&) = delete;

    uint64_t get_byte_count() const noexcept { return m_byte_count; }

    /**
     * @brief Replica that @p queue may read once its prior work is done.
     */
    std::shared_ptr<const DeviceMemory> read(DeviceQueue& queue);

    /**
     * @brief Replica that @p queue may read and write; it becomes the
     * master replica.
     */
    std::shared_ptr<DeviceMemory> read_write(DeviceQueue& queue);

    /**
     * @brief Memory space of the master replica.
     * @throws validation_error if the storage was never accessed.
     */
    uint64_t get_master_space() const;

    /**
     * @brief Number of memory spaces holding a replica.
     */
    uint64_t get_replica_count() const;

    /**
     * @brief Queue that last wrote the storage, null before first use.
     */
    const DeviceQueue* get_last_writer() const;

private:

    struct Replica
    {
        std::shared_ptr<DeviceMemory> memory {};
        uint64_t                      version {0};

        /// Queue that copied the current version in, if not the writer.
        DeviceQueue*                  p_filled_by {nullptr};
    };

    std::shared_ptr<DeviceMemory> acquire(DeviceQueue& queue, bool write);

    /// Orders later work on @p consumer after current work on @p producer.
    static void hand_off(DeviceQueue& producer, DeviceQueue& consumer);

    void refresh(DeviceQueue& queue, Replica& replica);

    uint64_t                    m_byte_count;
    mutable std::mutex          m_mutex;
    std::map<uint64_t, Replica> m_replicas;
    uint64_t                    m_version {0};
    uint64_t                    m_master_space {0};
    DeviceQueue*                m_p_last_writer {nullptr};

    /// Queues ordered after the last write, readers included.
    std::vector<DeviceQueue*>   m_synced {};
};

} // namespace stratum

#endif // STRATUM_STORAGE_HPP
