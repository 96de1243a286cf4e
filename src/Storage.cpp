/**
 * @file Storage.cpp
 * @brief TensorStorage coherency definitions.
 */

#include "stratum/Storage.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

#include <algorithm>

namespace stratum
{

TensorStorage::TensorStorage(uint64_t byte_count)
    : m_byte_count(byte_count)
{
}

std::shared_ptr<const DeviceMemory> TensorStorage::read(DeviceQueue& queue)
{
    return acquire(queue, false);
}

std::shared_ptr<DeviceMemory> TensorStorage::read_write(DeviceQueue& queue)
{
    return acquire(queue, true);
}

uint64_t TensorStorage::get_master_space() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    STRATUM_CHECK(m_p_last_writer == nullptr,
        validation_error,
        R"(TensorStorage(get_master_space): storage never accessed.)");
    return m_master_space;
}

uint64_t TensorStorage::get_replica_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<uint64_t>(m_replicas.size());
}

const DeviceQueue* TensorStorage::get_last_writer() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_p_last_writer;
}

std::shared_ptr<DeviceMemory>
TensorStorage::acquire(DeviceQueue& queue, bool write)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const bool first_use = (m_p_last_writer == nullptr);
    const bool synced = std::find(m_synced.begin(), m_synced.end(),
        &queue) != m_synced.end();

    if (!first_use && m_p_last_writer != &queue && !synced)
    {
        hand_off(*m_p_last_writer, queue);
    }

    if (write)
    {
        for (DeviceQueue* p_reader : m_synced)
        {
            if (p_reader != &queue && p_reader != m_p_last_writer)
            {
                hand_off(*p_reader, queue);
            }
        }
    }

    const uint64_t space = queue.get_memory_space();
    Replica& replica = m_replicas[space];
    if (!replica.memory)
    {
        replica.memory = queue.allocate(m_byte_count);
    }

    if (first_use)
    {
        queue.zero_async(replica.memory);
        m_master_space = space;
        replica.version = m_version;
        replica.p_filled_by = nullptr;
        // The zero fill counts as the first write.
        m_p_last_writer = &queue;
        m_synced.clear();
    }
    else if (replica.version != m_version)
    {
        refresh(queue, replica);
    }
    else if (replica.p_filled_by != nullptr &&
             replica.p_filled_by != &queue &&
             replica.p_filled_by != m_p_last_writer)
    {
        hand_off(*replica.p_filled_by, queue);
    }

    if (write)
    {
        ++m_version;
        replica.version = m_version;
        replica.p_filled_by = nullptr;
        m_master_space = space;
        m_p_last_writer = &queue;
        m_synced.clear();
    }
    else if (m_p_last_writer != &queue && !synced)
    {
        m_synced.push_back(&queue);
    }

    return replica.memory;
}

void TensorStorage::hand_off(DeviceQueue& producer, DeviceQueue& consumer)
{
    log::diagnostic(log::Category::QUEUE_SYNC,
        "hand off {} -> {}", producer.get_name(), consumer.get_name());

    consumer.wait(producer.record(producer.create_event()));
}

void TensorStorage::refresh(DeviceQueue& queue, Replica& replica)
{
    std::shared_ptr<const DeviceMemory> master =
        m_replicas.at(m_master_space).memory;

    log::diagnostic(log::Category::COPIES,
        "replicate {} bytes space {} -> space {} for {}", m_byte_count,
        m_master_space, queue.get_memory_space(), queue.get_name());

    if (queue.can_access(*master) && queue.can_access(*replica.memory))
    {
        queue.copy_async(master, replica.memory);
        replica.p_filled_by = &queue;
    }
    else
    {
        DeviceQueue& writer = *m_p_last_writer;
        STRATUM_CHECK(!writer.can_access(*replica.memory),
            device_error,
            "TensorStorage(refresh): neither " + queue.get_name() +
            " nor " + writer.get_name() + " can address both replicas");

        writer.copy_async(master, replica.memory);
        hand_off(writer, queue);
        replica.p_filled_by = nullptr;
    }
    replica.version = m_version;
}

} // namespace stratum
