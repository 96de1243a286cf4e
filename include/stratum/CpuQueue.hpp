/**
 * @file CpuQueue.hpp
 * @brief Declaration of the host CPU queues.
 *
 * SyncQueue runs every unit of work inline on the calling thread.
 * AsyncQueue owns one background worker draining a FIFO channel.
 */

#ifndef STRATUM_CPUQUEUE_HPP
#define STRATUM_CPUQUEUE_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

#include "DeviceQueue.hpp"

namespace stratum
{

/**
 * @brief Host queue executing work inline.
 *
 * Never creates concurrency; every operation has completed when it
 * returns, so wait_for_completion() is a no-op.
 */
class SyncQueue : public DeviceQueue
{
public:
    SyncQueue(uint64_t device_index, std::string name, MemoryKind kind);

    void submit(work_fn work) override;
};

/**
 * @brief Host queue deferring work to a background worker thread.
 *
 * Units of work run one at a time, in submission order. A completion
 * counter tracks submitted but unfinished work so that
 * wait_for_completion() can block until the channel drains.
 */
class AsyncQueue : public DeviceQueue
{
public:
    AsyncQueue(uint64_t device_index, std::string name, MemoryKind kind);

    /**
     * @brief Drains pending work and joins the worker.
     */
    ~AsyncQueue() override;

    void submit(work_fn work) override;

    void wait_for_completion() override;

    /**
     * @brief Number of submitted units of work that have not finished.
     */
    uint64_t get_pending() const;

private:
    void worker_loop();

    /// Blocks until the channel is empty and no work is running.
    void drain();

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv_work;
    std::condition_variable m_cv_idle;
    std::deque<work_fn>     m_channel;
    uint64_t                m_pending {0};
    bool                    m_stop {false};
    std::exception_ptr      m_error {};
    std::thread             m_worker;
};

} // namespace stratum

#endif // STRATUM_CPUQUEUE_HPP
