/**
 * @file CpuQueue.cpp
 * @brief SyncQueue and AsyncQueue definitions.
 */

#include "stratum/CpuQueue.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

#include <utility>

namespace stratum
{

SyncQueue::SyncQueue(uint64_t device_index, std::string name, MemoryKind kind)
    : DeviceQueue(device_index, std::move(name), kind, QueueMode::SYNC)
{
}

void SyncQueue::submit(work_fn work)
{
    work();
}

AsyncQueue::AsyncQueue(uint64_t device_index, std::string name,
                       MemoryKind kind)
    : DeviceQueue(device_index, std::move(name), kind, QueueMode::ASYNC)
{
    m_worker = std::thread([this]() { worker_loop(); });
}

AsyncQueue::~AsyncQueue()
{
    drain();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv_work.notify_all();
    if (m_worker.joinable())
    {
        m_worker.join();
    }
    if (m_error)
    {
        log::get_logger()->error(
            "{} destroyed with an unreported work failure", m_name);
    }
}

void AsyncQueue::submit(work_fn work)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channel.push_back(std::move(work));
        ++m_pending;
    }
    m_cv_work.notify_one();
}

void AsyncQueue::wait_for_completion()
{
    log::diagnostic(log::Category::QUEUE_SYNC,
        "{} wait for completion", m_name);

    drain();

    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
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
    catch (...)
    {
        throw device_error(m_name +
            ": queued work failed with a non-standard exception");
    }
}

uint64_t AsyncQueue::get_pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

void AsyncQueue::drain()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv_idle.wait(lock, [this]() { return m_pending == 0; });
}

void AsyncQueue::worker_loop()
{
    for (;;)
    {
        work_fn work;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv_work.wait(lock,
                [this]() { return m_stop || !m_channel.empty(); });

            if (m_channel.empty())
            {
                return;
            }
            work = std::move(m_channel.front());
            m_channel.pop_front();
        }

        try
        {
            work();
        }
        catch (const std::exception& e)
        {
            log::get_logger()->error("{}: queued work failed: {}",
                m_name, e.what());

            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_error)
            {
                m_error = std::current_exception();
            }
        }
        catch (...)
        {
            log::get_logger()->error(
                "{}: queued work failed with a non-standard exception",
                m_name);

            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_error)
            {
                m_error = std::current_exception();
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_pending;
            if (m_pending == 0)
            {
                m_cv_idle.notify_all();
            }
        }
    }
}

} // namespace stratum
