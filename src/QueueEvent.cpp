/**
 * @file QueueEvent.cpp
 * @brief QueueEvent definitions.
 */

#include "stratum/QueueEvent.hpp"
#include "stratum/Errors.hpp"

#include <atomic>

namespace stratum
{

namespace
{

std::atomic<uint64_t> g_next_event_id {0};

} // namespace

QueueEvent::QueueEvent(QueueEventOptions options)
    : m_id(g_next_event_id.fetch_add(1, std::memory_order_relaxed)),
      m_options(options)
{
}

void QueueEvent::signal()
{
    signal(get_armed_generation());
}

void QueueEvent::signal(uint64_t generation)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation < m_signaled_generation)
        {
            return;
        }
        if (has_option(m_options, QueueEventOptions::TIMING))
        {
            m_recorded_time = clock::now();
        }
        m_signaled_generation = generation;
    }
    m_cv.notify_all();
}

uint64_t QueueEvent::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return ++m_armed_generation;
}

uint64_t QueueEvent::get_armed_generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_armed_generation;
}

void QueueEvent::wait()
{
    wait_for(get_armed_generation());
}

void QueueEvent::wait_for(uint64_t generation)
{
    if (has_option(m_options, QueueEventOptions::DISABLED))
    {
        return;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this, generation]()
    {
        return m_signaled_generation >= generation;
    });
}

bool QueueEvent::is_signaled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_signaled_generation >= m_armed_generation;
}

std::optional<QueueEvent::clock::time_point>
QueueEvent::get_recorded_time() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_recorded_time;
}

double QueueEvent::elapsed_since(const QueueEvent& earlier) const
{
    const auto end = get_recorded_time();
    const auto start = earlier.get_recorded_time();

    STRATUM_CHECK(!end || !start,
        validation_error,
        R"(QueueEvent(elapsed_since):
            both events need a recorded time (TIMING option).)");

    return std::chrono::duration<double>(*end - *start).count();
}

} // namespace stratum
