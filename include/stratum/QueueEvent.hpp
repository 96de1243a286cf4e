/**
 * @file QueueEvent.hpp
 * @brief Declaration of the QueueEvent synchronization primitive.
 */

#ifndef STRATUM_QUEUEEVENT_HPP
#define STRATUM_QUEUEEVENT_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace stratum
{

/**
 * @brief Event creation options, combinable as flags.
 */
enum class QueueEventOptions : uint32_t
{
    NONE         = 0,
    TIMING       = 1u << 0, ///< record the time of signaling
    INTERPROCESS = 1u << 1, ///< shareable across processes (informational on CPU)
    DISABLED     = 1u << 2  ///< record and wait are no-ops
};

inline QueueEventOptions operator|(QueueEventOptions a, QueueEventOptions b)
{
    return static_cast<QueueEventOptions>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool has_option(QueueEventOptions set, QueueEventOptions flag)
{
    return (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) != 0;
}

/**
 * @brief Signals that queued work up to the point of recording has run.
 *
 * An event starts unsignaled. A queue's `record` arms a new generation and
 * queues a signal for it; `wait` blocks until the generation armed at the
 * time of the call is signaled. A signal queued by an older `record` never
 * satisfies a wait on a newer one. Waiting on an event that is never
 * recorded blocks forever.
 */
class QueueEvent
{
public:

    using clock = std::chrono::steady_clock;

    explicit QueueEvent(QueueEventOptions options = QueueEventOptions::NONE);

    QueueEvent(const QueueEvent&) = delete;
    QueueEvent& operator=(const QueueEvent&) = delete;

    /**
     * @brief Unique event identity, used in diagnostics.
     */
    uint64_t get_id() const noexcept { return m_id; }

    QueueEventOptions get_options() const noexcept { return m_options; }

    /**
     * @brief Marks the currently armed generation signaled.
     */
    void signal();

    /**
     * @brief Marks generation @p generation (and all older ones) signaled
     * and wakes all waiters.
     *
     * Stores the signaling time when the TIMING option is set. A signal for
     * a generation older than the last one signaled has no effect.
     */
    void signal(uint64_t generation);

    /**
     * @brief Returns the event to the unsignaled state.
     *
     * @return the newly armed generation
     */
    uint64_t reset();

    /// Generation a signal must reach for the event to count as signaled.
    uint64_t get_armed_generation() const;

    /**
     * @brief Blocks the calling thread until the currently armed generation
     * is signaled.
     *
     * Returns immediately for DISABLED events.
     */
    void wait();

    /**
     * @brief Blocks the calling thread until @p generation is signaled.
     */
    void wait_for(uint64_t generation);

    bool is_signaled() const;

    /**
     * @brief Time of the last signal, if TIMING is set and it happened.
     */
    std::optional<clock::time_point> get_recorded_time() const;

    /**
     * @brief Seconds elapsed between @p earlier and this event.
     *
     * @throws validation_error if either event has no recorded time.
     */
    double elapsed_since(const QueueEvent& earlier) const;

private:
    uint64_t                         m_id;
    QueueEventOptions                m_options;
    mutable std::mutex               m_mutex;
    std::condition_variable          m_cv;
    uint64_t                         m_armed_generation {1};
    uint64_t                         m_signaled_generation {0};
    std::optional<clock::time_point> m_recorded_time {};
};

} // namespace stratum

#endif // STRATUM_QUEUEEVENT_HPP
