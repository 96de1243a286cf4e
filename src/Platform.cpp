/**
 * @file Platform.cpp
 * @brief Platform registry and queue selection definitions.
 */

#include "stratum/Platform.hpp"
#include "stratum/CpuQueue.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"
#include "stratum/SYCLQueue.hpp"

#include <mutex>
#include <utility>

namespace stratum
{

namespace
{

/// Calling thread's queue selection, valid for one Platform generation.
struct Selection
{
    uint64_t     generation;
    DeviceQueue* p_queue;
};

thread_local Selection t_selection {0, nullptr};

std::mutex                g_platform_mutex;
std::unique_ptr<Platform> g_platform;
std::atomic<uint64_t>     g_next_generation {1};

std::unique_ptr<DeviceQueue> make_cpu_queue(uint64_t device_index,
                                            uint64_t queue_index,
                                            MemoryKind kind,
                                            QueueMode mode)
{
    std::string name = ComputeDevice::queue_name(device_index, queue_index);
    if (mode == QueueMode::ASYNC)
    {
        return std::make_unique<AsyncQueue>(device_index, std::move(name),
            kind);
    }
    return std::make_unique<SyncQueue>(device_index, std::move(name), kind);
}

/// splitmix64 finalizer.
uint64_t mix_seed(uint64_t x)
{
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

} // namespace

Platform::Platform(PlatformConfig config)
    : m_config(std::move(config)),
      m_generation(g_next_generation.fetch_add(1))
{
    m_config.validate();

    log::set_level(m_config.log_level);
    log::set_categories(m_config.log_categories);

    // Device 0: host CPU, unified memory.
    {
        std::vector<std::unique_ptr<DeviceQueue>> queues;
        for (uint64_t q = 0; q < m_config.queues_per_device; ++q)
        {
            queues.push_back(make_cpu_queue(0, q, MemoryKind::UNIFIED,
                m_config.cpu_queue_mode));
        }
        m_devices.push_back(std::make_unique<ComputeDevice>(0,
            MemoryKind::UNIFIED, "host cpu", std::move(queues)));
    }
    m_sync_queue = std::make_unique<SyncQueue>(0, "dev:0_sync",
        MemoryKind::UNIFIED);

    for (uint64_t i = 0; i < m_config.discrete_cpu_devices; ++i)
    {
        const uint64_t index = m_devices.size();
        std::vector<std::unique_ptr<DeviceQueue>> queues;
        for (uint64_t q = 0; q < m_config.queues_per_device; ++q)
        {
            queues.push_back(make_cpu_queue(index, q, MemoryKind::DISCRETE,
                m_config.cpu_queue_mode));
        }
        m_devices.push_back(std::make_unique<ComputeDevice>(index,
            MemoryKind::DISCRETE, "host cpu (discrete)", std::move(queues)));
    }

    if (m_config.use_accelerators)
    {
        add_accelerators(m_devices.size());
    }

    m_sync_queue->set_host_memory_limit(m_config.host_memory_limit);
    for (const auto& dev : m_devices)
    {
        for (uint64_t q = 0; q < dev->get_queue_count(); ++q)
        {
            dev->queue(q).set_host_memory_limit(m_config.host_memory_limit);
        }
    }

    log::get_logger()->info(
        "platform generation {} up: {} device(s), {} queue(s) per device",
        m_generation, m_devices.size(), m_config.queues_per_device);
}

Platform::~Platform()
{
    try
    {
        wait_for_completion();
    }
    catch (const std::exception& e)
    {
        log::get_logger()->error("platform shutdown: {}", e.what());
    }
    log::get_logger()->info("platform generation {} down", m_generation);
}

void Platform::add_accelerators(uint64_t first_index)
{
    std::vector<sycl::device> gpus;
    try
    {
        gpus = sycl::device::get_devices(sycl::info::device_type::gpu);
    }
    catch (const sycl::exception& e)
    {
        throw device_error(
            std::string("Platform: SYCL device enumeration failed: ") +
            e.what());
    }

    if (gpus.empty())
    {
        log::get_logger()->warn("Platform: no SYCL GPU device found");
        return;
    }

    uint64_t index = first_index;
    for (const sycl::device& gpu : gpus)
    {
        std::vector<std::unique_ptr<DeviceQueue>> queues;
        try
        {
            for (uint64_t q = 0; q < m_config.queues_per_device; ++q)
            {
                queues.push_back(std::make_unique<AcceleratorQueue>(index,
                    ComputeDevice::queue_name(index, q), gpu,
                    QueueMode::ASYNC));
            }
        }
        catch (const sycl::exception& e)
        {
            throw device_error("Platform: cannot open dev:" +
                std::to_string(index) + ": " + e.what());
        }
        m_devices.push_back(std::make_unique<ComputeDevice>(index,
            MemoryKind::DISCRETE, gpu.get_info<sycl::info::device::name>(),
            std::move(queues)));
        ++index;
    }
}

Platform& Platform::initialize(PlatformConfig config)
{
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    g_platform.reset();
    g_platform = std::make_unique<Platform>(std::move(config));
    return *g_platform;
}

Platform& Platform::get()
{
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    if (!g_platform)
    {
        g_platform = std::make_unique<Platform>(PlatformConfig::from_env());
    }
    return *g_platform;
}

void Platform::shutdown()
{
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    g_platform.reset();
}

bool Platform::is_initialized()
{
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    return static_cast<bool>(g_platform);
}

ComputeDevice& Platform::device(uint64_t i) const
{
    STRATUM_CHECK(i >= m_devices.size(),
        bounds_error,
        "Platform(device): no device " + std::to_string(i));

    return *m_devices[i];
}

DeviceQueue& Platform::current_queue() const
{
    if (t_selection.generation == m_generation &&
        t_selection.p_queue != nullptr)
    {
        return *t_selection.p_queue;
    }
    return *m_sync_queue;
}

void Platform::use(uint64_t device, uint64_t queue)
{
    DeviceQueue& q = this->device(device).queue(queue);
    exchange_current(&q);
    log::diagnostic(log::Category::SCHEDULING, "using {}", q.get_name());
}

void Platform::use_sync_queue()
{
    exchange_current(nullptr);
}

uint64_t Platform::next_random_seed()
{
    const uint64_t n = m_seed_counter.fetch_add(1);
    return mix_seed(m_config.random_seed ^ mix_seed(n));
}

void Platform::wait_for_completion() const
{
    for (const auto& dev : m_devices)
    {
        dev->wait_for_completion();
    }
}

DeviceQueue* Platform::exchange_current(DeviceQueue* queue)
{
    DeviceQueue* previous = nullptr;
    if (t_selection.generation == m_generation)
    {
        previous = t_selection.p_queue;
    }
    t_selection = Selection{m_generation, queue};
    return previous;
}

QueueScope::QueueScope(uint64_t device, uint64_t queue)
    : QueueScope(Platform::get().device(device).queue(queue))
{
}

QueueScope::QueueScope(DeviceQueue& queue)
{
    Platform& platform = Platform::get();
    m_generation = platform.get_generation();
    m_p_previous = platform.exchange_current(&queue);
}

QueueScope::~QueueScope()
{
    std::lock_guard<std::mutex> lock(g_platform_mutex);
    if (g_platform && g_platform->get_generation() == m_generation)
    {
        g_platform->exchange_current(m_p_previous);
    }
}

DeviceQueue& current_queue()
{
    return Platform::get().current_queue();
}

} // namespace stratum
