/**
 * @file Logging.cpp
 * @brief Runtime logger definitions.
 */

#include "stratum/Logging.hpp"
#include "stratum/Errors.hpp"

#include <atomic>
#include <mutex>
#include <sstream>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stratum::log
{

namespace
{

std::atomic<uint32_t> g_categories {static_cast<uint32_t>(Category::NONE)};

std::once_flag g_logger_once;

} // namespace

std::shared_ptr<spdlog::logger> get_logger()
{
    std::call_once(g_logger_once, []()
    {
        if (!spdlog::get("stratum"))
        {
            auto logger = spdlog::stderr_color_mt("stratum");
            logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
            logger->set_level(spdlog::level::warn);
        }
    });
    return spdlog::get("stratum");
}

void set_level(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

void set_categories(uint32_t mask)
{
    g_categories.store(mask, std::memory_order_relaxed);
}

uint32_t get_categories() noexcept
{
    return g_categories.load(std::memory_order_relaxed);
}

bool is_enabled(Category category) noexcept
{
    const uint32_t mask = g_categories.load(std::memory_order_relaxed);
    if ((mask & static_cast<uint32_t>(category)) == 0)
    {
        return false;
    }
    return get_logger()->should_log(spdlog::level::debug);
}

uint32_t parse_categories(const std::string& list)
{
    uint32_t mask = 0;
    std::stringstream ss(list);
    std::string name;
    while (std::getline(ss, name, ','))
    {
        // Trim surrounding blanks.
        const auto first = name.find_first_not_of(" \t");
        if (first == std::string::npos)
        {
            continue;
        }
        const auto last = name.find_last_not_of(" \t");
        name = name.substr(first, last - first + 1);

        if (name == "allocations")
        {
            mask |= static_cast<uint32_t>(Category::ALLOCATIONS);
        }
        else if (name == "copies")
        {
            mask |= static_cast<uint32_t>(Category::COPIES);
        }
        else if (name == "queue_sync")
        {
            mask |= static_cast<uint32_t>(Category::QUEUE_SYNC);
        }
        else if (name == "scheduling")
        {
            mask |= static_cast<uint32_t>(Category::SCHEDULING);
        }
        else if (name == "all")
        {
            mask |= static_cast<uint32_t>(Category::ALL);
        }
        else if (name != "none")
        {
            STRATUM_CHECK(true, validation_error,
                "parse_categories: unknown log category '" + name + "'");
        }
    }
    return mask;
}

} // namespace stratum::log
