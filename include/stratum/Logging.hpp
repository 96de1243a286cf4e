/**
 * @file Logging.hpp
 * @brief Runtime logger and diagnostic categories.
 *
 * All components log through one spdlog logger named "stratum".
 * Debug-level diagnostics are additionally gated by a category mask so
 * that, for example, queue synchronization can be traced without
 * flooding the output with allocation messages.
 */

#ifndef STRATUM_LOGGING_HPP
#define STRATUM_LOGGING_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace stratum::log
{

/**
 * @brief Diagnostic categories, combinable as a bit mask.
 */
enum class Category : uint32_t
{
    NONE        = 0,
    ALLOCATIONS = 1u << 0, ///< device memory allocation and release
    COPIES      = 1u << 1, ///< data movement between memory spaces
    QUEUE_SYNC  = 1u << 2, ///< event record / wait, completion waits
    SCHEDULING  = 1u << 3, ///< dispatcher decisions and submissions
    ALL         = 0xffu
};

/**
 * @brief Returns the library logger, creating it on first use.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Sets the logger level.
 */
void set_level(spdlog::level::level_enum level);

/**
 * @brief Replaces the enabled diagnostic category mask.
 */
void set_categories(uint32_t mask);

/**
 * @brief Returns the enabled diagnostic category mask.
 */
uint32_t get_categories() noexcept;

/**
 * @brief True if @p category is enabled and the logger emits debug.
 */
bool is_enabled(Category category) noexcept;

/**
 * @brief Parses a comma separated category list.
 *
 * Accepted names: "allocations", "copies", "queue_sync", "scheduling",
 * "all", "none".
 *
 * @throws validation_error on an unknown name.
 */
uint32_t parse_categories(const std::string& list);

/**
 * @brief Emits a debug message if @p category is enabled.
 */
template <typename... Args>
inline void diagnostic(Category category,
                       spdlog::format_string_t<Args...> fmt,
                       Args&&... args)
{
    if (is_enabled(category))
    {
        get_logger()->debug(fmt, std::forward<Args>(args)...);
    }
}

} // namespace stratum::log

#endif // STRATUM_LOGGING_HPP
