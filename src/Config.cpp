/**
 * @file Config.cpp
 * @brief Platform configuration parsing.
 */

#include "stratum/Config.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace stratum
{

namespace
{

std::string trim_lower(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\n");
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\n");
    std::string out = text.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* env_or_null(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return nullptr;
    }
    return value;
}

} // namespace

namespace config
{

uint64_t parse_uint(const std::string& text, const std::string& what)
{
    const std::string s = trim_lower(text);
    STRATUM_CHECK(s.empty(), validation_error,
        what + ": expected an unsigned integer, got an empty value");

    constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : s)
    {
        STRATUM_CHECK(c < '0' || c > '9', validation_error,
            what + ": expected an unsigned integer, got '" + text + "'");

        const uint64_t digit = static_cast<uint64_t>(c - '0');
        STRATUM_CHECK(value > (U64_MAX - digit) / 10, validation_error,
            what + ": value overflows uint64_t");
        value = value * 10 + digit;
    }
    return value;
}

bool parse_bool(const std::string& text, const std::string& what)
{
    const std::string s = trim_lower(text);
    if (s == "1" || s == "true" || s == "on" || s == "yes")
    {
        return true;
    }
    if (s == "0" || s == "false" || s == "off" || s == "no")
    {
        return false;
    }
    throw validation_error(what + ": expected a boolean, got '" + text + "'");
}

} // namespace config

PlatformConfig PlatformConfig::from_env()
{
    PlatformConfig cfg;

    if (const char* v = env_or_null("STRATUM_QUEUES_PER_DEVICE"))
    {
        cfg.queues_per_device =
            config::parse_uint(v, "STRATUM_QUEUES_PER_DEVICE");
    }

    if (const char* v = env_or_null("STRATUM_CPU_QUEUE_MODE"))
    {
        const std::string mode = trim_lower(v);
        if (mode == "sync")
        {
            cfg.cpu_queue_mode = QueueMode::SYNC;
        }
        else if (mode == "async")
        {
            cfg.cpu_queue_mode = QueueMode::ASYNC;
        }
        else
        {
            throw validation_error(
                "STRATUM_CPU_QUEUE_MODE: expected 'sync' or 'async', got '" +
                std::string(v) + "'");
        }
    }

    if (const char* v = env_or_null("STRATUM_DISCRETE_CPU_DEVICES"))
    {
        cfg.discrete_cpu_devices =
            config::parse_uint(v, "STRATUM_DISCRETE_CPU_DEVICES");
    }

    if (const char* v = env_or_null("STRATUM_USE_ACCELERATORS"))
    {
        cfg.use_accelerators =
            config::parse_bool(v, "STRATUM_USE_ACCELERATORS");
    }

    if (const char* v = env_or_null("STRATUM_HOST_MEMORY_LIMIT"))
    {
        cfg.host_memory_limit =
            config::parse_uint(v, "STRATUM_HOST_MEMORY_LIMIT");
    }

    if (const char* v = env_or_null("STRATUM_LOG_LEVEL"))
    {
        const std::string name = trim_lower(v);
        const auto level = spdlog::level::from_str(name);

        // from_str() maps unknown names to "off"; only accept that for "off".
        STRATUM_CHECK(level == spdlog::level::off && name != "off",
            validation_error,
            "STRATUM_LOG_LEVEL: unknown level '" + std::string(v) + "'");
        cfg.log_level = level;
    }

    if (const char* v = env_or_null("STRATUM_LOG_CATEGORIES"))
    {
        cfg.log_categories = log::parse_categories(trim_lower(v));
    }

    if (const char* v = env_or_null("STRATUM_SEED"))
    {
        cfg.random_seed = config::parse_uint(v, "STRATUM_SEED");
    }

    cfg.validate();
    return cfg;
}

void PlatformConfig::validate() const
{
    STRATUM_CHECK(queues_per_device == 0, validation_error,
        "PlatformConfig: queues_per_device must be at least 1");
}

} // namespace stratum
