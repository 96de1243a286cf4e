/**
 * @file Errors.hpp
 * @brief Centralized error handling utilities.
 *
 * Provides the exception taxonomy of the runtime and a macro for
 * runtime error checking that can be disabled at compile-time with
 * the STRATUM_DISABLE_ERROR_CHECKS flag.
 */
#ifndef STRATUM_ERRORS_HPP
#define STRATUM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stratum
{

/**
 * @brief Validation error class for stratum library.
 * Used to signal precondition violations: shape, rank or order mismatch
 * between operands, invalid configuration values.
 */
class validation_error : public std::invalid_argument
{
public:
    explicit validation_error(const std::string& message)
        : std::invalid_argument("Validation Error: " + message) {}
};

/**
 * @brief Bounds error class for stratum library.
 * Used to signal index, axis or slice ranges outside a view's extents.
 */
class bounds_error : public std::out_of_range
{
public:
    explicit bounds_error(const std::string& message)
        : std::out_of_range("Bounds Error: " + message) {}
};

/**
 * @brief Allocation error class for stratum library.
 * Raised when a device cannot satisfy an allocation request.
 * Fatal to the requesting operation, never retried.
 */
class allocation_error : public std::runtime_error
{
public:
    explicit allocation_error(const std::string& message)
        : std::runtime_error("Allocation Error: " + message) {}
};

/**
 * @brief Layout error class for stratum library.
 * Raised by the dispatcher for a combination of physical layouts
 * it has no traversal adapter for.
 */
class layout_error : public std::logic_error
{
public:
    explicit layout_error(const std::string& message)
        : std::logic_error("Layout Error: " + message) {}
};

/**
 * @brief Device-side error class for stratum library.
 * Used to signal failures reported by a backend, or by a unit of
 * work that ran on a queue's background channel.
 */
class device_error : public std::runtime_error
{
public:
    explicit device_error(const std::string& message)
        : std::runtime_error("Device Error: " + message) {}
};

} // namespace stratum

/**
 * @brief Error checking macro.
 *
 * Evaluates a condition and throws the specified exception type
 * with the given message if the condition is true.
 * Can be disabled at compile-time with STRATUM_DISABLE_ERROR_CHECKS.
 *
 * @param condition The condition to check (throws if true)
 * @param exception_type The exception type to throw
 * @param message The error message
 *
 * Usage:
 *   STRATUM_CHECK(a.get_shape() != b.get_shape(), validation_error,
 *       "map_op: shape mismatch");
 */
#ifndef STRATUM_DISABLE_ERROR_CHECKS
  #define STRATUM_CHECK(condition, exception_type, message) \
   do \
   { \
      if (condition) \
      { \
         throw exception_type(message); \
      } \
   } while(0)
#else
  #define STRATUM_CHECK(condition, exception_type, message) ((void)0)
#endif

#endif // STRATUM_ERRORS_HPP
