/**
 * @file types.hpp
 * @brief Common type definitions for Heartfield
 *
 * Result codes and clock aliases shared by every module of the library.
 */

#ifndef HEARTFIELD_CORE_TYPES_HPP
#define HEARTFIELD_CORE_TYPES_HPP

#include <chrono>

namespace heartfield {
namespace core {

/**
 * @brief Result codes returned by fallible operations
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_INVALID_PARAMETER,    ///< Rejected argument or configuration value
    ERROR_CAMERA_NOT_FOUND,     ///< Hand pose source could not be opened
    ERROR_CONFIG_INVALID        ///< Configuration section failed validation
};

using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

} // namespace core
} // namespace heartfield

#endif // HEARTFIELD_CORE_TYPES_HPP
