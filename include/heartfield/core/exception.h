#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the Heartfield library
 */

namespace heartfield {
namespace core {

/**
 * @brief Base exception class for all Heartfield exceptions
 *
 * Carries a result code and the throw site context next to the message.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    /**
     * @brief Get the result code
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
     */
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Rejected construction or configuration parameters
 */
class InvalidParameterException : public Exception {
public:
    InvalidParameterException(const std::string& message,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Configuration file related exceptions
 */
class ConfigException : public Exception {
public:
    ConfigException(ResultCode code,
                    const std::string& message,
                    const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define HEARTFIELD_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define HEARTFIELD_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace heartfield
