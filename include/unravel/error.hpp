/**
 * @file error.hpp
 * @brief unravel error handling.
 *
 * Error codes are used on every hot path (decoder attempts, session
 * updates). Exceptions are reserved for programmer errors such as an
 * invalid controller configuration.
 */

#ifndef UNRAVEL_ERROR_HPP
#define UNRAVEL_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace unravel {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    InvalidData = -2, ///< Input not well-formed for the requested encoding
    InvalidState = -3 ///< Operation not allowed in the current state
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::InvalidData:
        return "Invalid or malformed data";
    case Error::InvalidState:
        return "Invalid state";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for unravel errors.
 */
class UnravelException : public std::runtime_error {
public:
    explicit UnravelException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public UnravelException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : UnravelException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for operations on a frozen or inconsistent state.
 */
class InvalidStateException : public UnravelException {
public:
    explicit InvalidStateException(const std::string& message)
        : UnravelException(message, Error::InvalidState) {}
};

} // namespace unravel

#endif // UNRAVEL_ERROR_HPP
