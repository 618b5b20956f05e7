/**
 * @file error.hpp
 * @brief xdrin error handling.
 *
 * Provides both error-code-based and exception-based error handling
 * for embedded compatibility (-fno-exceptions).
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef XDRIN_ERROR_HPP
#define XDRIN_ERROR_HPP

#include "config.hpp"

#if !XDRIN_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace xdrin {

/**
 * @brief Error codes returned by every decoder.
 *
 * One code per failure class. A decoder never returns a partial value
 * together with an error.
 */
enum class Error {
    Ok = 0,                        ///< Success
    BoolBadFormat = -1,            ///< Boolean not 0/1, or fewer than 4 bytes
    IntegerBadFormat = -2,         ///< Fewer than 4 bytes for an int32
    UnsignedIntegerBadFormat = -3, ///< Fewer than 4 bytes for a uint32
    HyperBadFormat = -4,           ///< Fewer than 8 bytes for an int64
    UnsignedHyperBadFormat = -5,   ///< Fewer than 8 bytes for a uint64
    FloatBadFormat = -6,           ///< Fewer than 4 bytes for a float
    DoubleBadFormat = -7,          ///< Fewer than 8 bytes for a double
    StringBadFormat = -8,          ///< Truncated string payload or invalid UTF-8
    BadArraySize = -9,             ///< Length above maximum, or truncated fixed data
    VarArrayWrongSize = -10,       ///< Bounded string longer than its maximum
    InvalidEnumValue = -11         ///< Discriminant outside the declared set
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
    case Error::BoolBadFormat:
        return "Boolean is not 0 or 1";
    case Error::IntegerBadFormat:
        return "Not enough data for integer";
    case Error::UnsignedIntegerBadFormat:
        return "Not enough data for unsigned integer";
    case Error::HyperBadFormat:
        return "Not enough data for hyper integer";
    case Error::UnsignedHyperBadFormat:
        return "Not enough data for unsigned hyper integer";
    case Error::FloatBadFormat:
        return "Not enough data for float";
    case Error::DoubleBadFormat:
        return "Not enough data for double";
    case Error::StringBadFormat:
        return "Truncated or non UTF-8 string";
    case Error::BadArraySize:
        return "Array size exceeds maximum or available data";
    case Error::VarArrayWrongSize:
        return "String length exceeds declared maximum";
    case Error::InvalidEnumValue:
        return "Invalid enum or union discriminant";
    default:
        return "Unknown error";
    }
}

#if !XDRIN_NO_EXCEPTIONS

/**
 * @brief Exception thrown by the throwing decode helpers.
 */
class XdrException : public std::runtime_error {
public:
    explicit XdrException(Error code)
        : std::runtime_error(error_string(code)), error_code_(code) {}

    XdrException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

#endif // !XDRIN_NO_EXCEPTIONS

} // namespace xdrin

#endif // XDRIN_ERROR_HPP
