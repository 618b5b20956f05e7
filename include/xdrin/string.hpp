/**
 * @file string.hpp
 * @brief UTF-8 string decoding.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Implements RFC 4506 Section 4.11. The wire layout is the same as
 * variable-length opaque data; the payload must additionally be
 * well-formed UTF-8.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_STRING_HPP
#define XDRIN_STRING_HPP

#include <string>

#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "primitives.hpp"

namespace xdrin {

/**
 * @brief Check that a byte range is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogate code points and values above
 * U+10FFFF.
 */
[[nodiscard]] bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

/**
 * @brief Unbounded string (string<>).
 *
 * Fails with Error::StringBadFormat when the padded payload is not
 * fully present or is not valid UTF-8.
 */
template <> struct XdrIn<std::string> {
    static Error read(const std::uint8_t* data, std::size_t size, std::string& value,
                      std::size_t& consumed);
};

/**
 * @brief Read a string bounded by max_length (string<max_length>).
 *
 * The length prefix is checked against max_length first; an oversized
 * string fails with Error::VarArrayWrongSize before any payload is
 * examined.
 *
 * @param data Input slice
 * @param size Bytes available
 * @param max_length Declared maximum length in bytes
 * @param[out] value Decoded text
 * @param[out] consumed 4 + payload plus padding
 * @return Error::Ok on success
 */
Error read_var_string(const std::uint8_t* data, std::size_t size, std::uint32_t max_length,
                      std::string& value, std::size_t& consumed);

} // namespace xdrin

#endif // XDRIN_STRING_HPP
