/**
 * @file opaque.hpp
 * @brief Fixed-length and variable-length opaque data.
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
 * Implements RFC 4506 Sections 4.9 and 4.10. Payloads are followed by
 * zero to three padding bytes so that the item ends on a 4-byte
 * boundary. Padding is consumed but its contents are not checked.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_OPAQUE_HPP
#define XDRIN_OPAQUE_HPP

#include <array>
#include <cstring>
#include <vector>

#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "primitives.hpp"

namespace xdrin {

/**
 * @brief Read fixed-length opaque data (RFC 4506 Section 4.9).
 *
 * Consumes padded_size(length) bytes and returns the first length.
 * A length of 0 succeeds and consumes nothing.
 *
 * @param data Input slice
 * @param size Bytes available
 * @param length Declared payload length
 * @param[out] value Payload bytes (padding stripped)
 * @param[out] consumed Payload plus padding
 * @return Error::Ok, or Error::BadArraySize if the slice is too short
 */
Error read_fixed_opaque(const std::uint8_t* data, std::size_t size, std::uint32_t length,
                        std::vector<std::uint8_t>& value, std::size_t& consumed);

/**
 * @brief Read variable-length opaque data (RFC 4506 Section 4.10).
 *
 * Reads a 4-byte length, rejects it when it exceeds max_length, then
 * reads that many bytes as fixed opaque data.
 *
 * @param data Input slice
 * @param size Bytes available
 * @param max_length Declared maximum (UNBOUNDED for <>)
 * @param[out] value Payload bytes (padding stripped)
 * @param[out] consumed 4 + payload plus padding
 * @return Error::Ok, Error::UnsignedIntegerBadFormat for a short length
 *         prefix, or Error::BadArraySize
 */
Error read_var_opaque(const std::uint8_t* data, std::size_t size, std::uint32_t max_length,
                      std::vector<std::uint8_t>& value, std::size_t& consumed);

/**
 * @brief Unbounded variable-length opaque (opaque<>).
 */
template <> struct XdrIn<std::vector<std::uint8_t>> {
    static Error read(const std::uint8_t* data, std::size_t size,
                      std::vector<std::uint8_t>& value, std::size_t& consumed) {
        return read_var_opaque(data, size, UNBOUNDED, value, consumed);
    }
};

/**
 * @brief Fixed-length opaque (opaque[N]) held in a std::array.
 */
template <std::size_t N> struct XdrIn<std::array<std::uint8_t, N>> {
    static Error read(const std::uint8_t* data, std::size_t size,
                      std::array<std::uint8_t, N>& value, std::size_t& consumed) noexcept {
        constexpr std::size_t total = padded_size(N);
        if (size < total) {
            return Error::BadArraySize;
        }
        if constexpr (N > 0) {
            std::memcpy(value.data(), data, N);
        }
        consumed = total;
        return Error::Ok;
    }
};

} // namespace xdrin

#endif // XDRIN_OPAQUE_HPP
