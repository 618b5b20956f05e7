/**
 * @file xdrin.hpp
 * @brief High-level xdrin decode API.
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
 * Includes every decoder and provides stream-level helpers for decoding
 * values back-to-back from one buffer.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_HPP
#define XDRIN_HPP

#include <utility>
#include <vector>

#include "array.hpp"
#include "composite.hpp"
#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "opaque.hpp"
#include "primitives.hpp"
#include "string.hpp"

namespace xdrin {

/**
 * @brief Decode a stream of consecutive values.
 *
 * Decodes values of T one after another, each starting where the
 * previous one ended, until the input is exhausted.
 *
 * @tparam T Value type
 * @param data Input data bytes
 * @param size Input size in bytes
 * @param[out] values Decoded values, in stream order
 * @param[out] consumed Total bytes consumed. Equals size on success unless
 *                      T is zero-width, in which case one value is decoded.
 * @return Error::Ok on success, otherwise the first value's error
 */
template <typename T>
Error decode_sequence(const std::uint8_t* data, std::size_t size, std::vector<T>& values,
                      std::size_t& consumed) {
    std::vector<T> decoded;
    std::size_t offset = 0;

    while (offset < size) {
        T item{};
        std::size_t used = 0;
        auto status = XdrIn<T>::read(data + offset, size - offset, item, used);
        if (status != Error::Ok) {
            return status;
        }
        decoded.push_back(std::move(item));

        // A zero-width value would never exhaust the input
        if (used == 0) {
            break;
        }
        offset += used;
    }

    values = std::move(decoded);
    consumed = offset;
    return Error::Ok;
}

#if !XDRIN_NO_EXCEPTIONS

/**
 * @brief Decode one value, throwing on failure.
 *
 * @tparam T Value type
 * @return The value and the bytes it consumed
 * @throws XdrException carrying the decode error
 */
template <typename T> std::pair<T, std::size_t> decode_or_throw(const std::uint8_t* data,
                                                                std::size_t size) {
    T value{};
    std::size_t consumed = 0;
    auto status = XdrIn<T>::read(data, size, value, consumed);
    if (status != Error::Ok) {
        throw XdrException(status);
    }
    return {std::move(value), consumed};
}

/**
 * @brief Decode one value from a byte vector, throwing on failure.
 */
template <typename T>
std::pair<T, std::size_t> decode_or_throw(const std::vector<std::uint8_t>& buffer) {
    return decode_or_throw<T>(buffer.data(), buffer.size());
}

#endif // !XDRIN_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace xdrin

#endif // XDRIN_HPP
