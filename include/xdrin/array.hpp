/**
 * @file array.hpp
 * @brief Fixed-length and variable-length arrays of decodable elements.
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
 * Implements RFC 4506 Sections 4.12 and 4.13. Elements are decoded one
 * after another with their own XdrIn specialization; the first failing
 * element aborts the whole array and its error is returned unchanged.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_ARRAY_HPP
#define XDRIN_ARRAY_HPP

#include <algorithm>
#include <array>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "opaque.hpp"
#include "primitives.hpp"

namespace xdrin {

/**
 * @brief Whether T may be the element type of a counted array.
 *
 * Void occupies no bytes, so a wire count alone would drive the element
 * loop and the allocation. XDR declares no arrays of void.
 */
template <typename T> inline constexpr bool is_array_element_v = !std::is_same_v<T, Void>;

/**
 * @brief Read exactly count elements (RFC 4506 Section 4.12).
 *
 * @tparam T Element type
 * @param data Input slice
 * @param size Bytes available
 * @param count Number of elements
 * @param[out] value Decoded elements
 * @param[out] consumed Sum of the elements' byte counts
 * @return Error::Ok, or the first element's error
 */
template <typename T>
Error read_fixed_array(const std::uint8_t* data, std::size_t size, std::uint32_t count,
                       std::vector<T>& value, std::size_t& consumed) {
    static_assert(is_array_element_v<T>, "arrays of void are not decodable");

    std::vector<T> items;
    // count comes off the wire; cap the reservation in bytes by the input size
    items.reserve(std::min<std::size_t>(count, size / sizeof(T) + 1));

    std::size_t offset = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        T item{};
        std::size_t used = 0;
        auto status = XdrIn<T>::read(data + offset, size - offset, item, used);
        if (status != Error::Ok) {
            return status;
        }
        offset += used;
        items.push_back(std::move(item));
    }

    value = std::move(items);
    consumed = offset;
    return Error::Ok;
}

/**
 * @brief Read a counted array bounded by max_count (RFC 4506 Section 4.13).
 *
 * @tparam T Element type
 * @param data Input slice
 * @param size Bytes available
 * @param max_count Declared maximum (UNBOUNDED for <>)
 * @param[out] value Decoded elements
 * @param[out] consumed 4 + sum of the elements' byte counts
 * @return Error::Ok, Error::BadArraySize when the count exceeds
 *         max_count, or the first element's error
 */
template <typename T>
Error read_var_array(const std::uint8_t* data, std::size_t size, std::uint32_t max_count,
                     std::vector<T>& value, std::size_t& consumed) {
    std::uint32_t count = 0;
    std::size_t head = 0;
    auto status = XdrIn<std::uint32_t>::read(data, size, count, head);
    if (status != Error::Ok) {
        return status;
    }

    if (count > max_count) {
        return Error::BadArraySize;
    }

    std::size_t body = 0;
    status = read_fixed_array(data + head, size - head, count, value, body);
    if (status != Error::Ok) {
        return status;
    }

    consumed = head + body;
    return Error::Ok;
}

/**
 * @brief Unbounded sequence (T<>): a count with no upper bound check.
 */
template <typename T> struct XdrIn<std::vector<T>> {
    static Error read(const std::uint8_t* data, std::size_t size, std::vector<T>& value,
                      std::size_t& consumed) {
        return read_var_array(data, size, UNBOUNDED, value, consumed);
    }
};

/**
 * @brief Fixed-length array (T[N]) held in a std::array.
 */
template <typename T, std::size_t N> struct XdrIn<std::array<T, N>> {
    static Error read(const std::uint8_t* data, std::size_t size, std::array<T, N>& value,
                      std::size_t& consumed) {
        std::array<T, N> items{};
        std::size_t offset = 0;
        for (std::size_t i = 0; i < N; ++i) {
            std::size_t used = 0;
            auto status = XdrIn<T>::read(data + offset, size - offset, items[i], used);
            if (status != Error::Ok) {
                return status;
            }
            offset += used;
        }

        value = std::move(items);
        consumed = offset;
        return Error::Ok;
    }
};

} // namespace xdrin

#endif // XDRIN_ARRAY_HPP
