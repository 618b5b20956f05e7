/**
 * @file primitives.hpp
 * @brief Decoders for the fixed-width scalar types.
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
 * Implements RFC 4506 Sections 4.1 - 4.8 and 4.16:
 * - Integer / Unsigned Integer (4 bytes, big-endian)
 * - Hyper Integer / Unsigned Hyper Integer (8 bytes, big-endian)
 * - Boolean (4-byte integer restricted to 0 and 1)
 * - Float / Double (IEEE-754 bit patterns, big-endian)
 * - Void (0 bytes)
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_PRIMITIVES_HPP
#define XDRIN_PRIMITIVES_HPP

#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"

namespace xdrin {

namespace detail {

/**
 * @brief Load a big-endian 32-bit word.
 *
 * @param data At least 4 readable bytes
 */
inline std::uint32_t load_be32(const std::uint8_t* data) noexcept {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

/**
 * @brief Load a big-endian 64-bit word.
 *
 * @param data At least 8 readable bytes
 */
inline std::uint64_t load_be64(const std::uint8_t* data) noexcept {
    return (static_cast<std::uint64_t>(load_be32(data)) << 32) | load_be32(data + 4);
}

} // namespace detail

template <> struct XdrIn<Void> {
    static Error read(const std::uint8_t* data, std::size_t size, Void& value,
                      std::size_t& consumed) noexcept;
};

/**
 * @brief Boolean: 1 is true, 0 is false, anything else is BoolBadFormat.
 */
template <> struct XdrIn<bool> {
    static Error read(const std::uint8_t* data, std::size_t size, bool& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<std::int32_t> {
    static Error read(const std::uint8_t* data, std::size_t size, std::int32_t& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<std::uint32_t> {
    static Error read(const std::uint8_t* data, std::size_t size, std::uint32_t& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<std::int64_t> {
    static Error read(const std::uint8_t* data, std::size_t size, std::int64_t& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<std::uint64_t> {
    static Error read(const std::uint8_t* data, std::size_t size, std::uint64_t& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<float> {
    static Error read(const std::uint8_t* data, std::size_t size, float& value,
                      std::size_t& consumed) noexcept;
};

template <> struct XdrIn<double> {
    static Error read(const std::uint8_t* data, std::size_t size, double& value,
                      std::size_t& consumed) noexcept;
};

} // namespace xdrin

#endif // XDRIN_PRIMITIVES_HPP
