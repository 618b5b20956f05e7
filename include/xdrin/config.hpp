/**
 * @file config.hpp
 * @brief xdrin compile-time configuration.
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
 * RFC 4506: XDR: External Data Representation Standard
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_CONFIG_HPP
#define XDRIN_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace xdrin {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Basic block size of the encoding: every item is a multiple of 4 bytes
inline constexpr std::size_t XDR_UNIT = 4U;

/// Maximum length for variable-length items declared without a bound (<>)
inline constexpr std::uint32_t UNBOUNDED = 0xFFFFFFFFU;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define XDRIN_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef XDRIN_NO_EXCEPTIONS
#define XDRIN_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @brief Number of padding bytes following a payload of the given length.
 */
[[nodiscard]] constexpr std::size_t padding_size(std::size_t size) noexcept {
    return (XDR_UNIT - size % XDR_UNIT) % XDR_UNIT;
}

/**
 * @brief Round a byte count up to the next multiple of XDR_UNIT.
 *
 * @param size Raw payload length
 * @return Length including padding
 */
[[nodiscard]] constexpr std::size_t padded_size(std::size_t size) noexcept {
    return size + padding_size(size);
}

/**
 * @brief Check that a padded payload fits in the bytes available.
 *
 * Safe for lengths close to the size_t limit.
 */
[[nodiscard]] constexpr bool fits_padded(std::size_t length, std::size_t available) noexcept {
    return length <= available && available - length >= padding_size(length);
}

} // namespace xdrin

#endif // XDRIN_CONFIG_HPP
