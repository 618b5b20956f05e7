/**
 * @file contract.hpp
 * @brief The decode contract shared by every decodable type.
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
 * A type T is decodable when XdrIn<T> is specialized with
 *
 *     static Error read(const std::uint8_t* data, std::size_t size,
 *                       T& value, std::size_t& consumed);
 *
 * read() parses one value from the front of [data, data + size). On
 * success it stores the value and the number of bytes it used. On
 * failure it returns the error and leaves both out parameters as they
 * were. It never reports more bytes than size.
 *
 * Built-in types are specialized by this library. Structs, enums and
 * unions are specialized by generated code using the helpers in
 * composite.hpp.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_CONTRACT_HPP
#define XDRIN_CONTRACT_HPP

#include "config.hpp"
#include "error.hpp"

namespace xdrin {

/**
 * @brief Decode trait, specialized once per decodable type.
 *
 * @tparam T Value type
 * @tparam Enable SFINAE hook for families of types (e.g. all enums)
 */
template <typename T, typename Enable = void> struct XdrIn;

/**
 * @brief The zero-width unit value (XDR void).
 */
struct Void {
    bool operator==(const Void&) const = default;
};

/**
 * @brief Decode one value of type T.
 *
 * @param data Start of the input slice
 * @param size Bytes available in the slice
 * @param[out] value Decoded value
 * @param[out] consumed Bytes used from the front of the slice
 * @return Error::Ok on success
 */
template <typename T>
Error read_xdr(const std::uint8_t* data, std::size_t size, T& value, std::size_t& consumed) {
    return XdrIn<T>::read(data, size, value, consumed);
}

} // namespace xdrin

#endif // XDRIN_CONTRACT_HPP
