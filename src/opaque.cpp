/**
 * @file opaque.cpp
 * @brief Opaque data decoders.
 *
 * @see include/xdrin/opaque.hpp
 */

#include <xdrin/opaque.hpp>

namespace xdrin {

Error read_fixed_opaque(const std::uint8_t* data, std::size_t size, std::uint32_t length,
                        std::vector<std::uint8_t>& value, std::size_t& consumed) {
    if (!fits_padded(length, size)) {
        return Error::BadArraySize;
    }

    value.assign(data, data + length);
    consumed = padded_size(length);
    return Error::Ok;
}

Error read_var_opaque(const std::uint8_t* data, std::size_t size, std::uint32_t max_length,
                      std::vector<std::uint8_t>& value, std::size_t& consumed) {
    std::uint32_t length = 0;
    std::size_t head = 0;
    auto status = XdrIn<std::uint32_t>::read(data, size, length, head);
    if (status != Error::Ok) {
        return status;
    }

    if (length > max_length) {
        return Error::BadArraySize;
    }

    std::size_t body = 0;
    status = read_fixed_opaque(data + head, size - head, length, value, body);
    if (status != Error::Ok) {
        return status;
    }

    consumed = head + body;
    return Error::Ok;
}

} // namespace xdrin
