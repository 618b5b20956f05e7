/**
 * @file string.cpp
 * @brief String decoder and UTF-8 validation.
 *
 * @see include/xdrin/string.hpp
 */

#include <xdrin/string.hpp>

namespace xdrin {

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t i = 0;
    while (i < size) {
        std::uint8_t lead = data[i];

        // ASCII fast path
        if (lead < 0x80U) [[likely]] {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint8_t lo = 0x80U;
        std::uint8_t hi = 0xBFU;

        if (lead >= 0xC2U && lead <= 0xDFU) {
            extra = 1;
        } else if (lead == 0xE0U) {
            extra = 2;
            lo = 0xA0U; // overlong
        } else if (lead == 0xEDU) {
            extra = 2;
            hi = 0x9FU; // surrogates
        } else if (lead >= 0xE1U && lead <= 0xEFU) {
            extra = 2;
        } else if (lead == 0xF0U) {
            extra = 3;
            lo = 0x90U; // overlong
        } else if (lead >= 0xF1U && lead <= 0xF3U) {
            extra = 3;
        } else if (lead == 0xF4U) {
            extra = 3;
            hi = 0x8FU; // above U+10FFFF
        } else {
            return false;
        }

        if (size - i <= extra) {
            return false;
        }

        // Only the first continuation byte has a narrowed range
        std::uint8_t second = data[i + 1];
        if (second < lo || second > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= extra; ++k) {
            std::uint8_t cont = data[i + k];
            if (cont < 0x80U || cont > 0xBFU) {
                return false;
            }
        }

        i += extra + 1;
    }

    return true;
}

Error XdrIn<std::string>::read(const std::uint8_t* data, std::size_t size, std::string& value,
                               std::size_t& consumed) {
    std::uint32_t length = 0;
    std::size_t head = 0;
    auto status = XdrIn<std::uint32_t>::read(data, size, length, head);
    if (status != Error::Ok) {
        return status;
    }

    if (!fits_padded(length, size - head)) {
        return Error::StringBadFormat;
    }

    const std::uint8_t* text = data + head;
    if (!is_valid_utf8(text, length)) {
        return Error::StringBadFormat;
    }

    value.assign(reinterpret_cast<const char*>(text), length);
    consumed = head + padded_size(length);
    return Error::Ok;
}

Error read_var_string(const std::uint8_t* data, std::size_t size, std::uint32_t max_length,
                      std::string& value, std::size_t& consumed) {
    std::uint32_t length = 0;
    std::size_t head = 0;
    auto status = XdrIn<std::uint32_t>::read(data, size, length, head);
    if (status != Error::Ok) {
        return status;
    }

    if (length > max_length) {
        return Error::VarArrayWrongSize;
    }

    return XdrIn<std::string>::read(data, size, value, consumed);
}

} // namespace xdrin
