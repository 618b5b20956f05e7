/**
 * @file xdr_writer.hpp
 * @brief Minimal XDR encoder used to build test inputs.
 */

#ifndef XDRIN_TESTS_XDR_WRITER_HPP
#define XDRIN_TESTS_XDR_WRITER_HPP

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace xdrin::test {

class XdrWriter {
public:
    XdrWriter& u32(std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
        return *this;
    }

    XdrWriter& i32(std::int32_t value) {
        return u32(static_cast<std::uint32_t>(value));
    }

    XdrWriter& u64(std::uint64_t value) {
        u32(static_cast<std::uint32_t>(value >> 32));
        return u32(static_cast<std::uint32_t>(value));
    }

    XdrWriter& f32(float value) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return u32(bits);
    }

    XdrWriter& f64(double value) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return u64(bits);
    }

    XdrWriter& boolean(bool value) {
        return u32(value ? 1U : 0U);
    }

    XdrWriter& fixed_opaque(const std::uint8_t* data, std::size_t size) {
        bytes_.insert(bytes_.end(), data, data + size);
        while (bytes_.size() % 4 != 0) {
            bytes_.push_back(0);
        }
        return *this;
    }

    XdrWriter& opaque(const std::vector<std::uint8_t>& data) {
        u32(static_cast<std::uint32_t>(data.size()));
        return fixed_opaque(data.data(), data.size());
    }

    XdrWriter& string(const std::string& text) {
        u32(static_cast<std::uint32_t>(text.size()));
        return fixed_opaque(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept {
        return bytes_;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace xdrin::test

#endif // XDRIN_TESTS_XDR_WRITER_HPP
