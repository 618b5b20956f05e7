/**
 * @file primitives.cpp
 * @brief Scalar decoders.
 *
 * Every scalar reads its natural width from the front of the slice. A
 * short slice is reported with the type's own error code and nothing is
 * consumed.
 *
 * @see include/xdrin/primitives.hpp
 */

#include <xdrin/primitives.hpp>

#include <cstring>

namespace xdrin {

static_assert(sizeof(float) == 4, "XDR float requires 32-bit IEEE-754 float");
static_assert(sizeof(double) == 8, "XDR double requires 64-bit IEEE-754 double");

Error XdrIn<Void>::read(const std::uint8_t* /*data*/, std::size_t /*size*/, Void& value,
                        std::size_t& consumed) noexcept {
    value = Void{};
    consumed = 0;
    return Error::Ok;
}

Error XdrIn<bool>::read(const std::uint8_t* data, std::size_t size, bool& value,
                        std::size_t& consumed) noexcept {
    std::int32_t raw = 0;
    std::size_t used = 0;
    if (XdrIn<std::int32_t>::read(data, size, raw, used) != Error::Ok) {
        return Error::BoolBadFormat;
    }

    if (raw == 1) {
        value = true;
    } else if (raw == 0) {
        value = false;
    } else {
        return Error::BoolBadFormat;
    }

    consumed = used;
    return Error::Ok;
}

Error XdrIn<std::int32_t>::read(const std::uint8_t* data, std::size_t size, std::int32_t& value,
                                std::size_t& consumed) noexcept {
    if (size < 4) [[unlikely]] {
        return Error::IntegerBadFormat;
    }
    value = static_cast<std::int32_t>(detail::load_be32(data));
    consumed = 4;
    return Error::Ok;
}

Error XdrIn<std::uint32_t>::read(const std::uint8_t* data, std::size_t size, std::uint32_t& value,
                                 std::size_t& consumed) noexcept {
    if (size < 4) [[unlikely]] {
        return Error::UnsignedIntegerBadFormat;
    }
    value = detail::load_be32(data);
    consumed = 4;
    return Error::Ok;
}

Error XdrIn<std::int64_t>::read(const std::uint8_t* data, std::size_t size, std::int64_t& value,
                                std::size_t& consumed) noexcept {
    if (size < 8) [[unlikely]] {
        return Error::HyperBadFormat;
    }
    value = static_cast<std::int64_t>(detail::load_be64(data));
    consumed = 8;
    return Error::Ok;
}

Error XdrIn<std::uint64_t>::read(const std::uint8_t* data, std::size_t size, std::uint64_t& value,
                                 std::size_t& consumed) noexcept {
    if (size < 8) [[unlikely]] {
        return Error::UnsignedHyperBadFormat;
    }
    value = detail::load_be64(data);
    consumed = 8;
    return Error::Ok;
}

Error XdrIn<float>::read(const std::uint8_t* data, std::size_t size, float& value,
                         std::size_t& consumed) noexcept {
    if (size < 4) [[unlikely]] {
        return Error::FloatBadFormat;
    }
    std::uint32_t bits = detail::load_be32(data);
    std::memcpy(&value, &bits, sizeof(value));
    consumed = 4;
    return Error::Ok;
}

Error XdrIn<double>::read(const std::uint8_t* data, std::size_t size, double& value,
                          std::size_t& consumed) noexcept {
    if (size < 8) [[unlikely]] {
        return Error::DoubleBadFormat;
    }
    std::uint64_t bits = detail::load_be64(data);
    std::memcpy(&value, &bits, sizeof(value));
    consumed = 8;
    return Error::Ok;
}

} // namespace xdrin
