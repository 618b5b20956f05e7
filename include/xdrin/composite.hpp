/**
 * @file composite.hpp
 * @brief Building blocks for structs, enums, unions and optional data.
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
 * Implements RFC 4506 Sections 4.3 (enum), 4.14 (struct), 4.15
 * (discriminated union) and 4.19 (optional-data).
 *
 * Generated code specializes XdrIn for a user type and calls into this
 * header, e.g. for struct { float a; unsigned int b<3>; }:
 *
 *     template <> struct XdrIn<Sample> {
 *         static Error read(const std::uint8_t* data, std::size_t size,
 *                           Sample& value, std::size_t& consumed) {
 *             return read_struct(data, size, value, consumed,
 *                                [](FieldReader& r, Sample& s) {
 *                                    r.field(s.a).var_array(3, s.b);
 *                                });
 *         }
 *     };
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 *
 * @see https://www.rfc-editor.org/rfc/rfc4506 RFC 4506
 */

#ifndef XDRIN_COMPOSITE_HPP
#define XDRIN_COMPOSITE_HPP

#include <array>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "array.hpp"
#include "config.hpp"
#include "contract.hpp"
#include "error.hpp"
#include "opaque.hpp"
#include "primitives.hpp"
#include "string.hpp"

namespace xdrin {

/**
 * @brief Sequential field decoder for one struct-like value.
 *
 * Tracks the offset within a single slice while the fields of one
 * value are decoded in declared order. After the first failure every
 * further call is a no-op, so a chain of calls reports the first error.
 */
class FieldReader {
public:
    /**
     * @brief Construct a field reader.
     *
     * @param data Start of the slice holding the value
     * @param size Bytes available in the slice
     */
    FieldReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), offset_(0), status_(Error::Ok) {}

    /**
     * @brief Decode a field with its own XdrIn specialization.
     */
    template <typename T> FieldReader& field(T& value) {
        return step([&value](const std::uint8_t* data, std::size_t size, std::size_t& used) {
            return XdrIn<T>::read(data, size, value, used);
        });
    }

    /// opaque name[length]
    FieldReader& fixed_opaque(std::uint32_t length, std::vector<std::uint8_t>& value) {
        return step([length, &value](const std::uint8_t* data, std::size_t size,
                                     std::size_t& used) {
            return read_fixed_opaque(data, size, length, value, used);
        });
    }

    /// opaque name<max_length>
    FieldReader& var_opaque(std::uint32_t max_length, std::vector<std::uint8_t>& value) {
        return step([max_length, &value](const std::uint8_t* data, std::size_t size,
                                         std::size_t& used) {
            return read_var_opaque(data, size, max_length, value, used);
        });
    }

    /// T name[count]
    template <typename T> FieldReader& fixed_array(std::uint32_t count, std::vector<T>& value) {
        return step([count, &value](const std::uint8_t* data, std::size_t size,
                                    std::size_t& used) {
            return read_fixed_array(data, size, count, value, used);
        });
    }

    /// T name<max_count>
    template <typename T> FieldReader& var_array(std::uint32_t max_count, std::vector<T>& value) {
        return step([max_count, &value](const std::uint8_t* data, std::size_t size,
                                        std::size_t& used) {
            return read_var_array(data, size, max_count, value, used);
        });
    }

    /// string name<max_length>
    FieldReader& var_string(std::uint32_t max_length, std::string& value) {
        return step([max_length, &value](const std::uint8_t* data, std::size_t size,
                                         std::size_t& used) {
            return read_var_string(data, size, max_length, value, used);
        });
    }

    /**
     * @brief Get bytes consumed by the fields decoded so far.
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return offset_;
    }

    /**
     * @brief Get bytes left in the slice.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - offset_;
    }

    /**
     * @brief Get the first error, or Error::Ok.
     */
    [[nodiscard]] Error status() const noexcept {
        return status_;
    }

    /**
     * @brief Report the outcome of the whole value.
     *
     * @param[out] consumed Summed byte count, written only on success
     * @return First error encountered, or Error::Ok
     */
    Error finish(std::size_t& consumed) const noexcept {
        if (status_ == Error::Ok) {
            consumed = offset_;
        }
        return status_;
    }

private:
    template <typename Step> FieldReader& step(Step&& read) {
        if (status_ != Error::Ok) {
            return *this;
        }
        std::size_t used = 0;
        status_ = read(data_ + offset_, size_ - offset_, used);
        if (status_ == Error::Ok) {
            offset_ += used;
        }
        return *this;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_;
    Error status_;
};

/**
 * @brief Decode a struct by listing its fields.
 *
 * The value is built in a temporary and only assigned to value when
 * every field decoded, so a failure leaves value untouched.
 *
 * @tparam T Struct type (default constructible)
 * @tparam Fields Callable taking (FieldReader&, T&) that reads each field
 * @return Error::Ok, or the first field's error
 */
template <typename T, typename Fields>
Error read_struct(const std::uint8_t* data, std::size_t size, T& value, std::size_t& consumed,
                  Fields&& fields) {
    T result{};
    FieldReader reader(data, size);
    fields(reader, result);

    std::size_t used = 0;
    auto status = reader.finish(used);
    if (status != Error::Ok) {
        return status;
    }

    value = std::move(result);
    consumed = used;
    return Error::Ok;
}

/**
 * @brief Decode an enum validated against an explicit discriminant list.
 *
 * @tparam E Enum type
 * @tparam N Number of declared values
 * @param allowed Declared values
 * @return Error::Ok, Error::IntegerBadFormat for a short slice, or
 *         Error::InvalidEnumValue
 */
template <typename E, std::size_t N>
Error read_enum(const std::uint8_t* data, std::size_t size, E& value, std::size_t& consumed,
                const std::array<E, N>& allowed) noexcept {
    static_assert(std::is_enum_v<E>, "read_enum requires an enum type");

    std::int32_t raw = 0;
    std::size_t used = 0;
    auto status = XdrIn<std::int32_t>::read(data, size, raw, used);
    if (status != Error::Ok) {
        return status;
    }

    for (const E candidate : allowed) {
        if (static_cast<std::int32_t>(candidate) == raw) {
            value = candidate;
            consumed = used;
            return Error::Ok;
        }
    }

    return Error::InvalidEnumValue;
}

/**
 * @brief Declared values of an enum type.
 *
 * Specialize with a static constexpr std::array named values to make
 * the enum decodable:
 *
 *     template <> struct XdrEnum<Color> {
 *         static constexpr std::array<Color, 2> values{Color::Red, Color::Green};
 *     };
 */
template <typename E> struct XdrEnum;

template <typename E> struct XdrIn<E, std::enable_if_t<std::is_enum_v<E>>> {
    static Error read(const std::uint8_t* data, std::size_t size, E& value,
                      std::size_t& consumed) noexcept {
        return read_enum(data, size, value, consumed, XdrEnum<E>::values);
    }
};

namespace detail {

template <std::size_t I, typename Variant>
Error read_arm(const std::uint8_t* data, std::size_t size, Variant& value,
               std::size_t& consumed) {
    using Arm = std::variant_alternative_t<I, Variant>;

    Arm payload{};
    std::size_t used = 0;
    auto status = XdrIn<Arm>::read(data, size, payload, used);
    if (status != Error::Ok) {
        return status;
    }

    value.template emplace<I>(std::move(payload));
    consumed = used;
    return Error::Ok;
}

template <typename Variant, std::size_t... Is>
Error read_arm_at(std::size_t index, const std::uint8_t* data, std::size_t size, Variant& value,
                  std::size_t& consumed, std::index_sequence<Is...> /*arms*/) {
    using ArmReader = Error (*)(const std::uint8_t*, std::size_t, Variant&, std::size_t&);
    static constexpr ArmReader readers[] = {&read_arm<Is, Variant>...};
    return readers[index](data, size, value, consumed);
}

template <std::size_t N> constexpr std::array<std::int32_t, N> ordinal_cases() noexcept {
    std::array<std::int32_t, N> cases{};
    for (std::size_t i = 0; i < N; ++i) {
        cases[i] = static_cast<std::int32_t>(i);
    }
    return cases;
}

} // namespace detail

/**
 * @brief Decode a discriminated union into a std::variant.
 *
 * cases[i] is the discriminant selecting alternative i. Only the
 * selected arm's payload is read; an unknown discriminant fails before
 * any payload byte is touched.
 *
 * @tparam Ts Arm payload types (Void for arms without data)
 * @param cases Discriminant per alternative
 * @param[out] consumed 4 + the selected payload's byte count
 * @return Error::Ok, Error::IntegerBadFormat for a short discriminant,
 *         Error::InvalidEnumValue, or the payload's error
 */
template <typename... Ts>
Error read_union(const std::uint8_t* data, std::size_t size, std::variant<Ts...>& value,
                 std::size_t& consumed, const std::array<std::int32_t, sizeof...(Ts)>& cases) {
    std::int32_t discriminant = 0;
    std::size_t head = 0;
    auto status = XdrIn<std::int32_t>::read(data, size, discriminant, head);
    if (status != Error::Ok) {
        return status;
    }

    for (std::size_t i = 0; i < cases.size(); ++i) {
        if (cases[i] != discriminant) {
            continue;
        }

        std::size_t body = 0;
        status = detail::read_arm_at(i, data + head, size - head, value, body,
                                     std::index_sequence_for<Ts...>{});
        if (status != Error::Ok) {
            return status;
        }
        consumed = head + body;
        return Error::Ok;
    }

    return Error::InvalidEnumValue;
}

/**
 * @brief Union whose discriminants are the alternative indices 0..n-1.
 */
template <typename... Ts> struct XdrIn<std::variant<Ts...>> {
    static Error read(const std::uint8_t* data, std::size_t size, std::variant<Ts...>& value,
                      std::size_t& consumed) {
        static constexpr auto cases = detail::ordinal_cases<sizeof...(Ts)>();
        return read_union(data, size, value, consumed, cases);
    }
};

/**
 * @brief Optional-data (T *name): a boolean flag, then T when set.
 */
template <typename T> struct XdrIn<std::optional<T>> {
    static Error read(const std::uint8_t* data, std::size_t size, std::optional<T>& value,
                      std::size_t& consumed) {
        bool present = false;
        std::size_t head = 0;
        auto status = XdrIn<bool>::read(data, size, present, head);
        if (status != Error::Ok) {
            return status;
        }

        if (!present) {
            value.reset();
            consumed = head;
            return Error::Ok;
        }

        T item{};
        std::size_t body = 0;
        status = XdrIn<T>::read(data + head, size - head, item, body);
        if (status != Error::Ok) {
            return status;
        }

        value = std::move(item);
        consumed = head + body;
        return Error::Ok;
    }
};

} // namespace xdrin

#endif // XDRIN_COMPOSITE_HPP
