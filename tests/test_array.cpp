/**
 * @file test_array.cpp
 * @brief Unit tests for fixed and variable-length arrays.
 */

#include <xdrin/array.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <vector>

using namespace xdrin;

TEST_CASE("Unbounded sequence of unsigned integers", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 2, 0, 0, 0, 1, 0, 0, 0, 3};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint32_t>{1, 3});
    REQUIRE(consumed == 12);
}

TEST_CASE("Unbounded sequence propagates element error", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 2, 0, 0, 0, 1, 0, 0, 0};
    std::vector<std::uint32_t> value = {7};
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) ==
            Error::UnsignedIntegerBadFormat);
    // No partial array
    REQUIRE(value == std::vector<std::uint32_t>{7});
}

TEST_CASE("Sequence of nested sequences", "[array]") {
    // [[5], []]
    std::vector<std::uint8_t> data = {0, 0, 0, 2, 0, 0, 0, 1, 0, 0, 0, 5, 0, 0, 0, 0};
    std::vector<std::vector<std::int32_t>> value;
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value.size() == 2);
    REQUIRE(value[0] == std::vector<std::int32_t>{5});
    REQUIRE(value[1].empty());
    REQUIRE(consumed == 16);
}

TEST_CASE("Fixed array", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, 3};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_fixed_array(data.data(), data.size(), 3, value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint32_t>{0, 1, 3});
    REQUIRE(consumed == 12);
}

TEST_CASE("Fixed array truncated element", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_fixed_array(data.data(), data.size(), 3, value, consumed) ==
            Error::UnsignedIntegerBadFormat);
    REQUIRE(value.empty());
}

TEST_CASE("Fixed array of count zero", "[array]") {
    std::vector<std::uint8_t> data;
    std::vector<std::uint32_t> value = {1, 2};
    std::size_t consumed = 99;
    REQUIRE(read_fixed_array(data.data(), data.size(), 0, value, consumed) == Error::Ok);
    REQUIRE(value.empty());
    REQUIRE(consumed == 0);
}

TEST_CASE("Fixed array into std::array", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 0, 0, 0, 0, 1, 0xFF, 0xFF, 0xFF, 0xFE};
    std::array<std::int32_t, 3> value{};
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value == std::array<std::int32_t, 3>{0, 1, -2});
    REQUIRE(consumed == 12);

    std::array<std::int32_t, 4> too_many{};
    REQUIRE(read_xdr(data.data(), data.size(), too_many, consumed) == Error::IntegerBadFormat);
}

TEST_CASE("Variable array within limit", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 2, 0, 0, 0, 4, 0, 0, 0, 6};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_var_array(data.data(), data.size(), 3, value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint32_t>{4, 6});
    REQUIRE(consumed == 12);

    REQUIRE(read_var_array(data.data(), data.size(), 2, value, consumed) == Error::Ok);
}

TEST_CASE("Variable array too long", "[array]") {
    // Count is rejected before any element is read
    std::vector<std::uint8_t> data = {0, 0, 0, 4};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_var_array(data.data(), data.size(), 3, value, consumed) == Error::BadArraySize);
    REQUIRE(consumed == 0);
}

TEST_CASE("Variable array missing count", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_var_array(data.data(), data.size(), 3, value, consumed) ==
            Error::UnsignedIntegerBadFormat);
}

TEST_CASE("Variable array of booleans", "[array]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 2, 0, 0, 0, 1, 0, 0, 0, 2};
    std::vector<bool> value;
    std::size_t consumed = 0;
    REQUIRE(read_var_array(data.data(), data.size(), 8, value, consumed) == Error::BoolBadFormat);
}

TEST_CASE("Huge declared count with small elements", "[array]") {
    std::vector<std::uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF, 0, 0, 0, 1};
    std::vector<std::uint32_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) ==
            Error::UnsignedIntegerBadFormat);
}

TEST_CASE("Huge declared count with large elements", "[array]") {
    // 1 MiB of input claiming 2^32 - 1 elements of 64 KiB each
    using Block = std::array<std::uint8_t, 65536>;
    std::vector<std::uint8_t> data(1024 * 1024, 0);
    data[0] = 0xFF;
    data[1] = 0xFF;
    data[2] = 0xFF;
    data[3] = 0xFF;

    std::vector<Block> value;
    std::size_t consumed = 0;
    Error status = Error::Ok;
    REQUIRE_NOTHROW(status = read_xdr(data.data(), data.size(), value, consumed));
    REQUIRE(status == Error::BadArraySize);
    REQUIRE(value.empty());
    REQUIRE(consumed == 0);
}

TEST_CASE("Huge declared count with variable elements", "[array]") {
    std::vector<std::uint8_t> data(64 * 1024, 0);
    data[0] = 0xFF;
    data[1] = 0xFF;
    data[2] = 0xFF;
    data[3] = 0xFF;

    std::vector<std::vector<std::uint64_t>> value;
    std::size_t consumed = 0;
    Error status = Error::Ok;
    REQUIRE_NOTHROW(status = read_xdr(data.data(), data.size(), value, consumed));
    REQUIRE(status == Error::UnsignedIntegerBadFormat);
}

TEST_CASE("Void is not an array element type", "[array]") {
    STATIC_REQUIRE_FALSE(is_array_element_v<Void>);
    STATIC_REQUIRE(is_array_element_v<std::uint32_t>);
    STATIC_REQUIRE(is_array_element_v<std::array<std::uint8_t, 65536>>);
}
