/**
 * @file test_opaque.cpp
 * @brief Unit tests for fixed and variable-length opaque data.
 */

#include <xdrin/opaque.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <vector>

using namespace xdrin;

TEST_CASE("Variable opaque without padding", "[opaque]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 8, 3, 3, 3, 4, 1, 2, 3, 4};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint8_t>{3, 3, 3, 4, 1, 2, 3, 4});
    REQUIRE(consumed == 12);
}

TEST_CASE("Variable opaque with padding", "[opaque]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 5, 3, 3, 3, 4, 1, 0, 0, 0};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint8_t>{3, 3, 3, 4, 1});
    REQUIRE(consumed == 12);
}

TEST_CASE("Variable opaque padding is not validated", "[opaque]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 1, 9, 0xAA, 0xBB, 0xCC};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_var_opaque(data.data(), data.size(), 4, value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint8_t>{9});
    REQUIRE(consumed == 8);
}

TEST_CASE("Variable opaque maximum is an upper bound", "[opaque]") {
    std::vector<std::uint8_t> data = {0, 0, 0, 5, 1, 2, 3, 4, 5, 0, 0, 0};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;

    SECTION("under the maximum") {
        REQUIRE(read_var_opaque(data.data(), data.size(), 8, value, consumed) == Error::Ok);
        REQUIRE(value.size() == 5);
        REQUIRE(consumed == 12);
    }

    SECTION("at the maximum") {
        REQUIRE(read_var_opaque(data.data(), data.size(), 5, value, consumed) == Error::Ok);
        REQUIRE(value.size() == 5);
    }

    SECTION("over the maximum") {
        REQUIRE(read_var_opaque(data.data(), data.size(), 4, value, consumed) ==
                Error::BadArraySize);
        REQUIRE(value.empty());
        REQUIRE(consumed == 0);
    }
}

TEST_CASE("Variable opaque truncated payload", "[opaque]") {
    SECTION("missing payload bytes") {
        std::vector<std::uint8_t> data = {0, 0, 0, 8, 1, 2, 3};
        std::vector<std::uint8_t> value;
        std::size_t consumed = 0;
        REQUIRE(read_var_opaque(data.data(), data.size(), 16, value, consumed) ==
                Error::BadArraySize);
    }

    SECTION("missing padding bytes") {
        std::vector<std::uint8_t> data = {0, 0, 0, 5, 1, 2, 3, 4, 5, 0};
        std::vector<std::uint8_t> value;
        std::size_t consumed = 0;
        REQUIRE(read_var_opaque(data.data(), data.size(), 16, value, consumed) ==
                Error::BadArraySize);
    }

    SECTION("missing length prefix") {
        std::vector<std::uint8_t> data = {0, 0};
        std::vector<std::uint8_t> value;
        std::size_t consumed = 0;
        REQUIRE(read_var_opaque(data.data(), data.size(), 16, value, consumed) ==
                Error::UnsignedIntegerBadFormat);
    }
}

TEST_CASE("Fixed opaque without padding", "[opaque]") {
    std::vector<std::uint8_t> data = {3, 3, 3, 4, 1, 2, 3, 4};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_fixed_opaque(data.data(), data.size(), 8, value, consumed) == Error::Ok);
    REQUIRE(value == data);
    REQUIRE(consumed == 8);

    data.pop_back();
    REQUIRE(read_fixed_opaque(data.data(), data.size(), 8, value, consumed) ==
            Error::BadArraySize);
}

TEST_CASE("Fixed opaque with padding", "[opaque]") {
    std::vector<std::uint8_t> data = {3, 3, 3, 4, 1, 0, 0, 0};
    std::vector<std::uint8_t> value;
    std::size_t consumed = 0;
    REQUIRE(read_fixed_opaque(data.data(), data.size(), 5, value, consumed) == Error::Ok);
    REQUIRE(value == std::vector<std::uint8_t>{3, 3, 3, 4, 1});
    REQUIRE(consumed == 8);

    data.pop_back();
    REQUIRE(read_fixed_opaque(data.data(), data.size(), 5, value, consumed) ==
            Error::BadArraySize);
}

TEST_CASE("Fixed opaque of length zero", "[opaque]") {
    std::vector<std::uint8_t> data;
    std::vector<std::uint8_t> value = {1};
    std::size_t consumed = 99;
    REQUIRE(read_fixed_opaque(data.data(), data.size(), 0, value, consumed) == Error::Ok);
    REQUIRE(value.empty());
    REQUIRE(consumed == 0);
}

TEST_CASE("Fixed opaque into std::array", "[opaque]") {
    std::vector<std::uint8_t> data = {0xDE, 0xAD, 0xBE, 0, 0x77};
    std::array<std::uint8_t, 3> value{};
    std::size_t consumed = 0;
    REQUIRE(read_xdr(data.data(), data.size(), value, consumed) == Error::Ok);
    REQUIRE(value == std::array<std::uint8_t, 3>{0xDE, 0xAD, 0xBE});
    REQUIRE(consumed == 4);

    std::array<std::uint8_t, 8> too_long{};
    REQUIRE(read_xdr(data.data(), data.size(), too_long, consumed) == Error::BadArraySize);
}

TEST_CASE("Padding law", "[opaque]") {
    for (std::uint32_t length = 0; length <= 9; ++length) {
        std::vector<std::uint8_t> data = {0, 0, 0, static_cast<std::uint8_t>(length)};
        data.resize(4 + padded_size(length), 0x11);

        std::vector<std::uint8_t> value;
        std::size_t consumed = 0;
        REQUIRE(read_var_opaque(data.data(), data.size(), 16, value, consumed) == Error::Ok);
        REQUIRE(value.size() == length);
        REQUIRE(consumed == 4 + length + (4 - length % 4) % 4);
    }
}
