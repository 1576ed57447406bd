/**
 * Unit tests for the named optional adapters (optval/types/optional_catalog.h)
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optval/types/optional_catalog.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using namespace optval;
using namespace std::chrono_literals;

// ============================================================================
// Scalar Adapters
// ============================================================================

TEST_CASE("bool adapters - lift then lower", "[catalog][scalar]") {
    auto o = bool_to_optional(true);
    REQUIRE(o.has_value());
    REQUIRE(bool_from_optional(o) == true);
}

TEST_CASE("bool adapters - absent lowers to false", "[catalog][scalar]") {
    REQUIRE(bool_from_optional(std::nullopt) == false);
    REQUIRE(bool_from_optional(static_cast<const bool *>(nullptr)) == false);
}

TEST_CASE("duration adapters - zero on absence", "[catalog][scalar]") {
    REQUIRE(duration_from_optional(std::nullopt) == ov_duration::zero());
    REQUIRE(duration_from_optional(duration_to_optional(5s)) == 5s);
}

TEST_CASE("time adapters - zero instant on absence", "[catalog][scalar]") {
    const ov_time now = std::chrono::time_point_cast<ov_duration>(ov_clock::now());

    REQUIRE(time_from_optional(time_to_optional(now)) == now);
    REQUIRE(is_zero_time(time_from_optional(std::nullopt)));
}

TEST_CASE("numeric adapters - every width round trips its limits", "[catalog][scalar]") {
    CHECK(int8_from_optional(int8_to_optional(-128)) == -128);
    CHECK(int16_from_optional(int16_to_optional(32767)) == 32767);
    CHECK(int32_from_optional(int32_to_optional(-2147483647)) == -2147483647);
    CHECK(int64_from_optional(int64_to_optional(INT64_MIN)) == INT64_MIN);
    CHECK(int_from_optional(int_to_optional(-1)) == -1);
    CHECK(uint8_from_optional(uint8_to_optional(255)) == 255);
    CHECK(uint16_from_optional(uint16_to_optional(65535)) == 65535);
    CHECK(uint32_from_optional(uint32_to_optional(UINT32_MAX)) == UINT32_MAX);
    CHECK(uint64_from_optional(uint64_to_optional(UINT64_MAX)) == UINT64_MAX);
    CHECK(uint_from_optional(uint_to_optional(7u)) == 7u);
    CHECK(float32_from_optional(float32_to_optional(1.25f)) == 1.25f);
    CHECK(float64_from_optional(float64_to_optional(0.1)) == Catch::Approx(0.1));
}

TEST_CASE("numeric adapters - absent lowers to zero", "[catalog][scalar]") {
    CHECK(int8_from_optional(std::nullopt) == 0);
    CHECK(int16_from_optional(std::nullopt) == 0);
    CHECK(int32_from_optional(std::nullopt) == 0);
    CHECK(int64_from_optional(std::nullopt) == 0);
    CHECK(int_from_optional(std::nullopt) == 0);
    CHECK(uint8_from_optional(std::nullopt) == 0);
    CHECK(uint16_from_optional(std::nullopt) == 0);
    CHECK(uint32_from_optional(std::nullopt) == 0);
    CHECK(uint64_from_optional(std::nullopt) == 0);
    CHECK(uint_from_optional(std::nullopt) == 0);
    CHECK(float32_from_optional(std::nullopt) == 0.0f);
    CHECK(float64_from_optional(std::nullopt) == 0.0);
}

TEST_CASE("plain scalar adapters - byte, rune and complex", "[catalog][scalar]") {
    CHECK(byte_from_optional(byte_to_optional(std::byte{0xff})) == std::byte{0xff});
    CHECK(byte_from_optional(std::nullopt) == std::byte{0});

    CHECK(rune_from_optional(rune_to_optional(U'\u20ac')) == U'\u20ac');
    CHECK(rune_from_optional(std::nullopt) == U'\0');

    CHECK(complex64_from_optional(complex64_to_optional({1.0f, 2.0f})) == ov_complex64{1.0f, 2.0f});
    CHECK(complex128_from_optional(std::nullopt) == ov_complex128{});
}

TEST_CASE("string adapters - pointer overload", "[catalog][scalar]") {
    const std::string held{"held"};
    REQUIRE(string_from_optional(&held) == "held");
    REQUIRE(string_from_optional(static_cast<const std::string *>(nullptr)).empty());
}

// ============================================================================
// Sequence Adapters
// ============================================================================

TEST_CASE("string sequence adapters", "[catalog][sequence]") {
    SECTION("lift wraps every element") {
        auto lifted = string_to_optional_sequence({"a", "b"});
        REQUIRE(lifted.size() == 2);
        REQUIRE(lifted[0] == std::optional<std::string>{"a"});
        REQUIRE(lifted[1] == std::optional<std::string>{"b"});
    }

    SECTION("lower substitutes the empty string") {
        auto lowered = string_from_optional_sequence({std::string("x"), std::nullopt});
        REQUIRE(lowered == std::vector<std::string>{"x", ""});
    }

    SECTION("empty in, empty out") {
        REQUIRE(string_to_optional_sequence({}).empty());
        REQUIRE(string_from_optional_sequence({}).empty());
    }
}

TEST_CASE("float64 sequence adapters - element correspondence", "[catalog][sequence]") {
    const std::vector<double> values{0.5, -1.0, 0.0, 3.25};
    REQUIRE(float64_from_optional_sequence(float64_to_optional_sequence(values)) == values);
}

TEST_CASE("numeric sequence adapters - every width", "[catalog][sequence]") {
    CHECK(int_from_optional_sequence(int_to_optional_sequence({-1, 0, 1})) == sequence_t<ov_int>{-1, 0, 1});
    CHECK(int8_from_optional_sequence(int8_to_optional_sequence({-128, 127})) == sequence_t<ov_int8>{-128, 127});
    CHECK(int16_from_optional_sequence(int16_to_optional_sequence({-300, 300})) == sequence_t<ov_int16>{-300, 300});
    CHECK(int32_from_optional_sequence(int32_to_optional_sequence({7, -7})) == sequence_t<ov_int32>{7, -7});
    CHECK(int64_from_optional_sequence(int64_to_optional_sequence({INT64_MAX})) == sequence_t<ov_int64>{INT64_MAX});
    CHECK(uint_from_optional_sequence(uint_to_optional_sequence({0u, 9u})) == sequence_t<ov_uint>{0u, 9u});
    CHECK(uint8_from_optional_sequence(uint8_to_optional_sequence({255})) == sequence_t<ov_uint8>{255});
    CHECK(uint16_from_optional_sequence(uint16_to_optional_sequence({1, 65535})) == sequence_t<ov_uint16>{1, 65535});
    CHECK(uint32_from_optional_sequence(uint32_to_optional_sequence({UINT32_MAX})) ==
          sequence_t<ov_uint32>{UINT32_MAX});
    CHECK(uint64_from_optional_sequence(uint64_to_optional_sequence({UINT64_MAX, 0u})) ==
          sequence_t<ov_uint64>{UINT64_MAX, 0u});
    CHECK(float32_from_optional_sequence(float32_to_optional_sequence({0.5f, -2.0f})) ==
          sequence_t<ov_float32>{0.5f, -2.0f});
    CHECK(bool_from_optional_sequence(bool_to_optional_sequence({true, false})) == sequence_t<ov_bool>{true, false});
}

TEST_CASE("numeric sequence adapters - absent elements lower to zero", "[catalog][sequence]") {
    CHECK(int_from_optional_sequence({std::nullopt, ov_int{3}}) == sequence_t<ov_int>{0, 3});
    CHECK(int8_from_optional_sequence({std::nullopt}) == sequence_t<ov_int8>{0});
    CHECK(int16_from_optional_sequence({std::nullopt}) == sequence_t<ov_int16>{0});
    CHECK(int32_from_optional_sequence({ov_int32{4}, std::nullopt}) == sequence_t<ov_int32>{4, 0});
    CHECK(uint_from_optional_sequence({std::nullopt}) == sequence_t<ov_uint>{0u});
    CHECK(uint8_from_optional_sequence({std::nullopt}) == sequence_t<ov_uint8>{0});
    CHECK(uint16_from_optional_sequence({std::nullopt}) == sequence_t<ov_uint16>{0});
    CHECK(uint32_from_optional_sequence({std::nullopt}) == sequence_t<ov_uint32>{0u});
    CHECK(uint64_from_optional_sequence({std::nullopt}) == sequence_t<ov_uint64>{0u});
    CHECK(float32_from_optional_sequence({std::nullopt}) == sequence_t<ov_float32>{0.0f});
}

// ============================================================================
// Mapping Adapters
// ============================================================================

TEST_CASE("int64 mapping adapters", "[catalog][mapping]") {
    SECTION("lift keeps the key set") {
        auto lifted = int64_to_optional_mapping({{"a", 1}, {"b", 2}});
        REQUIRE(lifted.size() == 2);
        REQUIRE(lifted.at("a") == std::optional<int64_t>{1});
        REQUIRE(lifted.at("b") == std::optional<int64_t>{2});
    }

    SECTION("lower substitutes zero and keeps absent keys") {
        auto lowered = int64_from_optional_mapping({{"a", 5}, {"b", std::nullopt}});
        REQUIRE(lowered == mapping_t<int64_t>{{"a", 5}, {"b", 0}});
    }
}

TEST_CASE("bool mapping adapters - round trip", "[catalog][mapping]") {
    const mapping_t<bool> flags{{"enabled", true}, {"visible", false}};
    REQUIRE(bool_from_optional_mapping(bool_to_optional_mapping(flags)) == flags);
}

TEST_CASE("numeric mapping adapters - every width", "[catalog][mapping]") {
    const mapping_t<ov_int> ints{{"a", -1}, {"b", 2}};
    CHECK(int_from_optional_mapping(int_to_optional_mapping(ints)) == ints);

    const mapping_t<ov_int8> int8s{{"min", -128}, {"max", 127}};
    CHECK(int8_from_optional_mapping(int8_to_optional_mapping(int8s)) == int8s);

    const mapping_t<ov_int16> int16s{{"a", -300}};
    CHECK(int16_from_optional_mapping(int16_to_optional_mapping(int16s)) == int16s);

    const mapping_t<ov_int32> int32s{{"a", 2147483647}};
    CHECK(int32_from_optional_mapping(int32_to_optional_mapping(int32s)) == int32s);

    const mapping_t<ov_uint> uints{{"a", 5u}};
    CHECK(uint_from_optional_mapping(uint_to_optional_mapping(uints)) == uints);

    const mapping_t<ov_uint8> uint8s{{"a", 255}};
    CHECK(uint8_from_optional_mapping(uint8_to_optional_mapping(uint8s)) == uint8s);

    const mapping_t<ov_uint16> uint16s{{"a", 65535}};
    CHECK(uint16_from_optional_mapping(uint16_to_optional_mapping(uint16s)) == uint16s);

    const mapping_t<ov_uint32> uint32s{{"a", UINT32_MAX}};
    CHECK(uint32_from_optional_mapping(uint32_to_optional_mapping(uint32s)) == uint32s);

    const mapping_t<ov_uint64> uint64s{{"a", UINT64_MAX}, {"b", 0u}};
    CHECK(uint64_from_optional_mapping(uint64_to_optional_mapping(uint64s)) == uint64s);

    const mapping_t<ov_float32> float32s{{"a", 0.25f}};
    CHECK(float32_from_optional_mapping(float32_to_optional_mapping(float32s)) == float32s);

    const mapping_t<ov_float64> float64s{{"a", -0.5}};
    CHECK(float64_from_optional_mapping(float64_to_optional_mapping(float64s)) == float64s);

    const mapping_t<ov_string> strings{{"a", "x"}, {"b", ""}};
    CHECK(string_from_optional_mapping(string_to_optional_mapping(strings)) == strings);
}

TEST_CASE("numeric mapping adapters - absent values keep their key", "[catalog][mapping]") {
    CHECK(int_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_int>{{"a", 0}});
    CHECK(int8_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_int8>{{"a", 0}});
    CHECK(int16_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_int16>{{"a", 0}});
    CHECK(int32_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_int32>{{"a", 0}});
    CHECK(uint_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_uint>{{"a", 0u}});
    CHECK(uint8_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_uint8>{{"a", 0}});
    CHECK(uint16_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_uint16>{{"a", 0}});
    CHECK(uint32_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_uint32>{{"a", 0u}});
    CHECK(uint64_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_uint64>{{"a", 0u}});
    CHECK(float32_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_float32>{{"a", 0.0f}});
    CHECK(float64_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_float64>{{"a", 0.0}});
    CHECK(string_from_optional_mapping({{"a", std::nullopt}}) == mapping_t<ov_string>{{"a", ""}});
}
