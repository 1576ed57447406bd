/**
 * Unit tests for the generic optional adapters (optval/types/optional.h)
 */

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optval/types/optional.h>

#include <chrono>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

using namespace optval;

namespace {
    // A non-zero value for each catalog type
    template<typename T>
    T sample() {
        if constexpr (std::is_same_v<T, bool>) {
            return true;
        } else if constexpr (std::is_same_v<T, ov_string>) {
            return "sample";
        } else if constexpr (std::is_same_v<T, ov_byte>) {
            return std::byte{0x2a};
        } else if constexpr (std::is_same_v<T, ov_rune>) {
            return U'\u00e9';
        } else if constexpr (std::is_same_v<T, ov_complex64> || std::is_same_v<T, ov_complex128>) {
            return T(1.5, -2.0);
        } else if constexpr (std::is_same_v<T, ov_time>) {
            return ov_time{std::chrono::seconds{1700000000}};
        } else if constexpr (std::is_same_v<T, ov_duration>) {
            return std::chrono::seconds{5};
        } else {
            return static_cast<T>(42);
        }
    }
}

using catalog_types = std::tuple<ov_bool, ov_int, ov_int8, ov_int16, ov_int32, ov_int64, ov_uint, ov_uint8,
                                 ov_uint16, ov_uint32, ov_uint64, ov_float32, ov_float64, ov_string, ov_byte, ov_rune,
                                 ov_complex64, ov_complex128, ov_time, ov_duration>;

// ============================================================================
// Scalar Tests
// ============================================================================

TEMPLATE_LIST_TEST_CASE("to_optional - lift then lower returns the value", "[optional][scalar]", catalog_types) {
    const TestType value = sample<TestType>();

    auto lifted = to_optional(value);
    STATIC_REQUIRE(std::is_same_v<decltype(lifted), std::optional<TestType>>);
    REQUIRE(lifted.has_value());
    REQUIRE(from_optional(lifted) == value);
}

TEMPLATE_LIST_TEST_CASE("from_optional - absent lowers to the zero value", "[optional][scalar]", catalog_types) {
    std::optional<TestType> absent;
    REQUIRE(from_optional(absent) == zero_value<TestType>());
    REQUIRE(from_optional<TestType>(std::nullopt) == TestType{});

    const TestType *null_ptr = nullptr;
    REQUIRE(from_optional(null_ptr) == zero_value<TestType>());
}

TEST_CASE("zero_value - canonical defaults", "[optional][scalar]") {
    CHECK(zero_value<ov_bool>() == false);
    CHECK(zero_value<ov_int64>() == 0);
    CHECK(zero_value<ov_uint8>() == 0);
    CHECK(zero_value<ov_float64>() == 0.0);
    CHECK(zero_value<ov_string>().empty());
    CHECK(zero_value<ov_byte>() == std::byte{0});
    CHECK(zero_value<ov_rune>() == U'\0');
    CHECK(zero_value<ov_complex128>() == ov_complex128{0.0, 0.0});
    CHECK(zero_value<ov_time>().time_since_epoch().count() == 0);
    CHECK(zero_value<ov_duration>() == ov_duration::zero());
}

TEST_CASE("to_optional - holds an independent copy", "[optional][scalar]") {
    std::string source{"original"};
    auto lifted = to_optional(source);
    source = "changed";

    REQUIRE(*lifted == "original");
}

TEST_CASE("from_optional - pointer overload reads through", "[optional][scalar]") {
    int32_t storage = 17;
    REQUIRE(from_optional(&storage) == 17);
}

TEST_CASE("from_optional - rvalue optional moves the value out", "[optional][scalar]") {
    std::optional<std::string> o{std::string(64, 'x')};
    std::string v = from_optional(std::move(o));
    REQUIRE(v == std::string(64, 'x'));
}

namespace {
    struct Celsius {
        double degrees{-273.15};

        bool operator==(const Celsius &) const = default;
    };
}

template<>
struct optval::ZeroValue<Celsius> {
    static Celsius make() { return Celsius{0.0}; }
};

TEST_CASE("ZeroValue - user specialisation is used when absent", "[optional][scalar]") {
    REQUIRE(from_optional<Celsius>(std::nullopt) == Celsius{0.0});
    REQUIRE(from_optional(to_optional(Celsius{21.5})) == Celsius{21.5});
}

// ============================================================================
// Sequence Tests
// ============================================================================

TEMPLATE_LIST_TEST_CASE("to_optional_sequence - length and order preserved", "[optional][sequence]", catalog_types) {
    const std::vector<TestType> values{sample<TestType>(), zero_value<TestType>(), sample<TestType>()};

    auto lifted = to_optional_sequence(values);
    REQUIRE(lifted.size() == values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        REQUIRE(lifted[i].has_value());
        REQUIRE(*lifted[i] == values[i]);
    }

    auto lowered = from_optional_sequence(lifted);
    REQUIRE(lowered == values);
}

TEST_CASE("from_optional_sequence - absent elements become zero values", "[optional][sequence]") {
    std::vector<std::optional<std::string>> in{std::string("x"), std::nullopt, std::string("z")};

    auto out = from_optional_sequence(in);
    REQUIRE(out == std::vector<std::string>{"x", "", "z"});
}

TEST_CASE("sequence adapters - empty input gives empty output", "[optional][sequence]") {
    REQUIRE(to_optional_sequence(std::vector<double>{}).empty());
    REQUIRE(from_optional_sequence(std::vector<std::optional<double>>{}).empty());
}

TEST_CASE("to_optional_sequence - input is not modified", "[optional][sequence]") {
    const std::vector<int16_t> in{3, 1, 2};
    auto lifted = to_optional_sequence(in);
    *lifted[0] = 99;

    REQUIRE(in == std::vector<int16_t>{3, 1, 2});
}

// ============================================================================
// Mapping Tests
// ============================================================================

TEMPLATE_LIST_TEST_CASE("to_optional_mapping - key set preserved", "[optional][mapping]", catalog_types) {
    const mapping_t<TestType> values{{"a", sample<TestType>()}, {"b", zero_value<TestType>()}};

    auto lifted = to_optional_mapping(values);
    REQUIRE(lifted.size() == values.size());
    for (const auto &[key, value] : values) {
        REQUIRE(lifted.contains(key));
        REQUIRE(lifted.at(key).has_value());
        REQUIRE(*lifted.at(key) == value);
    }

    auto lowered = from_optional_mapping(lifted);
    REQUIRE(lowered == values);
}

TEST_CASE("from_optional_mapping - absent values keep their key", "[optional][mapping]") {
    mapping_t<std::optional<uint32_t>> in{{"present", 7u}, {"absent", std::nullopt}};

    auto out = from_optional_mapping(in);
    REQUIRE(out.size() == 2);
    REQUIRE(out.at("present") == 7u);
    REQUIRE(out.at("absent") == 0u);
}

TEST_CASE("mapping adapters - empty input gives empty output", "[optional][mapping]") {
    REQUIRE(to_optional_mapping(mapping_t<bool>{}).empty());
    REQUIRE(from_optional_mapping(mapping_t<std::optional<bool>>{}).empty());
}
