#ifndef OPTVAL_SCALAR_TYPES_H
#define OPTVAL_SCALAR_TYPES_H

#include <optval/util/date_time.h>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace optval {
    /*
     * The scalar catalog. Every type listed here has a zero value and a catalog name, and is registered with
     * the optional factory registry (see any_optional.h). The platform-width aliases may name the same C++
     * type as one of the fixed width aliases, callers should not rely on them being distinct.
     */
    using ov_bool = bool;
    using ov_int = std::ptrdiff_t;
    using ov_int8 = std::int8_t;
    using ov_int16 = std::int16_t;
    using ov_int32 = std::int32_t;
    using ov_int64 = std::int64_t;
    using ov_uint = std::size_t;
    using ov_uint8 = std::uint8_t;
    using ov_uint16 = std::uint16_t;
    using ov_uint32 = std::uint32_t;
    using ov_uint64 = std::uint64_t;
    using ov_float32 = float;
    using ov_float64 = double;
    using ov_string = std::string;
    using ov_byte = std::byte;
    using ov_rune = char32_t;
    using ov_complex64 = std::complex<float>;
    using ov_complex128 = std::complex<double>;

    /**
     * The value an absent optional lowers to. Value-initialization covers every catalog type (false, 0, 0.0,
     * empty string, std::byte{0}, U'\0', (0,0), the zero instant and the zero duration). Specialise for user
     * types whose default constructor does not produce a sensible "nothing".
     */
    template<typename T>
    struct ZeroValue {
        static_assert(std::is_default_constructible_v<T>, "ZeroValue<T> must be specialised for T");

        static T make() { return T{}; }
    };

    template<>
    struct ZeroValue<ov_time> {
        static constexpr ov_time make() noexcept { return zero_time(); }
    };

    template<>
    struct ZeroValue<ov_duration> {
        static constexpr ov_duration make() noexcept { return zero_duration(); }
    };

    template<typename T>
    [[nodiscard]] T zero_value() {
        return ZeroValue<T>::make();
    }

    /**
     * Catalog name for a scalar type, used in diagnostics. Aliased types report the fixed width name.
     */
    template<typename T>
    [[nodiscard]] constexpr const char *type_name() noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, ov_int8>) {
            return "int8";
        } else if constexpr (std::is_same_v<T, ov_int16>) {
            return "int16";
        } else if constexpr (std::is_same_v<T, ov_int32>) {
            return "int32";
        } else if constexpr (std::is_same_v<T, ov_int64>) {
            return "int64";
        } else if constexpr (std::is_same_v<T, ov_int>) {
            return "int";
        } else if constexpr (std::is_same_v<T, ov_uint8>) {
            return "uint8";
        } else if constexpr (std::is_same_v<T, ov_uint16>) {
            return "uint16";
        } else if constexpr (std::is_same_v<T, ov_uint32>) {
            return "uint32";
        } else if constexpr (std::is_same_v<T, ov_uint64>) {
            return "uint64";
        } else if constexpr (std::is_same_v<T, ov_uint>) {
            return "uint";
        } else if constexpr (std::is_same_v<T, ov_float32>) {
            return "float32";
        } else if constexpr (std::is_same_v<T, ov_float64>) {
            return "float64";
        } else if constexpr (std::is_same_v<T, ov_string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, ov_byte>) {
            return "byte";
        } else if constexpr (std::is_same_v<T, ov_rune>) {
            return "rune";
        } else if constexpr (std::is_same_v<T, ov_complex64>) {
            return "complex64";
        } else if constexpr (std::is_same_v<T, ov_complex128>) {
            return "complex128";
        } else if constexpr (std::is_same_v<T, ov_time>) {
            return "time";
        } else if constexpr (std::is_same_v<T, ov_duration>) {
            return "duration";
        } else {
            return nullptr;
        }
    }

    template<typename T>
    [[nodiscard]] std::string format_scalar(const T &value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, ov_byte>) {
            return fmt::format("0x{:02x}", std::to_integer<unsigned>(value));
        } else if constexpr (std::is_same_v<T, ov_rune>) {
            return fmt::format("U+{:04X}", static_cast<std::uint32_t>(value));
        } else if constexpr (std::is_same_v<T, ov_complex64> || std::is_same_v<T, ov_complex128>) {
            return fmt::format("({}{:+}i)", value.real(), value.imag());
        } else if constexpr (std::is_same_v<T, ov_string>) {
            return fmt::format("\"{}\"", value);
        } else if constexpr (fmt::is_formattable<T>::value) {
            // Handles the integer widths, floats, ov_time and ov_duration
            return fmt::format("{}", value);
        } else {
            return fmt::format("<{}>", typeid(T).name());
        }
    }
} // namespace optval

#endif  // OPTVAL_SCALAR_TYPES_H
