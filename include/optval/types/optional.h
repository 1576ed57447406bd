#pragma once

/**
 * @file optional.h
 * @brief Generic lift/lower adapters between values and optional values.
 *
 * Lifting wraps a value as a present std::optional, lowering unwraps an optional and substitutes the type's
 * zero value (see ZeroValue<T>) when it is absent. The sequence and mapping forms apply the same conversion
 * element by element and always return a new container of the same length / key set; inputs are never
 * modified.
 *
 * Usage:
 * @code
 * auto o = optval::to_optional(std::string("a"));          // present("a")
 * auto v = optval::from_optional<int64_t>(std::nullopt);    // 0
 *
 * std::vector<std::optional<std::string>> in{"x", std::nullopt};
 * auto out = optval::from_optional_sequence(in);            // {"x", ""}
 * @endcode
 */

#include <optval/types/scalar_types.h>

#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace optval {

    template<typename T>
    using optional_t = std::optional<T>;

    template<typename T>
    using sequence_t = std::vector<T>;

    template<typename T>
    using mapping_t = std::unordered_map<std::string, T>;

    // ========== Scalar ==========

    template<typename T>
    [[nodiscard]] optional_t<std::decay_t<T>> to_optional(T &&value) {
        return optional_t<std::decay_t<T>>{std::in_place, std::forward<T>(value)};
    }

    template<typename T>
    [[nodiscard]] T from_optional(const optional_t<T> &value) {
        if (value.has_value()) return *value;
        return zero_value<T>();
    }

    template<typename T>
    [[nodiscard]] T from_optional(optional_t<T> &&value) {
        if (value.has_value()) return std::move(*value);
        return zero_value<T>();
    }

    // Lower a nullable pointer, for callers that keep optional values as pointers into their own storage.
    template<typename T>
    [[nodiscard]] T from_optional(const T *value) {
        if (value != nullptr) return *value;
        return zero_value<T>();
    }

    // ========== Sequence ==========

    template<typename T>
    [[nodiscard]] sequence_t<optional_t<T>> to_optional_sequence(const sequence_t<T> &values) {
        sequence_t<optional_t<T>> result;
        result.reserve(values.size());
        for (const auto &v : values) { result.emplace_back(std::in_place, v); }
        return result;
    }

    template<typename T>
    [[nodiscard]] sequence_t<T> from_optional_sequence(const sequence_t<optional_t<T>> &values) {
        sequence_t<T> result;
        result.reserve(values.size());
        for (const auto &v : values) { result.push_back(from_optional(v)); }
        return result;
    }

    // ========== Mapping ==========

    template<typename T>
    [[nodiscard]] mapping_t<optional_t<T>> to_optional_mapping(const mapping_t<T> &values) {
        mapping_t<optional_t<T>> result;
        result.reserve(values.size());
        for (const auto &[key, v] : values) { result.emplace(key, optional_t<T>{std::in_place, v}); }
        return result;
    }

    /**
     * Absent entries keep their key and lower to the zero value, so the result always has the key set of the
     * input.
     */
    template<typename T>
    [[nodiscard]] mapping_t<T> from_optional_mapping(const mapping_t<optional_t<T>> &values) {
        mapping_t<T> result;
        result.reserve(values.size());
        for (const auto &[key, v] : values) { result.emplace(key, from_optional(v)); }
        return result;
    }

} // namespace optval
