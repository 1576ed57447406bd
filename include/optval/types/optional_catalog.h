#ifndef OPTVAL_OPTIONAL_CATALOG_H
#define OPTVAL_OPTIONAL_CATALOG_H

#include <optval/optval_export.h>
#include <optval/types/optional.h>

namespace optval {
    /*
     * Named, non-template adapters for every catalog type, for callers that prefer an explicit type in the
     * function name to template deduction. Each one forwards to the generic form in optional.h.
     *
     *   <name>_to_optional            value -> present optional
     *   <name>_from_optional          optional (or nullable pointer) -> value, zero value when absent
     *   <name>_to_optional_sequence   vector<T> -> vector<optional<T>>
     *   <name>_from_optional_sequence vector<optional<T>> -> vector<T>
     *   <name>_to_optional_mapping    map<string, T> -> map<string, optional<T>>
     *   <name>_from_optional_mapping  map<string, optional<T>> -> map<string, T>
     *
     * The plain scalars (byte, rune, complex64, complex128, time, duration) only have the first two.
     */

    // bool
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_bool> bool_to_optional(ov_bool value);
    [[nodiscard]] OPTVAL_EXPORT ov_bool bool_from_optional(const optional_t<ov_bool> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_bool bool_from_optional(const ov_bool *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_bool>> bool_to_optional_sequence(const sequence_t<ov_bool> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_bool> bool_from_optional_sequence(const sequence_t<optional_t<ov_bool>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_bool>> bool_to_optional_mapping(const mapping_t<ov_bool> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_bool> bool_from_optional_mapping(const mapping_t<optional_t<ov_bool>> &values);

    // int
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_int> int_to_optional(ov_int value);
    [[nodiscard]] OPTVAL_EXPORT ov_int int_from_optional(const optional_t<ov_int> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_int int_from_optional(const ov_int *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_int>> int_to_optional_sequence(const sequence_t<ov_int> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_int> int_from_optional_sequence(const sequence_t<optional_t<ov_int>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_int>> int_to_optional_mapping(const mapping_t<ov_int> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_int> int_from_optional_mapping(const mapping_t<optional_t<ov_int>> &values);

    // int8
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_int8> int8_to_optional(ov_int8 value);
    [[nodiscard]] OPTVAL_EXPORT ov_int8 int8_from_optional(const optional_t<ov_int8> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_int8 int8_from_optional(const ov_int8 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_int8>> int8_to_optional_sequence(const sequence_t<ov_int8> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_int8> int8_from_optional_sequence(const sequence_t<optional_t<ov_int8>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_int8>> int8_to_optional_mapping(const mapping_t<ov_int8> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_int8> int8_from_optional_mapping(const mapping_t<optional_t<ov_int8>> &values);

    // int16
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_int16> int16_to_optional(ov_int16 value);
    [[nodiscard]] OPTVAL_EXPORT ov_int16 int16_from_optional(const optional_t<ov_int16> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_int16 int16_from_optional(const ov_int16 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_int16>> int16_to_optional_sequence(const sequence_t<ov_int16> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_int16> int16_from_optional_sequence(const sequence_t<optional_t<ov_int16>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_int16>> int16_to_optional_mapping(const mapping_t<ov_int16> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_int16> int16_from_optional_mapping(const mapping_t<optional_t<ov_int16>> &values);

    // int32
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_int32> int32_to_optional(ov_int32 value);
    [[nodiscard]] OPTVAL_EXPORT ov_int32 int32_from_optional(const optional_t<ov_int32> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_int32 int32_from_optional(const ov_int32 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_int32>> int32_to_optional_sequence(const sequence_t<ov_int32> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_int32> int32_from_optional_sequence(const sequence_t<optional_t<ov_int32>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_int32>> int32_to_optional_mapping(const mapping_t<ov_int32> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_int32> int32_from_optional_mapping(const mapping_t<optional_t<ov_int32>> &values);

    // int64
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_int64> int64_to_optional(ov_int64 value);
    [[nodiscard]] OPTVAL_EXPORT ov_int64 int64_from_optional(const optional_t<ov_int64> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_int64 int64_from_optional(const ov_int64 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_int64>> int64_to_optional_sequence(const sequence_t<ov_int64> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_int64> int64_from_optional_sequence(const sequence_t<optional_t<ov_int64>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_int64>> int64_to_optional_mapping(const mapping_t<ov_int64> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_int64> int64_from_optional_mapping(const mapping_t<optional_t<ov_int64>> &values);

    // uint
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_uint> uint_to_optional(ov_uint value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint uint_from_optional(const optional_t<ov_uint> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint uint_from_optional(const ov_uint *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_uint>> uint_to_optional_sequence(const sequence_t<ov_uint> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_uint> uint_from_optional_sequence(const sequence_t<optional_t<ov_uint>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_uint>> uint_to_optional_mapping(const mapping_t<ov_uint> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_uint> uint_from_optional_mapping(const mapping_t<optional_t<ov_uint>> &values);

    // uint8
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_uint8> uint8_to_optional(ov_uint8 value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint8 uint8_from_optional(const optional_t<ov_uint8> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint8 uint8_from_optional(const ov_uint8 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_uint8>> uint8_to_optional_sequence(const sequence_t<ov_uint8> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_uint8> uint8_from_optional_sequence(const sequence_t<optional_t<ov_uint8>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_uint8>> uint8_to_optional_mapping(const mapping_t<ov_uint8> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_uint8> uint8_from_optional_mapping(const mapping_t<optional_t<ov_uint8>> &values);

    // uint16
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_uint16> uint16_to_optional(ov_uint16 value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint16 uint16_from_optional(const optional_t<ov_uint16> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint16 uint16_from_optional(const ov_uint16 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_uint16>> uint16_to_optional_sequence(const sequence_t<ov_uint16> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_uint16> uint16_from_optional_sequence(const sequence_t<optional_t<ov_uint16>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_uint16>> uint16_to_optional_mapping(const mapping_t<ov_uint16> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_uint16> uint16_from_optional_mapping(const mapping_t<optional_t<ov_uint16>> &values);

    // uint32
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_uint32> uint32_to_optional(ov_uint32 value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint32 uint32_from_optional(const optional_t<ov_uint32> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint32 uint32_from_optional(const ov_uint32 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_uint32>> uint32_to_optional_sequence(const sequence_t<ov_uint32> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_uint32> uint32_from_optional_sequence(const sequence_t<optional_t<ov_uint32>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_uint32>> uint32_to_optional_mapping(const mapping_t<ov_uint32> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_uint32> uint32_from_optional_mapping(const mapping_t<optional_t<ov_uint32>> &values);

    // uint64
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_uint64> uint64_to_optional(ov_uint64 value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint64 uint64_from_optional(const optional_t<ov_uint64> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_uint64 uint64_from_optional(const ov_uint64 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_uint64>> uint64_to_optional_sequence(const sequence_t<ov_uint64> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_uint64> uint64_from_optional_sequence(const sequence_t<optional_t<ov_uint64>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_uint64>> uint64_to_optional_mapping(const mapping_t<ov_uint64> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_uint64> uint64_from_optional_mapping(const mapping_t<optional_t<ov_uint64>> &values);

    // float32
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_float32> float32_to_optional(ov_float32 value);
    [[nodiscard]] OPTVAL_EXPORT ov_float32 float32_from_optional(const optional_t<ov_float32> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_float32 float32_from_optional(const ov_float32 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_float32>> float32_to_optional_sequence(const sequence_t<ov_float32> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_float32> float32_from_optional_sequence(const sequence_t<optional_t<ov_float32>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_float32>> float32_to_optional_mapping(const mapping_t<ov_float32> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_float32> float32_from_optional_mapping(const mapping_t<optional_t<ov_float32>> &values);

    // float64
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_float64> float64_to_optional(ov_float64 value);
    [[nodiscard]] OPTVAL_EXPORT ov_float64 float64_from_optional(const optional_t<ov_float64> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_float64 float64_from_optional(const ov_float64 *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_float64>> float64_to_optional_sequence(const sequence_t<ov_float64> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_float64> float64_from_optional_sequence(const sequence_t<optional_t<ov_float64>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_float64>> float64_to_optional_mapping(const mapping_t<ov_float64> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_float64> float64_from_optional_mapping(const mapping_t<optional_t<ov_float64>> &values);

    // string
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_string> string_to_optional(ov_string value);
    [[nodiscard]] OPTVAL_EXPORT ov_string string_from_optional(const optional_t<ov_string> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_string string_from_optional(const ov_string *value);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<optional_t<ov_string>> string_to_optional_sequence(const sequence_t<ov_string> &values);
    [[nodiscard]] OPTVAL_EXPORT sequence_t<ov_string> string_from_optional_sequence(const sequence_t<optional_t<ov_string>> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<optional_t<ov_string>> string_to_optional_mapping(const mapping_t<ov_string> &values);
    [[nodiscard]] OPTVAL_EXPORT mapping_t<ov_string> string_from_optional_mapping(const mapping_t<optional_t<ov_string>> &values);

    // byte
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_byte> byte_to_optional(ov_byte value);
    [[nodiscard]] OPTVAL_EXPORT ov_byte byte_from_optional(const optional_t<ov_byte> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_byte byte_from_optional(const ov_byte *value);

    // rune
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_rune> rune_to_optional(ov_rune value);
    [[nodiscard]] OPTVAL_EXPORT ov_rune rune_from_optional(const optional_t<ov_rune> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_rune rune_from_optional(const ov_rune *value);

    // complex64
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_complex64> complex64_to_optional(ov_complex64 value);
    [[nodiscard]] OPTVAL_EXPORT ov_complex64 complex64_from_optional(const optional_t<ov_complex64> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_complex64 complex64_from_optional(const ov_complex64 *value);

    // complex128
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_complex128> complex128_to_optional(ov_complex128 value);
    [[nodiscard]] OPTVAL_EXPORT ov_complex128 complex128_from_optional(const optional_t<ov_complex128> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_complex128 complex128_from_optional(const ov_complex128 *value);

    // time
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_time> time_to_optional(ov_time value);
    [[nodiscard]] OPTVAL_EXPORT ov_time time_from_optional(const optional_t<ov_time> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_time time_from_optional(const ov_time *value);

    // duration
    [[nodiscard]] OPTVAL_EXPORT optional_t<ov_duration> duration_to_optional(ov_duration value);
    [[nodiscard]] OPTVAL_EXPORT ov_duration duration_from_optional(const optional_t<ov_duration> &value);
    [[nodiscard]] OPTVAL_EXPORT ov_duration duration_from_optional(const ov_duration *value);
} // namespace optval

#endif  // OPTVAL_OPTIONAL_CATALOG_H
