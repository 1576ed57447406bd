#include <optval/types/optional_catalog.h>

#include <utility>

namespace optval
{

    // bool

    optional_t<ov_bool> bool_to_optional(ov_bool value) { return to_optional(std::move(value)); }

    ov_bool bool_from_optional(const optional_t<ov_bool> &value) { return from_optional(value); }

    ov_bool bool_from_optional(const ov_bool *value) { return from_optional(value); }

    sequence_t<optional_t<ov_bool>> bool_to_optional_sequence(const sequence_t<ov_bool> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_bool> bool_from_optional_sequence(const sequence_t<optional_t<ov_bool>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_bool>> bool_to_optional_mapping(const mapping_t<ov_bool> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_bool> bool_from_optional_mapping(const mapping_t<optional_t<ov_bool>> &values) {
        return from_optional_mapping(values);
    }

    // int

    optional_t<ov_int> int_to_optional(ov_int value) { return to_optional(std::move(value)); }

    ov_int int_from_optional(const optional_t<ov_int> &value) { return from_optional(value); }

    ov_int int_from_optional(const ov_int *value) { return from_optional(value); }

    sequence_t<optional_t<ov_int>> int_to_optional_sequence(const sequence_t<ov_int> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_int> int_from_optional_sequence(const sequence_t<optional_t<ov_int>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_int>> int_to_optional_mapping(const mapping_t<ov_int> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_int> int_from_optional_mapping(const mapping_t<optional_t<ov_int>> &values) {
        return from_optional_mapping(values);
    }

    // int8

    optional_t<ov_int8> int8_to_optional(ov_int8 value) { return to_optional(std::move(value)); }

    ov_int8 int8_from_optional(const optional_t<ov_int8> &value) { return from_optional(value); }

    ov_int8 int8_from_optional(const ov_int8 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_int8>> int8_to_optional_sequence(const sequence_t<ov_int8> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_int8> int8_from_optional_sequence(const sequence_t<optional_t<ov_int8>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_int8>> int8_to_optional_mapping(const mapping_t<ov_int8> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_int8> int8_from_optional_mapping(const mapping_t<optional_t<ov_int8>> &values) {
        return from_optional_mapping(values);
    }

    // int16

    optional_t<ov_int16> int16_to_optional(ov_int16 value) { return to_optional(std::move(value)); }

    ov_int16 int16_from_optional(const optional_t<ov_int16> &value) { return from_optional(value); }

    ov_int16 int16_from_optional(const ov_int16 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_int16>> int16_to_optional_sequence(const sequence_t<ov_int16> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_int16> int16_from_optional_sequence(const sequence_t<optional_t<ov_int16>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_int16>> int16_to_optional_mapping(const mapping_t<ov_int16> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_int16> int16_from_optional_mapping(const mapping_t<optional_t<ov_int16>> &values) {
        return from_optional_mapping(values);
    }

    // int32

    optional_t<ov_int32> int32_to_optional(ov_int32 value) { return to_optional(std::move(value)); }

    ov_int32 int32_from_optional(const optional_t<ov_int32> &value) { return from_optional(value); }

    ov_int32 int32_from_optional(const ov_int32 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_int32>> int32_to_optional_sequence(const sequence_t<ov_int32> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_int32> int32_from_optional_sequence(const sequence_t<optional_t<ov_int32>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_int32>> int32_to_optional_mapping(const mapping_t<ov_int32> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_int32> int32_from_optional_mapping(const mapping_t<optional_t<ov_int32>> &values) {
        return from_optional_mapping(values);
    }

    // int64

    optional_t<ov_int64> int64_to_optional(ov_int64 value) { return to_optional(std::move(value)); }

    ov_int64 int64_from_optional(const optional_t<ov_int64> &value) { return from_optional(value); }

    ov_int64 int64_from_optional(const ov_int64 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_int64>> int64_to_optional_sequence(const sequence_t<ov_int64> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_int64> int64_from_optional_sequence(const sequence_t<optional_t<ov_int64>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_int64>> int64_to_optional_mapping(const mapping_t<ov_int64> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_int64> int64_from_optional_mapping(const mapping_t<optional_t<ov_int64>> &values) {
        return from_optional_mapping(values);
    }

    // uint

    optional_t<ov_uint> uint_to_optional(ov_uint value) { return to_optional(std::move(value)); }

    ov_uint uint_from_optional(const optional_t<ov_uint> &value) { return from_optional(value); }

    ov_uint uint_from_optional(const ov_uint *value) { return from_optional(value); }

    sequence_t<optional_t<ov_uint>> uint_to_optional_sequence(const sequence_t<ov_uint> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_uint> uint_from_optional_sequence(const sequence_t<optional_t<ov_uint>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_uint>> uint_to_optional_mapping(const mapping_t<ov_uint> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_uint> uint_from_optional_mapping(const mapping_t<optional_t<ov_uint>> &values) {
        return from_optional_mapping(values);
    }

    // uint8

    optional_t<ov_uint8> uint8_to_optional(ov_uint8 value) { return to_optional(std::move(value)); }

    ov_uint8 uint8_from_optional(const optional_t<ov_uint8> &value) { return from_optional(value); }

    ov_uint8 uint8_from_optional(const ov_uint8 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_uint8>> uint8_to_optional_sequence(const sequence_t<ov_uint8> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_uint8> uint8_from_optional_sequence(const sequence_t<optional_t<ov_uint8>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_uint8>> uint8_to_optional_mapping(const mapping_t<ov_uint8> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_uint8> uint8_from_optional_mapping(const mapping_t<optional_t<ov_uint8>> &values) {
        return from_optional_mapping(values);
    }

    // uint16

    optional_t<ov_uint16> uint16_to_optional(ov_uint16 value) { return to_optional(std::move(value)); }

    ov_uint16 uint16_from_optional(const optional_t<ov_uint16> &value) { return from_optional(value); }

    ov_uint16 uint16_from_optional(const ov_uint16 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_uint16>> uint16_to_optional_sequence(const sequence_t<ov_uint16> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_uint16> uint16_from_optional_sequence(const sequence_t<optional_t<ov_uint16>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_uint16>> uint16_to_optional_mapping(const mapping_t<ov_uint16> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_uint16> uint16_from_optional_mapping(const mapping_t<optional_t<ov_uint16>> &values) {
        return from_optional_mapping(values);
    }

    // uint32

    optional_t<ov_uint32> uint32_to_optional(ov_uint32 value) { return to_optional(std::move(value)); }

    ov_uint32 uint32_from_optional(const optional_t<ov_uint32> &value) { return from_optional(value); }

    ov_uint32 uint32_from_optional(const ov_uint32 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_uint32>> uint32_to_optional_sequence(const sequence_t<ov_uint32> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_uint32> uint32_from_optional_sequence(const sequence_t<optional_t<ov_uint32>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_uint32>> uint32_to_optional_mapping(const mapping_t<ov_uint32> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_uint32> uint32_from_optional_mapping(const mapping_t<optional_t<ov_uint32>> &values) {
        return from_optional_mapping(values);
    }

    // uint64

    optional_t<ov_uint64> uint64_to_optional(ov_uint64 value) { return to_optional(std::move(value)); }

    ov_uint64 uint64_from_optional(const optional_t<ov_uint64> &value) { return from_optional(value); }

    ov_uint64 uint64_from_optional(const ov_uint64 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_uint64>> uint64_to_optional_sequence(const sequence_t<ov_uint64> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_uint64> uint64_from_optional_sequence(const sequence_t<optional_t<ov_uint64>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_uint64>> uint64_to_optional_mapping(const mapping_t<ov_uint64> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_uint64> uint64_from_optional_mapping(const mapping_t<optional_t<ov_uint64>> &values) {
        return from_optional_mapping(values);
    }

    // float32

    optional_t<ov_float32> float32_to_optional(ov_float32 value) { return to_optional(std::move(value)); }

    ov_float32 float32_from_optional(const optional_t<ov_float32> &value) { return from_optional(value); }

    ov_float32 float32_from_optional(const ov_float32 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_float32>> float32_to_optional_sequence(const sequence_t<ov_float32> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_float32> float32_from_optional_sequence(const sequence_t<optional_t<ov_float32>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_float32>> float32_to_optional_mapping(const mapping_t<ov_float32> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_float32> float32_from_optional_mapping(const mapping_t<optional_t<ov_float32>> &values) {
        return from_optional_mapping(values);
    }

    // float64

    optional_t<ov_float64> float64_to_optional(ov_float64 value) { return to_optional(std::move(value)); }

    ov_float64 float64_from_optional(const optional_t<ov_float64> &value) { return from_optional(value); }

    ov_float64 float64_from_optional(const ov_float64 *value) { return from_optional(value); }

    sequence_t<optional_t<ov_float64>> float64_to_optional_sequence(const sequence_t<ov_float64> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_float64> float64_from_optional_sequence(const sequence_t<optional_t<ov_float64>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_float64>> float64_to_optional_mapping(const mapping_t<ov_float64> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_float64> float64_from_optional_mapping(const mapping_t<optional_t<ov_float64>> &values) {
        return from_optional_mapping(values);
    }

    // string

    optional_t<ov_string> string_to_optional(ov_string value) { return to_optional(std::move(value)); }

    ov_string string_from_optional(const optional_t<ov_string> &value) { return from_optional(value); }

    ov_string string_from_optional(const ov_string *value) { return from_optional(value); }

    sequence_t<optional_t<ov_string>> string_to_optional_sequence(const sequence_t<ov_string> &values) {
        return to_optional_sequence(values);
    }

    sequence_t<ov_string> string_from_optional_sequence(const sequence_t<optional_t<ov_string>> &values) {
        return from_optional_sequence(values);
    }

    mapping_t<optional_t<ov_string>> string_to_optional_mapping(const mapping_t<ov_string> &values) {
        return to_optional_mapping(values);
    }

    mapping_t<ov_string> string_from_optional_mapping(const mapping_t<optional_t<ov_string>> &values) {
        return from_optional_mapping(values);
    }

    // byte

    optional_t<ov_byte> byte_to_optional(ov_byte value) { return to_optional(std::move(value)); }

    ov_byte byte_from_optional(const optional_t<ov_byte> &value) { return from_optional(value); }

    ov_byte byte_from_optional(const ov_byte *value) { return from_optional(value); }

    // rune

    optional_t<ov_rune> rune_to_optional(ov_rune value) { return to_optional(std::move(value)); }

    ov_rune rune_from_optional(const optional_t<ov_rune> &value) { return from_optional(value); }

    ov_rune rune_from_optional(const ov_rune *value) { return from_optional(value); }

    // complex64

    optional_t<ov_complex64> complex64_to_optional(ov_complex64 value) { return to_optional(std::move(value)); }

    ov_complex64 complex64_from_optional(const optional_t<ov_complex64> &value) { return from_optional(value); }

    ov_complex64 complex64_from_optional(const ov_complex64 *value) { return from_optional(value); }

    // complex128

    optional_t<ov_complex128> complex128_to_optional(ov_complex128 value) { return to_optional(std::move(value)); }

    ov_complex128 complex128_from_optional(const optional_t<ov_complex128> &value) { return from_optional(value); }

    ov_complex128 complex128_from_optional(const ov_complex128 *value) { return from_optional(value); }

    // time

    optional_t<ov_time> time_to_optional(ov_time value) { return to_optional(std::move(value)); }

    ov_time time_from_optional(const optional_t<ov_time> &value) { return from_optional(value); }

    ov_time time_from_optional(const ov_time *value) { return from_optional(value); }

    // duration

    optional_t<ov_duration> duration_to_optional(ov_duration value) { return to_optional(std::move(value)); }

    ov_duration duration_from_optional(const optional_t<ov_duration> &value) { return from_optional(value); }

    ov_duration duration_from_optional(const ov_duration *value) { return from_optional(value); }

}  // namespace optval
