#ifndef LOGDEDUP_VARINT_HPP
#define LOGDEDUP_VARINT_HPP

#include <logdedup/defs.hpp>

#include <vector>

namespace logdedup {

/// \defgroup varint Variable length integers
///
/// Signed 64 bit integers encoded with zig-zag encoding followed by
/// base 128 varint encoding (7 payload bits per byte, least significant
/// group first, high bit set on every byte but the last).
/// Small absolute values use few bytes, e.g. `0 -> 00`, `-1 -> 01`, `1 -> 02`.
///
/// @{

/// The maximum number of bytes used by an encoded varlong.
inline constexpr size_t max_varlong_size = 10;

/// Returns the number of bytes required to encode `value`.
size_t varlong_size(i64 value) noexcept;

/// Encodes `value` into `buffer`, which must have at least
/// `varlong_size(value)` writable bytes. Returns the number of bytes written.
size_t write_varlong(i64 value, byte* buffer) noexcept;

/// Encodes `value` into a new byte vector.
std::vector<byte> encode_varlong(i64 value);

/// Decodes a varlong from the first `size` bytes of `data`.
/// If `consumed` is not null, the number of bytes read will be stored there.
///
/// \throws corruption_error if the input ends before the varlong does
/// or if the encoded value is longer than \ref max_varlong_size bytes.
i64 read_varlong(const byte* data, size_t size, size_t* consumed = nullptr);

/// @}

} // namespace logdedup

#endif // LOGDEDUP_VARINT_HPP
