#ifndef LOGDEDUP_SERIALIZATION_HPP
#define LOGDEDUP_SERIALIZATION_HPP

#include <logdedup/defs.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <type_traits>

namespace logdedup {

namespace detail {

template<typename T>
constexpr bool is_fixed_integer_v =
    std::is_same_v<T, u16> || std::is_same_v<T, u32> || std::is_same_v<T, u64>
    || std::is_same_v<T, i16> || std::is_same_v<T, i32> || std::is_same_v<T, i64>;

} // namespace detail

/// \defgroup serialization Binary serialization
/// @{

/// Returns the number of bytes used by the serialized representation of `T`.
template<typename T>
constexpr size_t serialized_size() {
    static_assert(detail::is_fixed_integer_v<T> || std::is_same_v<T, u8> || std::is_same_v<T, i8>,
                  "Unsupported type.");
    return sizeof(T);
}

/// Serializes the integer `v` into `buffer`, which must have at least
/// `serialized_size<T>()` writable bytes.
/// Multi-byte integers are always written in big endian byte order,
/// so the serialized form is the same on all platforms.
template<typename T>
void serialize(T v, byte* buffer) noexcept {
    static_assert(serialized_size<T>() > 0, "Unsupported type.");
    if constexpr (detail::is_fixed_integer_v<T>) {
        boost::endian::native_to_big_inplace(v);
    }
    std::memcpy(buffer, &v, sizeof(T));
}

/// Deserializes an integer of type `T` from `buffer`, which must
/// have at least `serialized_size<T>()` readable bytes.
template<typename T>
T deserialize(const byte* buffer) noexcept {
    static_assert(serialized_size<T>() > 0, "Unsupported type.");
    T v;
    std::memcpy(&v, buffer, sizeof(T));
    if constexpr (detail::is_fixed_integer_v<T>) {
        boost::endian::big_to_native_inplace(v);
    }
    return v;
}

/// @}

} // namespace logdedup

#endif // LOGDEDUP_SERIALIZATION_HPP
