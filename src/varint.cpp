#include <logdedup/varint.hpp>

#include <logdedup/exception.hpp>

#include <fmt/format.h>

namespace logdedup {

namespace {

u64 zigzag_encode(i64 value) noexcept {
    return (static_cast<u64>(value) << 1) ^ static_cast<u64>(value >> 63);
}

i64 zigzag_decode(u64 value) noexcept {
    return static_cast<i64>((value >> 1) ^ (~(value & 1) + 1));
}

} // namespace

size_t varlong_size(i64 value) noexcept {
    u64 v = zigzag_encode(value);
    size_t bytes = 1;
    while ((v & ~u64(0x7f)) != 0) {
        ++bytes;
        v >>= 7;
    }
    return bytes;
}

size_t write_varlong(i64 value, byte* buffer) noexcept {
    u64 v = zigzag_encode(value);
    size_t written = 0;
    while ((v & ~u64(0x7f)) != 0) {
        buffer[written++] = static_cast<byte>((v & 0x7f) | 0x80);
        v >>= 7;
    }
    buffer[written++] = static_cast<byte>(v);
    return written;
}

std::vector<byte> encode_varlong(i64 value) {
    std::vector<byte> result(varlong_size(value));
    write_varlong(value, result.data());
    return result;
}

i64 read_varlong(const byte* data, size_t size, size_t* consumed) {
    u64 value = 0;
    u32 shift = 0;
    for (size_t i = 0; i < size; ++i) {
        const u64 b = data[i];
        if ((b & 0x80) == 0) {
            value |= b << shift;
            if (consumed)
                *consumed = i + 1;
            return zigzag_decode(value);
        }

        value |= (b & 0x7f) << shift;
        shift += 7;
        if (shift > 63) {
            LOGDEDUP_THROW(corruption_error(
                fmt::format("Varlong is too long, the most significant bit in the {}th byte is set, "
                            "converted value: {:#x}.",
                            max_varlong_size, value)));
        }
    }
    LOGDEDUP_THROW(corruption_error(
        fmt::format("Unexpected end of input while reading a varlong ({} bytes available).", size)));
}

} // namespace logdedup
