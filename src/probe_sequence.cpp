#include <logdedup/probe_sequence.hpp>

#include <logdedup/exception.hpp>
#include <logdedup/serialization.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <limits>

namespace logdedup {

namespace {

// abs() with 32 bit wrap around semantics; the minimum value maps to 0
// because its absolute value is not representable.
u32 wrapping_abs(i32 value) {
    if (value == std::numeric_limits<i32>::min())
        return 0;
    return static_cast<u32>(value < 0 ? -value : value);
}

} // namespace

probe_sequence::probe_sequence(u64 slots, u32 digest_size)
    : m_slots(slots)
    , m_digest_size(digest_size) {
    if (m_slots == 0) {
        LOGDEDUP_THROW(bad_argument("The number of slots must be greater than zero."));
    }
    if (m_slots > max_slots) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("Too many slots: {} (at most {} are supported).", m_slots, max_slots)));
    }
    if (m_digest_size < 4) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("Digests must be at least 4 bytes long (got {}).", m_digest_size)));
    }
}

u64 probe_sequence::position_of(const byte* digest, u64 attempt) {
    const u32 windows = window_count();
    const u64 offset = std::min<u64>(attempt, windows);
    const u64 linear = attempt > windows ? attempt - windows : 0;

    // The addition wraps around in 32 bit two's complement arithmetic.
    const u32 sum = deserialize<u32>(digest + offset) + static_cast<u32>(linear);
    const u32 probe = wrapping_abs(static_cast<i32>(sum));

    ++m_probes;
    return probe % m_slots;
}

} // namespace logdedup
