#ifndef LOGDEDUP_PROBE_SEQUENCE_HPP
#define LOGDEDUP_PROBE_SEQUENCE_HPP

#include <logdedup/defs.hpp>

#include <limits>

namespace logdedup {

/**
 * Generates the candidate slots for a digest in an open addressing table.
 *
 * The first `window_count() + 1` attempts read successive (overlapping)
 * 4 byte big endian integers from the digest itself: attempt `i` reads the
 * bytes `[i, i + 4)`. Digests of a good hash function make those values
 * nearly independent, so no rehashing is necessary.
 * Later attempts keep reading the last window and add `attempt - window_count()`,
 * i.e. the sequence degrades to linear probing.
 *
 * After `max_attempts()` attempts every slot has been visited at least once,
 * unless the linear phase crosses zero: the absolute value of a negative window
 * makes the sequence run backwards towards slot 0 and then forwards again,
 * revisiting slots (see \ref dedupe_map::put).
 */
class probe_sequence {
public:
    /// Positions are derived from 32 bit signed integers; larger slot indices
    /// would be unreachable.
    static constexpr u64 max_slots = std::numeric_limits<i32>::max();

public:
    /// \pre `0 < slots <= max_slots` and `digest_size >= 4`.
    /// \throws bad_argument If the preconditions are violated.
    probe_sequence(u64 slots, u32 digest_size);

    /// The number of slots in the table.
    u64 slots() const { return m_slots; }

    /// The size of the digests, in bytes.
    u32 digest_size() const { return m_digest_size; }

    /// The last byte offset at which a 4 byte window fits into a digest (`digest_size() - 4`).
    u32 window_count() const { return m_digest_size - 4; }

    /// Upper bound for the number of attempts of a single scan (`slots() + window_count()`).
    u64 max_attempts() const { return m_slots + window_count(); }

    /// Returns the slot index for the given attempt (starting at 0).
    /// `digest` must point to `digest_size()` readable bytes.
    /// Every call increments the probe counter.
    u64 position_of(const byte* digest, u64 attempt);

    /// Total number of positions computed since construction or the last `reset()`.
    u64 probes() const { return m_probes; }

    /// Resets the probe counter.
    void reset() { m_probes = 0; }

private:
    u64 m_slots = 0;
    u32 m_digest_size = 0;
    u64 m_probes = 0;
};

} // namespace logdedup

#endif // LOGDEDUP_PROBE_SEQUENCE_HPP
