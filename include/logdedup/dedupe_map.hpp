#ifndef LOGDEDUP_DEDUPE_MAP_HPP
#define LOGDEDUP_DEDUPE_MAP_HPP

#include <logdedup/defs.hpp>
#include <logdedup/hash.hpp>
#include <logdedup/version_strategy.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace logdedup {

class record;

namespace detail {

class dedupe_map_impl;

} // namespace detail

/// A group of properties required to configure a dedupe map.
struct dedupe_map_options {
    /// The number of bytes used by the table. Must be large enough for at least one entry.
    /// The resulting number of slots must not exceed `probe_sequence::max_slots`.
    i64 memory = 0;

    /// The name of the hash algorithm used for key digests, see \ref digester.
    std::string hash_algorithm = std::string(default_hash_algorithm);

    /// The name of the version strategy, see \ref parse_version_strategy.
    std::string strategy = std::string(offset_strategy_name);
};

/**
 * A fixed size hash table that maps record keys to the latest version seen for that key.
 * Used by the log cleaner to decide which records are superseded by newer records
 * with the same key.
 *
 * The table does not store keys. Instead, it stores a digest of every key
 * (computed by the configured hash algorithm) together with a 64 bit version.
 * Every entry occupies `digest_size() + 8` bytes of a single buffer that is allocated
 * once at construction and never grows. Collisions are resolved by probing
 * (see \ref probe_sequence).
 *
 * Distinct keys with equal digests are treated as the same key. With a cryptographic
 * hash this is very unlikely, but callers must tolerate it. An entry whose digest and
 * value are all zero cannot be distinguished from an empty slot.
 *
 * Values cannot be removed; `clear()` resets the entire table.
 *
 * \warning A dedupe map is not thread safe. Every cleaner thread must use its own instance.
 */
class dedupe_map {
public:
    /// \throws bad_argument If `options.memory` is not positive, too small for a single entry,
    ///         or large enough for more than `probe_sequence::max_slots` entries,
    ///         or if the hash algorithm or strategy are invalid.
    explicit dedupe_map(const dedupe_map_options& options);

    /// Equivalent to constructing from a \ref dedupe_map_options instance.
    explicit dedupe_map(i64 memory, std::string_view hash_algorithm = default_hash_algorithm,
                        std::string_view strategy = offset_strategy_name);

    ~dedupe_map();

    dedupe_map(dedupe_map&& other) noexcept;
    dedupe_map& operator=(dedupe_map&& other) noexcept;

    /// The maximum number of entries (slots) of this table.
    u64 capacity() const;

    /// The number of entries in this table.
    u64 size() const;

    /// Returns true iff the table has no entries.
    bool empty() const;

    /// The memory budget passed at construction, in bytes.
    i64 memory() const;

    /// The number of bytes actually used by the table (`capacity() * bytes_per_entry()`).
    u64 byte_size() const;

    /// The size of a key digest, in bytes.
    u32 digest_size() const;

    /// The size of a single entry (digest and value), in bytes.
    u32 bytes_per_entry() const;

    /// The canonical name of the hash algorithm.
    const std::string& hash_algorithm() const;

    /// The strategy used to extract versions from records.
    const version_strategy& strategy() const;

    /// Inserts the version of `rec`, but only if the record has a key and if its
    /// version is greater than the version currently associated with that key (if any).
    /// Also advances `latest_offset()` to the record's offset when the record was inserted.
    ///
    /// Returns true if the record's version was stored.
    ///
    /// \pre `size() < capacity()`.
    /// \throws bad_operation If the table is full.
    bool put(const record& rec);

    /// Returns the version associated with the given key,
    /// or -1 if the key was not found.
    ///
    /// Keys may be reported as missing when the table is nearly full and
    /// the probe sequence is exhausted before the key is found.
    i64 get(const byte* key, size_t key_size);

    /// Returns the version associated with the given key, or -1 if the key was not found.
    i64 get(std::string_view key);

    /// Returns true if `rec` has a greater version than the version currently associated
    /// with the record's key, or if there is no such version.
    bool greater(const record& rec);

    /// Removes all entries and resets all counters, reusing the existing buffer.
    /// \post `empty() && latest_offset() == -1`.
    void clear();

    /// The fraction of slots in use.
    double utilization() const;

    /// The average number of additional probes per lookup.
    /// Returns 0 if no lookups have been performed.
    double collision_rate() const;

    /// The number of lookups (get and put) since construction or the last `clear()`.
    u64 lookups() const;

    /// The number of probes since construction or the last `clear()`.
    u64 probes() const;

    /// The largest offset inserted into this table or passed to `update_latest_offset()`.
    /// Returns -1 if there is none.
    i64 latest_offset() const;

    /// Advances `latest_offset()` to `offset`, unless it already is at least as large.
    void update_latest_offset(i64 offset);

    /// Prints debugging information to the output stream.
    void dump(std::ostream& os) const;

    /// Perform internal consistency checks.
    /// \throws corruption_error If the number of occupied slots does not match `size()`.
    void validate() const;

private:
    detail::dedupe_map_impl& impl() const;

private:
    std::unique_ptr<detail::dedupe_map_impl> m_impl;
};

} // namespace logdedup

#endif // LOGDEDUP_DEDUPE_MAP_HPP
