#include <logdedup/dedupe_map.hpp>

#include <logdedup/assert.hpp>
#include <logdedup/exception.hpp>
#include <logdedup/formatting.hpp>
#include <logdedup/probe_sequence.hpp>
#include <logdedup/record.hpp>
#include <logdedup/serialization.hpp>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <vector>

namespace logdedup {

namespace detail {

namespace {

// Size of the value stored after every digest.
static constexpr u32 value_size = serialized_size<i64>();

u64 compute_slots(i64 memory, u32 bytes_per_entry) {
    if (memory <= 0) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("The memory budget must be greater than zero (got {}).", memory)));
    }

    const u64 slots = static_cast<u64>(memory) / bytes_per_entry;
    if (slots == 0) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("The memory budget of {} bytes is too small for a single entry of {} bytes.",
                        memory, bytes_per_entry)));
    }
    if (slots > probe_sequence::max_slots) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("The memory budget of {} bytes results in {} slots, at most {} are supported.",
                        memory, slots, probe_sequence::max_slots)));
    }
    return slots;
}

} // namespace

class dedupe_map_impl {
public:
    dedupe_map_impl(const dedupe_map_options& options);

    dedupe_map_impl(const dedupe_map_impl&) = delete;
    dedupe_map_impl& operator=(const dedupe_map_impl&) = delete;

    u64 capacity() const { return m_slots; }
    u64 size() const { return m_entries; }
    i64 memory() const { return m_memory; }
    u64 byte_size() const { return m_slots * m_bytes_per_entry; }
    u32 digest_size() const { return m_digest_size; }
    u32 bytes_per_entry() const { return m_bytes_per_entry; }
    const std::string& hash_algorithm() const { return m_digester.name(); }
    const version_strategy& strategy() const { return m_strategy; }

    bool put(const record& rec);
    i64 get(const byte* key, size_t key_size);
    bool greater(const record& rec);
    void clear();

    u64 lookups() const { return m_lookups; }
    u64 probes() const { return m_probe.probes(); }
    double collision_rate() const;

    i64 latest_offset() const { return m_last_offset; }
    void update_latest_offset(i64 offset);

    void dump(std::ostream& os) const;
    void validate() const;

private:
    // True if `version` supersedes the `cached` version.
    static bool is_greater(i64 version, i64 cached) { return cached < 0 || cached < version; }

    // Computes the digest of the given key into m_hash.
    void hash_into(const byte* key, size_t key_size);

    // Looks up the digest in m_hash. Returns -1 if it cannot be found.
    i64 find_hash();

    byte* entry(u64 slot) {
        LOGDEDUP_ASSERT(slot < m_slots, "Slot index out of bounds.");
        return m_buffer.get() + slot * m_bytes_per_entry;
    }

    const byte* entry(u64 slot) const {
        LOGDEDUP_ASSERT(slot < m_slots, "Slot index out of bounds.");
        return m_buffer.get() + slot * m_bytes_per_entry;
    }

    // A slot is empty iff all of its bytes are zero.
    bool is_empty(const byte* entry) const {
        return std::all_of(entry, entry + m_bytes_per_entry, [](byte b) { return b == 0; });
    }

    bool digest_equals(const byte* entry) const {
        return std::memcmp(entry, m_hash.data(), m_digest_size) == 0;
    }

private:
    i64 m_memory = 0;
    digester m_digester;
    version_strategy m_strategy;

    u32 m_digest_size = 0;
    u32 m_bytes_per_entry = 0;
    u64 m_slots = 0;

    // Entries: digest followed by a big endian i64 value.
    std::unique_ptr<byte[]> m_buffer;

    probe_sequence m_probe;

    // Digest of the current key.
    std::vector<byte> m_hash;

    u64 m_entries = 0;
    u64 m_lookups = 0;
    i64 m_last_offset = -1;
};

dedupe_map_impl::dedupe_map_impl(const dedupe_map_options& options)
    : m_memory(options.memory)
    , m_digester(options.hash_algorithm)
    , m_strategy(parse_version_strategy(options.strategy))
    , m_digest_size(m_digester.digest_size())
    , m_bytes_per_entry(m_digest_size + value_size)
    , m_slots(compute_slots(m_memory, m_bytes_per_entry))
    , m_buffer(new byte[m_slots * m_bytes_per_entry]())
    , m_probe(m_slots, m_digest_size)
    , m_hash(m_digest_size) {
    spdlog::debug("Created dedupe map with {} slots of {} bytes ({} digest, {} strategy).", m_slots,
                  m_bytes_per_entry, hash_algorithm(), to_string(m_strategy));
}

bool dedupe_map_impl::put(const record& rec) {
    if (m_entries >= m_slots) {
        LOGDEDUP_THROW(bad_operation(
            fmt::format("Attempt to add a new entry to a full dedupe map ({} slots).", m_slots)));
    }

    if (!rec.has_key())
        return false;

    const i64 version = extract_version(m_strategy, rec);
    if (!is_greater(version, get(rec.key_data(), rec.key_size())))
        return false;

    // The digest of the key is still in m_hash.
    ++m_lookups;
    const u64 max_attempts = m_probe.max_attempts();
    for (u64 attempt = 0; attempt < max_attempts; ++attempt) {
        byte* e = entry(m_probe.position_of(m_hash.data(), attempt));
        if (is_empty(e)) {
            std::memcpy(e, m_hash.data(), m_digest_size);
            serialize(version, e + m_digest_size);
            ++m_entries;
            update_latest_offset(rec.offset());
            return true;
        }
        if (digest_equals(e)) {
            serialize(version, e + m_digest_size);
            update_latest_offset(rec.offset());
            return true;
        }
    }

    // Only reachable when the linear phase crosses zero and revisits slots.
    spdlog::error("Dedupe map probe sequence exhausted after {} attempts ({} of {} slots in use).",
                  max_attempts, m_entries, m_slots);
    LOGDEDUP_THROW(bad_operation(
        fmt::format("Failed to find a free slot after {} attempts.", max_attempts)));
}

i64 dedupe_map_impl::get(const byte* key, size_t key_size) {
    ++m_lookups;
    hash_into(key, key_size);
    return find_hash();
}

bool dedupe_map_impl::greater(const record& rec) {
    const i64 version = extract_version(m_strategy, rec);
    if (!rec.has_key())
        return is_greater(version, -1);
    return is_greater(version, get(rec.key_data(), rec.key_size()));
}

void dedupe_map_impl::clear() {
    spdlog::debug("Clearing dedupe map with {} entries (utilization {:.3f}, collision rate {:.3f}).",
                  m_entries, static_cast<double>(m_entries) / static_cast<double>(m_slots),
                  collision_rate());

    m_entries = 0;
    m_lookups = 0;
    m_last_offset = -1;
    m_probe.reset();
    std::memset(m_buffer.get(), 0, byte_size());
}

double dedupe_map_impl::collision_rate() const {
    if (m_lookups == 0)
        return 0;

    const double extra = static_cast<double>(m_probe.probes()) - static_cast<double>(m_lookups);
    return extra / static_cast<double>(m_lookups);
}

void dedupe_map_impl::update_latest_offset(i64 offset) {
    if (m_last_offset < offset)
        m_last_offset = offset;
}

void dedupe_map_impl::hash_into(const byte* key, size_t key_size) {
    m_digester.digest(key, key_size, m_hash.data());
}

i64 dedupe_map_impl::find_hash() {
    const u64 max_attempts = m_probe.max_attempts();
    for (u64 attempt = 0; attempt < max_attempts; ++attempt) {
        const byte* e = entry(m_probe.position_of(m_hash.data(), attempt));
        if (is_empty(e))
            return -1;
        if (digest_equals(e))
            return deserialize<i64>(e + m_digest_size);
    }
    return -1;
}

void dedupe_map_impl::dump(std::ostream& os) const {
    fmt::print(os,
               "Dedupe map:\n"
               "  Hash algorithm: {}\n"
               "  Strategy: {}\n"
               "  Digest size: {}\n"
               "  Bytes per entry: {}\n"
               "  Slots: {}\n"
               "  Entries: {}\n"
               "  Lookups: {}\n"
               "  Probes: {}\n"
               "  Latest offset: {}\n"
               "\n",
               hash_algorithm(), to_string(m_strategy), m_digest_size, m_bytes_per_entry, m_slots,
               m_entries, m_lookups, m_probe.probes(), m_last_offset);

    for (u64 slot = 0; slot < m_slots; ++slot) {
        const byte* e = entry(slot);
        if (is_empty(e))
            continue;

        fmt::print(os, "  {}: {} -> {}\n", slot, format_hex(e, m_digest_size),
                   deserialize<i64>(e + m_digest_size));
    }
}

void dedupe_map_impl::validate() const {
#define LOGDEDUP_ERROR(...) LOGDEDUP_THROW(corruption_error(fmt::format("validate: " __VA_ARGS__)))

    if (m_entries > m_slots)
        LOGDEDUP_ERROR("Entry count {} exceeds the number of slots {}.", m_entries, m_slots);

    u64 occupied = 0;
    for (u64 slot = 0; slot < m_slots; ++slot) {
        if (!is_empty(entry(slot)))
            ++occupied;
    }
    if (occupied != m_entries)
        LOGDEDUP_ERROR("Found {} occupied slots, but the entry count is {}.", occupied, m_entries);

#undef LOGDEDUP_ERROR
}

} // namespace detail

dedupe_map::dedupe_map(const dedupe_map_options& options)
    : m_impl(std::make_unique<detail::dedupe_map_impl>(options)) {}

dedupe_map::dedupe_map(i64 memory, std::string_view hash_algorithm, std::string_view strategy)
    : dedupe_map([&] {
        dedupe_map_options options;
        options.memory = memory;
        options.hash_algorithm = std::string(hash_algorithm);
        options.strategy = std::string(strategy);
        return options;
    }()) {}

dedupe_map::~dedupe_map() {}

dedupe_map::dedupe_map(dedupe_map&& other) noexcept = default;
dedupe_map& dedupe_map::operator=(dedupe_map&& other) noexcept = default;

u64 dedupe_map::capacity() const { return impl().capacity(); }
u64 dedupe_map::size() const { return impl().size(); }
bool dedupe_map::empty() const { return impl().size() == 0; }
i64 dedupe_map::memory() const { return impl().memory(); }
u64 dedupe_map::byte_size() const { return impl().byte_size(); }
u32 dedupe_map::digest_size() const { return impl().digest_size(); }
u32 dedupe_map::bytes_per_entry() const { return impl().bytes_per_entry(); }
const std::string& dedupe_map::hash_algorithm() const { return impl().hash_algorithm(); }
const version_strategy& dedupe_map::strategy() const { return impl().strategy(); }

bool dedupe_map::put(const record& rec) { return impl().put(rec); }

i64 dedupe_map::get(const byte* key, size_t key_size) { return impl().get(key, key_size); }

i64 dedupe_map::get(std::string_view key) {
    return impl().get(reinterpret_cast<const byte*>(key.data()), key.size());
}

bool dedupe_map::greater(const record& rec) { return impl().greater(rec); }

void dedupe_map::clear() { impl().clear(); }

double dedupe_map::utilization() const {
    return static_cast<double>(impl().size()) / static_cast<double>(impl().capacity());
}

double dedupe_map::collision_rate() const { return impl().collision_rate(); }
u64 dedupe_map::lookups() const { return impl().lookups(); }
u64 dedupe_map::probes() const { return impl().probes(); }
i64 dedupe_map::latest_offset() const { return impl().latest_offset(); }
void dedupe_map::update_latest_offset(i64 offset) { impl().update_latest_offset(offset); }

void dedupe_map::dump(std::ostream& os) const { impl().dump(os); }
void dedupe_map::validate() const { impl().validate(); }

detail::dedupe_map_impl& dedupe_map::impl() const {
    if (!m_impl) {
        LOGDEDUP_THROW(bad_operation("Invalid dedupe map instance."));
    }
    return *m_impl;
}

} // namespace logdedup
