#ifndef LOGDEDUP_RECORD_HPP
#define LOGDEDUP_RECORD_HPP

#include <logdedup/defs.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logdedup {

/// A single record header. The value may be absent (null).
struct record_header {
    std::string key;
    std::optional<std::vector<byte>> value;
};

/**
 * Read only view of a log record, supplied by the log cleaner
 * that drives a \ref dedupe_map.
 */
class record {
public:
    virtual ~record();

    /// Returns true if the record has a key. Records without a key
    /// are never deduplicated.
    virtual bool has_key() const = 0;

    /// Pointer to the first byte of the key. Only meaningful if `has_key()` is true.
    virtual const byte* key_data() const = 0;

    /// Size of the key, in bytes.
    virtual size_t key_size() const = 0;

    /// Position of the record in its log.
    virtual i64 offset() const = 0;

    /// The record's timestamp.
    virtual i64 timestamp() const = 0;

    /// The record's headers, in order. Possibly empty.
    virtual const std::vector<record_header>& headers() const = 0;
};

/**
 * A record that owns its key and headers.
 * Used by callers that materialize records in memory before deduplicating them.
 */
class memory_record : public record {
public:
    /// Constructs a record without key at offset 0.
    memory_record() = default;

    /// Constructs a record with the given key and offset.
    memory_record(std::string_view key, i64 offset, i64 timestamp = -1);

    /// Constructs a record with the given binary key and offset.
    memory_record(std::vector<byte> key, i64 offset, i64 timestamp = -1);

    memory_record& set_key(std::string_view key);
    memory_record& set_key(std::vector<byte> key);
    memory_record& clear_key();
    memory_record& set_offset(i64 offset);
    memory_record& set_timestamp(i64 timestamp);

    /// Appends a header with the given value.
    memory_record& add_header(std::string key, std::vector<byte> value);

    /// Appends a header with a null value.
    memory_record& add_null_header(std::string key);

    /// Appends a header whose value is the varlong encoding of `version`.
    memory_record& add_version_header(std::string key, i64 version);

    bool has_key() const override;
    const byte* key_data() const override;
    size_t key_size() const override;
    i64 offset() const override;
    i64 timestamp() const override;
    const std::vector<record_header>& headers() const override;

private:
    std::optional<std::vector<byte>> m_key;
    i64 m_offset = 0;
    i64 m_timestamp = -1;
    std::vector<record_header> m_headers;
};

} // namespace logdedup

#endif // LOGDEDUP_RECORD_HPP
