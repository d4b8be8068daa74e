#include <logdedup/record.hpp>

#include <logdedup/varint.hpp>

namespace logdedup {

namespace {

std::vector<byte> to_bytes(std::string_view str) {
    return std::vector<byte>(str.begin(), str.end());
}

} // namespace

record::~record() {}

memory_record::memory_record(std::string_view key, i64 offset, i64 timestamp)
    : m_key(to_bytes(key))
    , m_offset(offset)
    , m_timestamp(timestamp) {}

memory_record::memory_record(std::vector<byte> key, i64 offset, i64 timestamp)
    : m_key(std::move(key))
    , m_offset(offset)
    , m_timestamp(timestamp) {}

memory_record& memory_record::set_key(std::string_view key) {
    m_key = to_bytes(key);
    return *this;
}

memory_record& memory_record::set_key(std::vector<byte> key) {
    m_key = std::move(key);
    return *this;
}

memory_record& memory_record::clear_key() {
    m_key.reset();
    return *this;
}

memory_record& memory_record::set_offset(i64 offset) {
    m_offset = offset;
    return *this;
}

memory_record& memory_record::set_timestamp(i64 timestamp) {
    m_timestamp = timestamp;
    return *this;
}

memory_record& memory_record::add_header(std::string key, std::vector<byte> value) {
    m_headers.push_back(record_header{std::move(key), std::move(value)});
    return *this;
}

memory_record& memory_record::add_null_header(std::string key) {
    m_headers.push_back(record_header{std::move(key), std::nullopt});
    return *this;
}

memory_record& memory_record::add_version_header(std::string key, i64 version) {
    return add_header(std::move(key), encode_varlong(version));
}

bool memory_record::has_key() const { return m_key.has_value(); }

const byte* memory_record::key_data() const { return m_key ? m_key->data() : nullptr; }

size_t memory_record::key_size() const { return m_key ? m_key->size() : 0; }

i64 memory_record::offset() const { return m_offset; }

i64 memory_record::timestamp() const { return m_timestamp; }

const std::vector<record_header>& memory_record::headers() const { return m_headers; }

} // namespace logdedup
