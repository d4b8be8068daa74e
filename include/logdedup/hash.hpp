#ifndef LOGDEDUP_HASH_HPP
#define LOGDEDUP_HASH_HPP

#include <logdedup/defs.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace logdedup {

namespace detail {

class digester_impl;

} // namespace detail

/**
 * FNV-1a hash of the given data array.
 */
u64 fnv_1a(const byte* data, size_t length) noexcept;

/// The name of the hash algorithm used when none is specified.
inline constexpr std::string_view default_hash_algorithm = "MD5";

/**
 * Computes fixed size digests of byte sequences.
 *
 * Every message digest provided by OpenSSL can be selected by name,
 * for example "MD5" (the default, 16 bytes), "SHA-1" (20 bytes), "SHA-256" (32 bytes)
 * or "SHA-512" (64 bytes). Names are matched case insensitively; the dash
 * may be omitted ("sha256").
 *
 * In addition, "FNV-1a" selects the (non-cryptographic) 64 bit FNV-1a hash,
 * which produces 8 byte digests (big endian).
 *
 * A digester keeps reusable hashing state and must not be used by multiple
 * threads at the same time.
 */
class digester {
public:
    /// Digests must have at least this many bytes.
    static constexpr u32 min_digest_size = 4;

public:
    /// Resolves the hash algorithm with the given name.
    ///
    /// \throws bad_argument If the algorithm is unknown or if its
    ///         digests are shorter than \ref min_digest_size.
    explicit digester(std::string_view algorithm = default_hash_algorithm);
    ~digester();

    digester(digester&& other) noexcept;
    digester& operator=(digester&& other) noexcept;

    /// The canonical name of the hash algorithm.
    const std::string& name() const;

    /// The size of a digest, in bytes.
    u32 digest_size() const;

    /// Computes the digest of the `size` bytes at `data` and stores
    /// it in `out`, which must have `digest_size()` writable bytes.
    /// The input is not modified.
    ///
    /// \throws hash_error If the underlying implementation reports an error.
    void digest(const byte* data, size_t size, byte* out);

private:
    detail::digester_impl& impl() const;

private:
    std::unique_ptr<detail::digester_impl> m_impl;
};

} // namespace logdedup

#endif // LOGDEDUP_HASH_HPP
