#include <logdedup/hash.hpp>

#include <logdedup/exception.hpp>
#include <logdedup/serialization.hpp>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace logdedup {

u64 fnv_1a(const byte* data, size_t length) noexcept {
    static const u64 magic_prime = UINT64_C(0x00000100000001b3);

    u64 hash = UINT64_C(0xcbf29ce484222325);
    for (; length > 0; --length) {
        hash = hash ^ *data++;
        hash = hash * magic_prime;
    }

    return hash;
}

namespace detail {

namespace {

struct md_deleter {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ptr = std::unique_ptr<EVP_MD, md_deleter>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

std::string normalize(std::string_view name) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!name.empty() && is_space(name.front()))
        name.remove_prefix(1);
    while (!name.empty() && is_space(name.back()))
        name.remove_suffix(1);

    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_fnv_1a(const std::string& name) {
    return name == "FNV-1A" || name == "FNV1A";
}

// Fetches the digest implementation from the default OpenSSL provider.
// Tries the name as given, then without dashes ("SHA-256" -> "SHA256").
md_ptr fetch_digest(const std::string& name) {
    md_ptr md(EVP_MD_fetch(nullptr, name.c_str(), nullptr));
    if (!md) {
        std::string compact = name;
        compact.erase(std::remove(compact.begin(), compact.end(), '-'), compact.end());
        if (compact != name)
            md.reset(EVP_MD_fetch(nullptr, compact.c_str(), nullptr));
    }
    ERR_clear_error();
    return md;
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0)
        return "unknown error";

    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

} // namespace

class digester_impl {
public:
    explicit digester_impl(std::string_view algorithm);

    digester_impl(const digester_impl&) = delete;
    digester_impl& operator=(const digester_impl&) = delete;

    const std::string& name() const { return m_name; }
    u32 digest_size() const { return m_digest_size; }

    void digest(const byte* data, size_t size, byte* out);

private:
    std::string m_name;
    u32 m_digest_size = 0;

    // Both are null when the built-in FNV-1a hash is used.
    md_ptr m_md;
    md_ctx_ptr m_ctx;
};

digester_impl::digester_impl(std::string_view algorithm)
    : m_name(normalize(algorithm)) {
    if (m_name.empty()) {
        LOGDEDUP_THROW(bad_argument("The hash algorithm name must not be empty."));
    }

    if (is_fnv_1a(m_name)) {
        m_name = "FNV-1a";
        m_digest_size = serialized_size<u64>();
        return;
    }

    m_md = fetch_digest(m_name);
    if (!m_md) {
        LOGDEDUP_THROW(bad_argument(fmt::format("Unknown hash algorithm: {}.", algorithm)));
    }

    const int size = EVP_MD_get_size(m_md.get());
    if (size < static_cast<int>(digester::min_digest_size)) {
        LOGDEDUP_THROW(bad_argument(
            fmt::format("The hash algorithm {} produces digests of {} bytes, at least {} are required.",
                        m_name, size, digester::min_digest_size)));
    }
    m_digest_size = static_cast<u32>(size);

    m_ctx.reset(EVP_MD_CTX_new());
    if (!m_ctx) {
        LOGDEDUP_THROW(hash_error(
            fmt::format("Failed to allocate a digest context: {}.", openssl_error())));
    }
}

void digester_impl::digest(const byte* data, size_t size, byte* out) {
    if (!m_md) {
        serialize(fnv_1a(data, size), out);
        return;
    }

    EVP_MD_CTX* ctx = m_ctx.get();
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx, m_md.get(), nullptr) != 1
        || EVP_DigestUpdate(ctx, data, size) != 1
        || EVP_DigestFinal_ex(ctx, out, &length) != 1) {
        LOGDEDUP_THROW(hash_error(
            fmt::format("Failed to compute a {} digest: {}.", m_name, openssl_error())));
    }
    if (length != m_digest_size) {
        LOGDEDUP_THROW(hash_error(fmt::format("Unexpected {} digest length {} (expected {}).",
                                              m_name, length, m_digest_size)));
    }
}

} // namespace detail

digester::digester(std::string_view algorithm)
    : m_impl(std::make_unique<detail::digester_impl>(algorithm)) {}

digester::~digester() {}

digester::digester(digester&& other) noexcept = default;
digester& digester::operator=(digester&& other) noexcept = default;

const std::string& digester::name() const { return impl().name(); }

u32 digester::digest_size() const { return impl().digest_size(); }

void digester::digest(const byte* data, size_t size, byte* out) {
    impl().digest(data, size, out);
}

detail::digester_impl& digester::impl() const {
    if (!m_impl) {
        LOGDEDUP_THROW(bad_operation("Invalid digester instance."));
    }
    return *m_impl;
}

} // namespace logdedup
