#include <catch2/catch.hpp>

#include <logdedup/exception.hpp>
#include <logdedup/formatting.hpp>
#include <logdedup/hash.hpp>

#include <string>
#include <vector>

using namespace logdedup;

namespace {

std::string hex_digest(digester& d, const std::string& input) {
    std::vector<byte> out(d.digest_size());
    d.digest(reinterpret_cast<const byte*>(input.data()), input.size(), out.data());
    return format_hex(out.data(), out.size());
}

} // namespace

TEST_CASE("fnv-1a", "[hash]") {
    REQUIRE(fnv_1a(nullptr, 0) == UINT64_C(0xcbf29ce484222325));

    const byte a[] = {'a'};
    REQUIRE(fnv_1a(a, 1) == UINT64_C(0xaf63dc4c8601ec8c));
}

TEST_CASE("digest sizes", "[hash]") {
    REQUIRE(digester().digest_size() == 16);
    REQUIRE(digester().name() == "MD5");

    REQUIRE(digester("md5").digest_size() == 16);
    REQUIRE(digester("SHA-1").digest_size() == 20);
    REQUIRE(digester("sha256").digest_size() == 32);
    REQUIRE(digester("SHA-256").digest_size() == 32);
    REQUIRE(digester(" sha-512 ").digest_size() == 64);

    digester fnv("fnv-1a");
    REQUIRE(fnv.digest_size() == 8);
    REQUIRE(fnv.name() == "FNV-1a");
}

TEST_CASE("digest values", "[hash]") {
    digester md5("MD5");
    REQUIRE(hex_digest(md5, "") == "D41D8CD98F00B204E9800998ECF8427E");
    REQUIRE(hex_digest(md5, "a") == "0CC175B9C0F1B6A831C399E269772661");

    // The context is reused; repeated digests must be identical.
    REQUIRE(hex_digest(md5, "a") == "0CC175B9C0F1B6A831C399E269772661");

    digester sha256("SHA-256");
    REQUIRE(hex_digest(sha256, "abc")
            == "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");

    digester fnv("FNV-1a");
    REQUIRE(hex_digest(fnv, "a") == "AF63DC4C8601EC8C");
}

TEST_CASE("digest leaves the input untouched", "[hash]") {
    digester md5;
    std::vector<byte> key{'k', 'e', 'y'};
    std::vector<byte> out(md5.digest_size());
    md5.digest(key.data(), key.size(), out.data());
    REQUIRE(key == std::vector<byte>{'k', 'e', 'y'});
}

TEST_CASE("invalid hash algorithms", "[hash]") {
    REQUIRE_THROWS_AS(digester("no-such-hash"), bad_argument);
    REQUIRE_THROWS_AS(digester(""), bad_argument);
    REQUIRE_THROWS_AS(digester("   "), bad_argument);
}

TEST_CASE("hex formatting", "[formatting]") {
    const byte data[] = {0x0C, 0xC1, 0x75, 0xB9};
    REQUIRE(format_hex(data, sizeof(data)) == "0CC175B9");
    REQUIRE(format_hex(data, sizeof(data), ' ') == "0C C1 75 B9");
    REQUIRE(format_hex(data, 0).empty());
}
