#include <catch2/catch.hpp>

#include <logdedup/dedupe_map.hpp>
#include <logdedup/exception.hpp>
#include <logdedup/probe_sequence.hpp>
#include <logdedup/record.hpp>

#include <fmt/format.h>

#include <iterator>
#include <limits>
#include <sstream>
#include <vector>

using namespace logdedup;

TEST_CASE("dedupe map construction", "[dedupe-map]") {
    SECTION("defaults") {
        dedupe_map map(240);
        REQUIRE(map.hash_algorithm() == "MD5");
        REQUIRE(map.digest_size() == 16);
        REQUIRE(map.bytes_per_entry() == 24);
        REQUIRE(map.capacity() == 10);
        REQUIRE(map.memory() == 240);
        REQUIRE(map.byte_size() == 240);
        REQUIRE(std::holds_alternative<by_offset>(map.strategy()));
        REQUIRE(map.empty());
        REQUIRE(map.size() == 0);
        REQUIRE(map.latest_offset() == -1);
        map.validate();
    }

    SECTION("unused memory") {
        dedupe_map map(250);
        REQUIRE(map.capacity() == 10);
        REQUIRE(map.byte_size() == 240);
    }

    SECTION("options") {
        dedupe_map_options options;
        options.memory = 4000;
        options.hash_algorithm = "SHA-256";
        options.strategy = "timestamp";

        dedupe_map map(options);
        REQUIRE(map.digest_size() == 32);
        REQUIRE(map.bytes_per_entry() == 40);
        REQUIRE(map.capacity() == 100);
        REQUIRE(std::holds_alternative<by_timestamp>(map.strategy()));
    }

    SECTION("fnv-1a digests") {
        dedupe_map map(160, "fnv-1a");
        REQUIRE(map.bytes_per_entry() == 16);
        REQUIRE(map.capacity() == 10);
    }

    SECTION("invalid parameters") {
        REQUIRE_THROWS_AS(dedupe_map(0), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(23), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(240, "no-such-hash"), bad_argument);

        REQUIRE_THROWS_AS(dedupe_map(-1), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(-240), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(std::numeric_limits<i64>::min()), bad_argument);

        // More slots than positions can address, rejected before the buffer is allocated.
        const i64 max_memory = static_cast<i64>(probe_sequence::max_slots) * 24;
        REQUIRE_THROWS_AS(dedupe_map(max_memory + 24), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(std::numeric_limits<i64>::max()), bad_argument);
        REQUIRE_THROWS_AS(dedupe_map(max_memory + 24, "fnv-1a"), bad_argument);
    }
}

TEST_CASE("dedupe map keeps the latest offset", "[dedupe-map]") {
    dedupe_map map(240);
    REQUIRE(map.capacity() == 10);

    REQUIRE(map.put(memory_record("a", 5)));
    REQUIRE(map.size() == 1);
    REQUIRE(map.get("a") == 5);

    REQUIRE_FALSE(map.put(memory_record("a", 3)));
    REQUIRE(map.get("a") == 5);

    REQUIRE(map.put(memory_record("a", 9)));
    REQUIRE(map.get("a") == 9);
    REQUIRE(map.size() == 1);

    REQUIRE(map.put(memory_record("b", 1)));
    REQUIRE(map.size() == 2);
    REQUIRE(map.get("b") == 1);
    REQUIRE(map.get("a") == 9);

    REQUIRE(map.latest_offset() == 9);
    REQUIRE(map.utilization() == Approx(0.2));
    map.validate();

    map.clear();
    REQUIRE(map.size() == 0);
    REQUIRE(map.get("a") == -1);
    REQUIRE(map.get("b") == -1);
    REQUIRE(map.utilization() == 0.0);
    REQUIRE(map.latest_offset() == -1);
    map.validate();
}

TEST_CASE("dedupe map equal versions are not greater", "[dedupe-map]") {
    dedupe_map map(240);
    REQUIRE(map.put(memory_record("a", 5)));
    REQUIRE_FALSE(map.greater(memory_record("a", 5)));
    REQUIRE_FALSE(map.put(memory_record("a", 5)));
    REQUIRE(map.greater(memory_record("a", 6)));
    REQUIRE(map.greater(memory_record("unknown", 0)));
    REQUIRE(map.size() == 1);
}

TEST_CASE("dedupe map missing keys", "[dedupe-map]") {
    dedupe_map map(240);
    REQUIRE(map.get("never inserted") == -1);
    REQUIRE(map.get("") == -1);

    const byte binary_key[] = {0x00, 0x01, 0x02};
    REQUIRE(map.get(binary_key, sizeof(binary_key)) == -1);

    memory_record rec(std::vector<byte>(std::begin(binary_key), std::end(binary_key)), 17);
    REQUIRE(map.put(rec));
    REQUIRE(map.get(binary_key, sizeof(binary_key)) == 17);
}

TEST_CASE("dedupe map ordered by timestamp", "[dedupe-map]") {
    dedupe_map map(240, "MD5", "timestamp");

    REQUIRE(map.put(memory_record("x", 100, 50)));
    REQUIRE(map.get("x") == 50);

    // The newer timestamp wins even though the offset is smaller.
    REQUIRE(map.put(memory_record("x", 50, 80)));
    REQUIRE(map.get("x") == 80);
    REQUIRE(map.size() == 1);
    REQUIRE(map.latest_offset() == 100);

    REQUIRE_FALSE(map.put(memory_record("x", 200, 70)));
    REQUIRE(map.get("x") == 80);
    REQUIRE(map.latest_offset() == 100);
}

TEST_CASE("dedupe map ordered by header", "[dedupe-map]") {
    dedupe_map map(240, "MD5", "version");

    auto versioned = [](const char* key, i64 offset, i64 version) {
        memory_record rec(key, offset);
        rec.add_version_header("Version", version);
        return rec;
    };

    REQUIRE(map.put(versioned("k", 10, 3)));
    REQUIRE(map.get("k") == 3);
    REQUIRE_FALSE(map.put(versioned("k", 11, 2)));
    REQUIRE(map.put(versioned("k", 12, 7)));
    REQUIRE(map.get("k") == 7);
    REQUIRE(map.latest_offset() == 12);

    // Records without the header never replace a known version.
    REQUIRE_FALSE(map.put(memory_record("k", 13)));
    REQUIRE(map.get("k") == 7);

    // But they are stored for unknown keys, with a version of -1 ...
    REQUIRE(map.put(memory_record("u", 14)));
    REQUIRE(map.size() == 2);
    REQUIRE(map.get("u") == -1);
    REQUIRE(map.latest_offset() == 14);

    // ... which any later version replaces in place.
    REQUIRE(map.put(versioned("u", 15, 0)));
    REQUIRE(map.get("u") == 0);
    REQUIRE(map.size() == 2);
    map.validate();
}

TEST_CASE("dedupe map ignores records without key", "[dedupe-map]") {
    dedupe_map map(240);

    memory_record keyless;
    keyless.set_offset(42);
    REQUIRE_FALSE(map.put(keyless));
    REQUIRE(map.size() == 0);
    REQUIRE(map.latest_offset() == -1);
    REQUIRE(map.greater(keyless));

    map.update_latest_offset(42);
    REQUIRE(map.latest_offset() == 42);
    map.update_latest_offset(10);
    REQUIRE(map.latest_offset() == 42);

    REQUIRE(map.put(memory_record("a", 5)));
    REQUIRE(map.latest_offset() == 42);
}

TEST_CASE("dedupe map rejects puts when full", "[dedupe-map]") {
    dedupe_map map(3 * 24);
    REQUIRE(map.capacity() == 3);

    REQUIRE(map.put(memory_record("a", 1)));
    REQUIRE(map.put(memory_record("b", 2)));
    REQUIRE(map.put(memory_record("c", 3)));
    REQUIRE(map.size() == map.capacity());
    REQUIRE(map.utilization() == 1.0);

    REQUIRE_THROWS_AS(map.put(memory_record("d", 4)), bad_operation);
    REQUIRE_THROWS_AS(map.put(memory_record("a", 5)), bad_operation);
    REQUIRE(map.size() == 3);

    // Lookups on a full table terminate.
    REQUIRE(map.get("a") == 1);
    REQUIRE(map.get("b") == 2);
    REQUIRE(map.get("c") == 3);
    REQUIRE(map.get("d") == -1);
    map.validate();

    map.clear();
    REQUIRE(map.put(memory_record("d", 4)));
    REQUIRE(map.get("d") == 4);
}

TEST_CASE("dedupe map with a single slot", "[dedupe-map]") {
    dedupe_map map(24);
    REQUIRE(map.capacity() == 1);

    REQUIRE(map.put(memory_record("a", 1)));
    REQUIRE(map.get("a") == 1);
    REQUIRE(map.get("b") == -1);
    REQUIRE_THROWS_AS(map.put(memory_record("a", 2)), bad_operation);
}

TEST_CASE("dedupe map counters", "[dedupe-map]") {
    dedupe_map map(2400);

    // No lookups yet: the collision rate must be well defined.
    REQUIRE(map.lookups() == 0);
    REQUIRE(map.probes() == 0);
    REQUIRE(map.collision_rate() == 0.0);

    // One lookup for the comparison, one for the insertion.
    REQUIRE(map.put(memory_record("a", 1)));
    REQUIRE(map.lookups() == 2);
    REQUIRE(map.probes() == 2);
    REQUIRE(map.collision_rate() == 0.0);

    REQUIRE(map.get("a") == 1);
    REQUIRE(map.lookups() == 3);

    // A rejected put only performs the comparison.
    REQUIRE_FALSE(map.put(memory_record("a", 0)));
    REQUIRE(map.lookups() == 4);
    REQUIRE(map.probes() >= map.lookups());

    map.clear();
    REQUIRE(map.lookups() == 0);
    REQUIRE(map.probes() == 0);
    REQUIRE(map.collision_rate() == 0.0);
}

TEST_CASE("dedupe map with many keys", "[dedupe-map]") {
    const char* algorithms[] = {"MD5", "SHA-1", "FNV-1a"};

    for (const char* algorithm : algorithms) {
        CAPTURE(algorithm);

        dedupe_map map(1000 * 28, algorithm);
        REQUIRE(map.capacity() >= 1000);

        const u64 count = map.capacity() * 9 / 10;
        for (u64 i = 0; i < count; ++i) {
            CAPTURE(i);
            if (!map.put(memory_record(fmt::format("key-{}", i), static_cast<i64>(i))))
                FAIL("Insertion failed.");
        }
        REQUIRE(map.size() == count);
        REQUIRE(map.latest_offset() == static_cast<i64>(count - 1));
        map.validate();

        // Newer offsets for every other key.
        for (u64 i = 0; i < count; i += 2) {
            CAPTURE(i);
            if (!map.put(memory_record(fmt::format("key-{}", i), static_cast<i64>(count + i))))
                FAIL("Update failed.");
        }
        REQUIRE(map.size() == count);

        for (u64 i = 0; i < count; ++i) {
            CAPTURE(i);
            const i64 expected = static_cast<i64>(i % 2 == 0 ? count + i : i);
            if (map.get(fmt::format("key-{}", i)) != expected)
                FAIL("Unexpected value.");
        }
        REQUIRE(map.get("missing") == -1);
        REQUIRE(map.collision_rate() >= 0.0);
        map.validate();
    }
}

TEST_CASE("dedupe map is movable", "[dedupe-map]") {
    dedupe_map map(240);
    REQUIRE(map.put(memory_record("a", 5)));

    dedupe_map other(std::move(map));
    REQUIRE(other.get("a") == 5);
    REQUIRE(other.size() == 1);

    REQUIRE_THROWS_AS(map.size(), bad_operation);

    map = dedupe_map(480);
    REQUIRE(map.capacity() == 20);
    REQUIRE(map.get("a") == -1);
}

TEST_CASE("dedupe map dump", "[dedupe-map]") {
    dedupe_map map(240);
    REQUIRE(map.put(memory_record("a", 5)));
    REQUIRE(map.put(memory_record("b", 7)));

    std::stringstream ss;
    map.dump(ss);

    const std::string output = ss.str();
    REQUIRE(output.find("Hash algorithm: MD5") != std::string::npos);
    REQUIRE(output.find("Strategy: offset") != std::string::npos);
    REQUIRE(output.find("Entries: 2") != std::string::npos);
    REQUIRE(output.find("0CC175B9C0F1B6A831C399E269772661 -> 5") != std::string::npos);
}
