#include <logdedup/dedupe_map.hpp>
#include <logdedup/record.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <vector>

// Builds an in-memory log in which a small set of keys is overwritten many times,
// then compacts it the way a log cleaner does: the first pass records the latest
// offset of every key, the second pass keeps only the records that are not superseded.

namespace {

struct settings {
    // Number of records in the log.
    int records = 10000;

    // Number of distinct keys.
    int keys = 100;

    // Memory used by the dedupe map, in bytes.
    logdedup::i64 memory = 64 * 1024;
};

std::vector<logdedup::memory_record> build_log(const settings& s) {
    std::vector<logdedup::memory_record> log;
    log.reserve(s.records);
    for (int offset = 0; offset < s.records; ++offset) {
        if (offset % 97 == 0) {
            // Control records without key.
            logdedup::memory_record rec;
            rec.set_offset(offset);
            log.push_back(std::move(rec));
            continue;
        }
        log.emplace_back(fmt::format("user-{}", (offset * 7) % s.keys), offset);
    }
    return log;
}

} // namespace

int main() {
    using namespace logdedup;

    spdlog::set_level(spdlog::level::debug);

    settings s;
    std::vector<memory_record> log = build_log(s);

    dedupe_map map(s.memory);

    // First pass: remember the latest offset of every key.
    for (const memory_record& rec : log) {
        if (!rec.has_key()) {
            map.update_latest_offset(rec.offset());
            continue;
        }
        map.put(rec);
    }
    map.validate();

    // Second pass: keep the records that are the latest version of their key.
    // Keyless records are always retained.
    std::vector<const memory_record*> retained;
    for (const memory_record& rec : log) {
        if (!rec.has_key()) {
            retained.push_back(&rec);
            continue;
        }
        const i64 latest = map.get(rec.key_data(), rec.key_size());
        if (latest <= rec.offset())
            retained.push_back(&rec);
    }

    fmt::print("Scanned {} records up to offset {}, retained {}.\n", log.size(),
               map.latest_offset(), retained.size());
    fmt::print("Utilization: {:.2f}, collision rate: {:.3f}\n", map.utilization(),
               map.collision_rate());

    map.dump(std::cout);
    map.clear();
    return 0;
}
