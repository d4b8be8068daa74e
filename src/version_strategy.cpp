#include <logdedup/version_strategy.hpp>

#include <logdedup/record.hpp>
#include <logdedup/type_traits.hpp>
#include <logdedup/varint.hpp>

#include <algorithm>
#include <cctype>

namespace logdedup {

namespace {

std::string_view trim(std::string_view str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!str.empty() && is_space(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && is_space(str.back()))
        str.remove_suffix(1);
    return str;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                  return std::tolower(x) == std::tolower(y);
              });
}

i64 header_version(const std::string& name, const record& rec) {
    if (!rec.has_key())
        return no_version;

    for (const record_header& header : rec.headers()) {
        if (!header.value || header.value->empty())
            continue;
        if (!equals_ignore_case(trim(header.key), name))
            continue;

        return read_varlong(header.value->data(), header.value->size());
    }
    return no_version;
}

} // namespace

version_strategy parse_version_strategy(std::string_view name) {
    name = trim(name);
    if (name.empty() || equals_ignore_case(name, offset_strategy_name))
        return by_offset();
    if (equals_ignore_case(name, timestamp_strategy_name))
        return by_timestamp();
    return by_header{std::string(name)};
}

std::string to_string(const version_strategy& strategy) {
    return std::visit(
        [](const auto& s) -> std::string {
            using type = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<type, by_offset>) {
                return std::string(offset_strategy_name);
            } else if constexpr (std::is_same_v<type, by_timestamp>) {
                return std::string(timestamp_strategy_name);
            } else if constexpr (std::is_same_v<type, by_header>) {
                return s.name;
            } else {
                static_assert(always_false<type>::value, "Unhandled version strategy.");
            }
        },
        strategy);
}

i64 extract_version(const version_strategy& strategy, const record& rec) {
    return std::visit(
        [&](const auto& s) -> i64 {
            using type = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<type, by_offset>) {
                return rec.offset();
            } else if constexpr (std::is_same_v<type, by_timestamp>) {
                return rec.timestamp();
            } else if constexpr (std::is_same_v<type, by_header>) {
                return header_version(s.name, rec);
            } else {
                static_assert(always_false<type>::value, "Unhandled version strategy.");
            }
        },
        strategy);
}

} // namespace logdedup
