#ifndef LOGDEDUP_VERSION_STRATEGY_HPP
#define LOGDEDUP_VERSION_STRATEGY_HPP

#include <logdedup/defs.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace logdedup {

class record;

/// Returned by \ref extract_version when a record carries no applicable version.
inline constexpr i64 no_version = -1;

/// The record's offset is its version.
struct by_offset {};

/// The record's timestamp is its version.
struct by_timestamp {};

/// The version is stored in a record header (varlong encoded).
struct by_header {
    /// Trimmed header name, compared case insensitively.
    std::string name;
};

/**
 * Decides which scalar value of a record represents its "version".
 * Records with a larger version supersede records with the same key
 * and a smaller version.
 */
using version_strategy = std::variant<by_offset, by_timestamp, by_header>;

/// Name of the default (offset based) strategy.
inline constexpr std::string_view offset_strategy_name = "offset";

/// Name of the timestamp based strategy.
inline constexpr std::string_view timestamp_strategy_name = "timestamp";

/// Parses a strategy name (case insensitive, surrounding whitespace is ignored).
/// An empty string or "offset" select \ref by_offset, "timestamp" selects
/// \ref by_timestamp. Any other string is interpreted as the name of a header.
version_strategy parse_version_strategy(std::string_view name);

/// Returns the strategy's name, in the form accepted by \ref parse_version_strategy.
std::string to_string(const version_strategy& strategy);

/// Extracts the version of `rec` according to `strategy`.
/// Returns \ref no_version if the header strategy is used and the record
/// has no key, no headers, or no header with that name and a non-empty value.
///
/// \throws corruption_error If the header value is not a valid varlong.
i64 extract_version(const version_strategy& strategy, const record& rec);

} // namespace logdedup

#endif // LOGDEDUP_VERSION_STRATEGY_HPP
