#ifndef LOGDEDUP_FORMATTING_HPP
#define LOGDEDUP_FORMATTING_HPP

#include <logdedup/defs.hpp>

#include <string>

namespace logdedup {

// Format a byte array as an uppercase hex string.
// If `separator` is not '\0', it will be inserted between two bytes.
std::string format_hex(const byte* data, size_t size, char separator = '\0');

} // namespace logdedup

#endif // LOGDEDUP_FORMATTING_HPP
