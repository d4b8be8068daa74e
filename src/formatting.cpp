#include <logdedup/formatting.hpp>

namespace logdedup {

std::string format_hex(const byte* data, size_t size, char separator) {
    static constexpr char hexmap[] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                      '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

    std::string s;
    if (size == 0 || data == nullptr)
        return s;

    s.reserve(separator ? 3 * size - 1 : 2 * size);
    for (size_t i = 0; i < size; ++i) {
        if (i > 0 && separator)
            s += separator;
        s += hexmap[(data[i] & 0xF0) >> 4];
        s += hexmap[data[i] & 0x0F];
    }
    return s;
}

} // namespace logdedup
