#include <catch2/catch.hpp>

#include <logdedup/exception.hpp>
#include <logdedup/varint.hpp>

#include <limits>
#include <vector>

using namespace logdedup;

TEST_CASE("varlong encoding", "[varint]") {
    REQUIRE(encode_varlong(0) == std::vector<byte>{0x00});
    REQUIRE(encode_varlong(-1) == std::vector<byte>{0x01});
    REQUIRE(encode_varlong(1) == std::vector<byte>{0x02});
    REQUIRE(encode_varlong(63) == std::vector<byte>{0x7E});
    REQUIRE(encode_varlong(-64) == std::vector<byte>{0x7F});
    REQUIRE(encode_varlong(64) == std::vector<byte>{0x80, 0x01});
    REQUIRE(encode_varlong(300) == std::vector<byte>{0xD8, 0x04});

    std::vector<byte> min = encode_varlong(std::numeric_limits<i64>::min());
    REQUIRE(min.size() == max_varlong_size);
    REQUIRE(min.back() == 0x01);
    for (size_t i = 0; i < min.size() - 1; ++i) {
        CAPTURE(i);
        REQUIRE(min[i] == 0xFF);
    }

    REQUIRE(varlong_size(0) == 1);
    REQUIRE(varlong_size(64) == 2);
    REQUIRE(varlong_size(std::numeric_limits<i64>::max()) == max_varlong_size);
}

TEST_CASE("varlong decoding", "[varint]") {
    i64 values[] = {0, 1, -1, 63, -64, 64, 300, -300, 1 << 20, 1234567890123LL,
                    std::numeric_limits<i64>::min(), std::numeric_limits<i64>::max()};

    for (i64 value : values) {
        CAPTURE(value);

        std::vector<byte> encoded = encode_varlong(value);
        size_t consumed = 0;
        REQUIRE(read_varlong(encoded.data(), encoded.size(), &consumed) == value);
        REQUIRE(consumed == encoded.size());
    }

    SECTION("trailing bytes are not consumed") {
        const byte data[] = {0xD8, 0x04, 0xAA, 0xBB};
        size_t consumed = 0;
        REQUIRE(read_varlong(data, sizeof(data), &consumed) == 300);
        REQUIRE(consumed == 2);
    }

    SECTION("truncated input") {
        const byte data[] = {0x80, 0x80};
        REQUIRE_THROWS_AS(read_varlong(data, sizeof(data)), corruption_error);
        REQUIRE_THROWS_AS(read_varlong(data, 0), corruption_error);
    }

    SECTION("too long") {
        std::vector<byte> data(11, 0xFF);
        data.back() = 0x01;
        REQUIRE_THROWS_AS(read_varlong(data.data(), data.size()), corruption_error);
    }
}
