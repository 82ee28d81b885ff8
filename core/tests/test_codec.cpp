#include <catch2/catch_test_macros.hpp>
#include "mpkit/io/codec.hpp"

#include <zlib.h>

using namespace mpkit::io;

namespace {

std::vector<std::uint8_t> compressed(const std::vector<std::uint8_t>& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    std::vector<std::uint8_t> out(size);
    REQUIRE(compress2(out.data(), &size, data.data(), static_cast<uLong>(data.size()),
                      Z_BEST_COMPRESSION) == Z_OK);
    out.resize(size);
    return out;
}

} // namespace

TEST_CASE("Base64 encoding", "[codec]") {
    SECTION("Encode empty") {
        std::vector<std::uint8_t> data;
        REQUIRE(Base64::encode(data).empty());
    }

    SECTION("Encode simple") {
        std::vector<std::uint8_t> data = {'H', 'e', 'l', 'l', 'o'};
        std::string encoded = Base64::encode(data);
        REQUIRE(encoded == "SGVsbG8=");
    }

    SECTION("Encode with padding") {
        std::vector<std::uint8_t> data = {'a'};
        std::string encoded = Base64::encode(data);
        REQUIRE(encoded == "YQ==");

        data = {'a', 'b'};
        encoded = Base64::encode(data);
        REQUIRE(encoded == "YWI=");

        data = {'a', 'b', 'c'};
        encoded = Base64::encode(data);
        REQUIRE(encoded == "YWJj");
    }

    SECTION("Encode binary") {
        std::vector<std::uint8_t> data = {0xde, 0xad, 0xbe, 0xef};
        REQUIRE(Base64::encode(data) == "3q2+7w==");
        REQUIRE(Base64::encode(data.data(), 3) == "3q2+");
    }
}

TEST_CASE("Zlib decompression", "[codec]") {
    std::vector<std::uint8_t> original(5000);
    for (std::size_t i = 0; i < original.size(); ++i) {
        original[i] = static_cast<std::uint8_t>((i * 7) % 13);
    }
    auto stream = compressed(original);

    SECTION("Exact size hint") {
        REQUIRE(Zlib::decompress(stream, original.size()) == original);
    }

    SECTION("Output grows past a small hint") {
        REQUIRE(Zlib::decompress(stream, 16) == original);
    }

    SECTION("Unknown size") {
        REQUIRE(Zlib::decompress(stream) == original);
    }

    SECTION("Truncated stream") {
        stream.resize(stream.size() / 2);
        REQUIRE_THROWS_AS(Zlib::decompress(stream, original.size()), std::runtime_error);
    }

    SECTION("Not a zlib stream") {
        std::vector<std::uint8_t> garbage = {0x13, 0x37, 0x00, 0xff};
        REQUIRE_THROWS_AS(Zlib::decompress(garbage), std::runtime_error);
    }

    SECTION("Empty input") {
        REQUIRE_THROWS_AS(Zlib::decompress({}), std::runtime_error);
    }
}

TEST_CASE("Shuffle inverse", "[codec]") {
    SECTION("Two byte elements") {
        // Elements 0x0201, 0x0403, 0x0605 stored as low bytes then high bytes
        std::vector<std::uint8_t> shuffled = {0x01, 0x03, 0x05, 0x02, 0x04, 0x06};
        REQUIRE(Shuffle::unshuffle(shuffled, 2) ==
                std::vector<std::uint8_t>{0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
    }

    SECTION("Four byte elements") {
        std::vector<std::uint8_t> shuffled = {'a', 'e', 'b', 'f', 'c', 'g', 'd', 'h'};
        REQUIRE(Shuffle::unshuffle(shuffled, 4) ==
                std::vector<std::uint8_t>{'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'});
    }

    SECTION("Trailing bytes are kept") {
        std::vector<std::uint8_t> shuffled = {1, 3, 2, 4, 9};
        REQUIRE(Shuffle::unshuffle(shuffled, 2) == std::vector<std::uint8_t>{1, 2, 3, 4, 9});
    }

    SECTION("Single byte elements are unchanged") {
        std::vector<std::uint8_t> data = {5, 6, 7};
        REQUIRE(Shuffle::unshuffle(data, 1) == data);
    }
}
