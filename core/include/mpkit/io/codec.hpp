#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace mpkit {
namespace io {

/**
 * @brief Base64 encoding utilities.
 *
 * Used to embed opaque and structured values in XML exports.
 */
class Base64 {
public:
    /**
     * @brief Encode binary data to Base64 string.
     *
     * @param data Binary data
     * @return Base64 encoded string
     */
    static std::string encode(const std::vector<std::uint8_t>& data);

    /**
     * @brief Encode binary data to Base64 string.
     *
     * @param data Pointer to binary data
     * @param length Length of data in bytes
     * @return Base64 encoded string
     */
    static std::string encode(const std::uint8_t* data, std::size_t length);

private:
    static const char encoding_table_[];
};

/**
 * @brief Zlib decompression of deflate-filtered chunks.
 */
class Zlib {
public:
    /**
     * @brief Decompress zlib compressed data.
     *
     * @param input Compressed data
     * @param size_hint Expected decompressed size (0 = unknown)
     * @return Decompressed data
     * @throws std::runtime_error if the stream is invalid or truncated
     */
    static std::vector<std::uint8_t> decompress(
        const std::vector<std::uint8_t>& input, std::size_t size_hint = 0);
};

/**
 * @brief Inverse of the HDF5 byte shuffle filter.
 *
 * The shuffle filter stores byte j of every element contiguously;
 * trailing bytes that do not form a whole element are stored as-is.
 */
class Shuffle {
public:
    /**
     * @brief Restore element byte order of shuffled data.
     *
     * @param input Shuffled data
     * @param element_size Size of one element in bytes
     * @return Unshuffled data
     */
    static std::vector<std::uint8_t> unshuffle(const std::vector<std::uint8_t>& input,
                                               std::size_t element_size);
};

} // namespace io
} // namespace mpkit
