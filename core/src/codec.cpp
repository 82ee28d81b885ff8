#include "mpkit/io/codec.hpp"
#include <algorithm>
#include <limits>

#include <zlib.h>

namespace mpkit {
namespace io {

// Base64 encoding table
const char Base64::encoding_table_[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string Base64::encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

// Opaque and structured values reach XML exports through here
std::string Base64::encode(const std::uint8_t* data, std::size_t length) {
    std::string output;
    output.reserve(4 * ((length + 2) / 3));

    for (std::size_t i = 0; i < length; i += 3) {
        const std::size_t take = std::min<std::size_t>(3, length - i);
        std::uint32_t n = 0;
        for (std::size_t k = 0; k < take; ++k) {
            n |= static_cast<std::uint32_t>(data[i + k]) << (16 - 8 * k);
        }
        // A group of take bytes yields take + 1 symbols, padded to four
        for (std::size_t k = 0; k < 4; ++k) {
            output += k <= take ? encoding_table_[(n >> (18 - 6 * k)) & 0x3F] : '=';
        }
    }
    return output;
}

std::vector<std::uint8_t> Zlib::decompress(const std::vector<std::uint8_t>& input,
                                           std::size_t size_hint) {
    if (input.empty()) {
        throw std::runtime_error("Zlib decompression failed: empty input");
    }
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw std::runtime_error("Zlib decompression failed: input too large");
    }

    // Start with the expected size, or 4x input size when unknown
    std::size_t output_size = size_hint > 0 ? size_hint : input.size() * 4;
    std::vector<std::uint8_t> output(output_size);

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    if (inflateInit(&stream) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompression");
    }

    int result;
    while ((result = inflate(&stream, Z_NO_FLUSH)) != Z_STREAM_END) {
        if (result == Z_OK && stream.avail_out == 0) {
            // Need more output space
            std::size_t current = output.size();
            output_size *= 2;
            output.resize(output_size);
            stream.next_out = output.data() + current;
            stream.avail_out = static_cast<uInt>(output_size - current);
        } else if (result != Z_OK) {
            std::string reason = stream.msg ? stream.msg : "truncated stream";
            inflateEnd(&stream);
            throw std::runtime_error("Zlib decompression failed: " + reason);
        }
    }

    output.resize(output.size() - stream.avail_out);
    inflateEnd(&stream);

    return output;
}

std::vector<std::uint8_t> Shuffle::unshuffle(const std::vector<std::uint8_t>& input,
                                             std::size_t element_size) {
    if (element_size <= 1 || input.size() < element_size) {
        return input;
    }

    std::size_t count = input.size() / element_size;
    std::vector<std::uint8_t> output(input.size());

    for (std::size_t j = 0; j < element_size; ++j) {
        const std::uint8_t* plane = input.data() + j * count;
        for (std::size_t i = 0; i < count; ++i) {
            output[i * element_size + j] = plane[i];
        }
    }

    // Leftover bytes are not shuffled
    std::size_t tail = count * element_size;
    std::copy(input.begin() + static_cast<std::ptrdiff_t>(tail), input.end(),
              output.begin() + static_cast<std::ptrdiff_t>(tail));

    return output;
}

} // namespace io
} // namespace mpkit
