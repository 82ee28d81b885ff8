#pragma once

#include "mp_file.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mpkit {
namespace io {

/**
 * @brief Frame stack of an mp file.
 *
 * Pixels are stored frame by frame, row-major, widened to 32 bits.
 */
struct Movie {
    std::uint64_t frame_count = 0;
    std::uint64_t height = 0;
    std::uint64_t width = 0;
    std::size_t element_size = 0;       // Stored bytes per pixel (1, 2 or 4)
    bool delta_encoded = false;         // Frames were stored as differences
    bool verified = false;              // Decoded frames matched the keyframe
    std::vector<std::uint32_t> pixels;

    [[nodiscard]] std::size_t framePixels() const {
        return static_cast<std::size_t>(height * width);
    }

    [[nodiscard]] std::uint32_t at(std::uint64_t frame, std::uint64_t y, std::uint64_t x) const {
        return pixels[static_cast<std::size_t>((frame * height + y) * width + x)];
    }

    /// Copy of one frame
    [[nodiscard]] std::vector<std::uint32_t> frame(std::uint64_t index) const;
};

/**
 * @brief Reads and decodes the frames of an mp file.
 *
 * Newer acquisition software stores the first frame as is and every later
 * frame as the wrapped difference to its predecessor. Such movies are
 * detected from the spread of the first two frames and reconstructed by a
 * running sum; the result is checked against the last frame of
 * movie/keyframe when the file has one.
 *
 * Usage:
 * @code
 * auto file = MPFile::open("event.mp");
 * Movie movie = MovieReader(file).read();
 * @endcode
 */
class MovieReader {
public:
    /// Frame dataset of version 3 files
    static constexpr const char* FRAMES_PATH = "movie/frame";
    /// Frame dataset of version 2 files
    static constexpr const char* LEGACY_FRAMES_PATH = "frame";
    /// Reference frames written next to delta-encoded movies
    static constexpr const char* KEYFRAME_PATH = "movie/keyframe";

    explicit MovieReader(const MPFile& file) : file_(file) {}

    /**
     * @brief Read all frames, decoding them if necessary.
     *
     * @return The movie
     * @throws MissingKeyError if the file has no frame dataset
     * @throws FormatError if the frames are not a stack of unsigned
     *         8, 16 or 32 bit images
     * @throws CorruptDataError if decoded frames do not match the keyframe
     */
    [[nodiscard]] Movie read() const;

    /// Path of the frame dataset
    /// @throws MissingKeyError if the file has none
    [[nodiscard]] std::string framesPath() const;

    /**
     * @brief Check whether frames look delta encoded.
     *
     * True when the standard deviation of the first frame is less than
     * half of that of the second frame.
     */
    static bool looksDeltaEncoded(const std::vector<std::uint32_t>& pixels,
                                  std::size_t frame_pixels);

    /**
     * @brief Undo delta encoding in place.
     *
     * Frame k becomes frame k-1 plus the stored difference, modulo
     * max_value + 1.
     */
    static void decodeDeltas(std::vector<std::uint32_t>& pixels, std::size_t frame_pixels,
                             std::uint64_t max_value);

private:
    const MPFile& file_;
};

/// Read the movie of an open file
inline Movie readMovie(const MPFile& file) {
    return MovieReader(file).read();
}

} // namespace io
} // namespace mpkit
