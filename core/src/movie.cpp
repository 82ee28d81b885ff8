#include "mpkit/io/movie.hpp"
#include "mpkit/errors.hpp"
#include "mpkit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace mpkit {
namespace io {

namespace {

std::vector<std::uint32_t> widen(const std::vector<std::uint8_t>& bytes, std::size_t element_size) {
    std::vector<std::uint32_t> values(bytes.size() / element_size);
    for (std::size_t i = 0; i < values.size(); ++i) {
        const std::uint8_t* p = bytes.data() + i * element_size;
        switch (element_size) {
            case 1:
                values[i] = *p;
                break;
            case 2: {
                std::uint16_t v;
                std::memcpy(&v, p, sizeof(v));
                values[i] = v;
                break;
            }
            default: {
                std::uint32_t v;
                std::memcpy(&v, p, sizeof(v));
                values[i] = v;
                break;
            }
        }
    }
    return values;
}

double standardDeviation(const std::uint32_t* values, std::size_t count) {
    if (count == 0) return 0.0;
    double mean = 0.0;
    for (std::size_t i = 0; i < count; ++i) mean += values[i];
    mean /= static_cast<double>(count);
    double sum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        double d = values[i] - mean;
        sum += d * d;
    }
    return std::sqrt(sum / static_cast<double>(count));
}

void checkStack(const DatasetInfo& info) {
    if (info.shape.size() != 3) {
        throw FormatError(info.path + " is not a frame stack (rank " +
                          std::to_string(info.shape.size()) + ")");
    }
    if (info.value_class != ValueClass::UNSIGNED ||
        (info.element_size != 1 && info.element_size != 2 && info.element_size != 4)) {
        throw FormatError(info.path + " holds " + toString(info.value_class) + " pixels of " +
                          std::to_string(info.element_size) +
                          " bytes, expected unsigned 8, 16 or 32 bit");
    }
}

} // namespace

std::vector<std::uint32_t> Movie::frame(std::uint64_t index) const {
    if (index >= frame_count) {
        throw std::out_of_range("frame " + std::to_string(index) + " out of range");
    }
    auto first = pixels.begin() + static_cast<std::ptrdiff_t>(index * framePixels());
    return std::vector<std::uint32_t>(first, first + static_cast<std::ptrdiff_t>(framePixels()));
}

std::string MovieReader::framesPath() const {
    if (file_.hasDataset(FRAMES_PATH)) return FRAMES_PATH;
    if (file_.hasDataset(LEGACY_FRAMES_PATH)) return LEGACY_FRAMES_PATH;
    throw MissingKeyError(FRAMES_PATH, "no frames found in " + file_.path());
}

Movie MovieReader::read() const {
    const std::string path = framesPath();
    ChunkSequence frames = file_.readDataset(path);
    const DatasetInfo& info = frames.info();
    checkStack(info);

    Movie movie;
    movie.frame_count = info.shape[0];
    movie.height = info.shape[1];
    movie.width = info.shape[2];
    movie.element_size = info.element_size;
    movie.pixels = widen(frames.readAll(), info.element_size);

    const std::size_t frame_pixels = movie.framePixels();
    if (!looksDeltaEncoded(movie.pixels, frame_pixels)) {
        return movie;
    }

    const std::uint64_t max_value = (std::uint64_t{1} << (8 * info.element_size)) - 1;
    decodeDeltas(movie.pixels, frame_pixels, max_value);
    movie.delta_encoded = true;

    const bool has_keyframe = file_.hasDataset(KEYFRAME_PATH);
    MPKIT_LOG_DEBUG("decoded delta-encoded movie",
                    {stringField("path", file_.path()),
                     intField("frames", static_cast<std::int64_t>(movie.frame_count)),
                     boolField("keyframe", has_keyframe)});
    if (!has_keyframe) {
        MPKIT_LOG_WARN("delta-encoded movie has no keyframe, decoded frames are unverified",
                       {stringField("path", file_.path())});
        return movie;
    }

    ChunkSequence keyframes = file_.readDataset(KEYFRAME_PATH);
    const DatasetInfo& key_info = keyframes.info();
    checkStack(key_info);
    if (key_info.shape[1] != movie.height || key_info.shape[2] != movie.width ||
        key_info.shape[0] == 0) {
        throw CorruptDataError("keyframe shape does not match the frames of " + file_.path());
    }

    auto key_pixels = widen(keyframes.readAll(), key_info.element_size);
    const std::size_t last_key = static_cast<std::size_t>(key_info.shape[0] - 1) * frame_pixels;
    const std::size_t last_frame = static_cast<std::size_t>(movie.frame_count - 1) * frame_pixels;
    if (!std::equal(movie.pixels.begin() + static_cast<std::ptrdiff_t>(last_frame),
                    movie.pixels.end(),
                    key_pixels.begin() + static_cast<std::ptrdiff_t>(last_key))) {
        throw CorruptDataError("decoded movie does not match the keyframe in " + file_.path());
    }
    movie.verified = true;
    return movie;
}

bool MovieReader::looksDeltaEncoded(const std::vector<std::uint32_t>& pixels,
                                    std::size_t frame_pixels) {
    if (frame_pixels == 0 || pixels.size() < 2 * frame_pixels) {
        return false;
    }
    double first = standardDeviation(pixels.data(), frame_pixels);
    double second = standardDeviation(pixels.data() + frame_pixels, frame_pixels);
    // A flat second frame gives an infinite or undefined ratio
    if (second == 0.0) return false;
    return first / second < 0.5;
}

void MovieReader::decodeDeltas(std::vector<std::uint32_t>& pixels, std::size_t frame_pixels,
                               std::uint64_t max_value) {
    const std::uint64_t modulus = max_value + 1;
    for (std::size_t i = frame_pixels; i < pixels.size(); ++i) {
        std::uint64_t sum = std::uint64_t{pixels[i - frame_pixels]} + pixels[i];
        pixels[i] = static_cast<std::uint32_t>(sum % modulus);
    }
}

} // namespace io
} // namespace mpkit
