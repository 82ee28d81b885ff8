#pragma once

#include "../container.hpp"
#include <cstdint>
#include <cstring>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace mpkit {
namespace io {

namespace detail {
struct FileState;
}

/**
 * @brief One decoded block of a dataset.
 *
 * bytes holds the elements inside the dataset bounds in row-major order
 * and native byte order. Edge chunks are clipped to the dataset extent.
 */
struct Chunk {
    Index index = 0;
    Shape offset;               // Element coordinates of the first element
    Shape extent;               // Elements per dimension
    std::size_t element_size = 0;
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] std::size_t elementCount() const {
        return static_cast<std::size_t>(mpkit::elementCount(extent));
    }

    /// Reinterpret the chunk as elements of type T
    template<typename T>
    [[nodiscard]] std::vector<T> as() const {
        if (sizeof(T) != element_size) {
            throw std::invalid_argument("Chunk element size does not match requested type");
        }
        std::vector<T> result(elementCount());
        if (!result.empty()) {
            std::memcpy(result.data(), bytes.data(), result.size() * sizeof(T));
        }
        return result;
    }
};

/**
 * @brief Lazy, restartable sequence of the chunks of a dataset.
 *
 * Chunked datasets are indexed by their storage chunks; contiguous and
 * compact datasets are split into blocks of whole rows. Each chunk is read
 * and decompressed only when requested, so iterating twice reads the file
 * twice and partial reads never load the full dataset.
 *
 * The sequence refers to the MPFile it came from; reading after the file
 * was closed throws std::logic_error.
 *
 * Usage:
 * @code
 * for (const Chunk& chunk : file.readDataset("movie/frame")) {
 *     auto pixels = chunk.as<std::uint16_t>();
 * }
 * @endcode
 */
class ChunkSequence {
public:
    /// Input iterator; reads the chunk on first dereference
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        Iterator() = default;
        Iterator(const ChunkSequence* sequence, Index index)
            : sequence_(sequence), index_(index) {}

        reference operator*() const {
            if (!current_) current_ = sequence_->read(index_);
            return *current_;
        }
        pointer operator->() const { return &**this; }

        Iterator& operator++() {
            ++index_;
            current_.reset();
            return *this;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return index_ != other.index_; }

    private:
        const ChunkSequence* sequence_ = nullptr;
        Index index_ = 0;
        mutable std::optional<Chunk> current_;
    };

    ChunkSequence(std::shared_ptr<detail::FileState> file, DatasetInfo info);

    [[nodiscard]] const DatasetInfo& info() const noexcept { return info_; }

    /// Shape of one (unclipped) chunk
    [[nodiscard]] const Shape& chunkShape() const noexcept { return chunk_shape_; }

    /// Number of chunks along each dimension
    [[nodiscard]] const Shape& gridShape() const noexcept { return grid_shape_; }

    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    /// True when chunks are decoded by mpkit rather than by the HDF5 pipeline
    [[nodiscard]] bool decodesRawChunks() const noexcept { return raw_chunks_; }

    /**
     * @brief Read and decode one chunk.
     *
     * @param index Chunk index in [0, size())
     * @throws std::out_of_range if index is out of range
     * @throws std::logic_error if the file was closed
     * @throws CorruptDataError if decompression or verification fails
     */
    [[nodiscard]] Chunk read(Index index) const;

    /**
     * @brief Read the whole dataset into one row-major buffer.
     */
    [[nodiscard]] std::vector<std::uint8_t> readAll() const;

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, count_); }

private:
    Shape chunkOffset(Index index) const;

    std::shared_ptr<detail::FileState> file_;
    DatasetInfo info_;
    Shape chunk_shape_;
    Shape grid_shape_;
    std::size_t count_ = 0;
    bool raw_chunks_ = false;
};

} // namespace io
} // namespace mpkit
