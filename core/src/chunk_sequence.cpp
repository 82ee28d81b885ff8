#include "mpkit/io/chunk_sequence.hpp"
#include "mpkit/io/codec.hpp"
#include "mpkit/errors.hpp"
#include "mpkit/logging.hpp"
#include "detail/file_state.hpp"

#include <algorithm>

namespace mpkit {
namespace io {

namespace {

using detail::Handle;

/**
 * Copy an n-dimensional block of `extent` elements between two row-major
 * buffers with shapes src_dims and dst_dims, starting at the given offsets.
 */
void copyBlock(const std::uint8_t* src, const Shape& src_dims, const Shape& src_offset,
               std::uint8_t* dst, const Shape& dst_dims, const Shape& dst_offset,
               const Shape& extent, std::size_t element_size) {
    const std::size_t rank = extent.size();
    if (rank == 0) {
        std::memcpy(dst, src, element_size);
        return;
    }
    for (auto n : extent) {
        if (n == 0) return;
    }

    Shape src_stride(rank, 1);
    Shape dst_stride(rank, 1);
    for (std::size_t d = rank - 1; d > 0; --d) {
        src_stride[d - 1] = src_stride[d] * src_dims[d];
        dst_stride[d - 1] = dst_stride[d] * dst_dims[d];
    }

    const std::size_t row_bytes = static_cast<std::size_t>(extent[rank - 1]) * element_size;
    Shape idx(rank, 0);
    while (true) {
        std::uint64_t s = 0;
        std::uint64_t t = 0;
        for (std::size_t d = 0; d < rank; ++d) {
            s += (src_offset[d] + idx[d]) * src_stride[d];
            t += (dst_offset[d] + idx[d]) * dst_stride[d];
        }
        std::memcpy(dst + t * element_size, src + s * element_size, row_bytes);

        // Advance over all dimensions but the last
        std::ptrdiff_t d = static_cast<std::ptrdiff_t>(rank) - 2;
        for (; d >= 0; --d) {
            if (++idx[d] < extent[d]) break;
            idx[d] = 0;
        }
        if (d < 0) break;
    }
}

std::string chunkLabel(const DatasetInfo& info, Index index) {
    return "chunk " + std::to_string(index) + " of " + info.path;
}

void readThroughLibrary(hid_t dataset, hid_t mem_type, const DatasetInfo& info, Chunk& chunk) {
    const std::size_t rank = chunk.extent.size();
    Handle file_space = detail::spaceHandle(H5Dget_space(dataset));
    if (!file_space) {
        throw CorruptDataError(detail::describeFailure("cannot inspect " + info.path));
    }

    Handle mem_space;
    if (rank == 0) {
        mem_space = detail::spaceHandle(H5Screate(H5S_SCALAR));
    } else {
        std::vector<hsize_t> start(chunk.offset.begin(), chunk.offset.end());
        std::vector<hsize_t> count(chunk.extent.begin(), chunk.extent.end());
        if (H5Sselect_hyperslab(file_space.get(), H5S_SELECT_SET, start.data(), nullptr,
                                count.data(), nullptr) < 0) {
            throw CorruptDataError(detail::describeFailure("cannot select " + chunkLabel(info, chunk.index)));
        }
        mem_space = detail::spaceHandle(H5Screate_simple(static_cast<int>(rank), count.data(), nullptr));
    }

    chunk.bytes.assign(chunk.elementCount() * chunk.element_size, 0);
    if (H5Dread(dataset, mem_type, mem_space.get(), file_space.get(), H5P_DEFAULT,
                chunk.bytes.data()) < 0) {
        throw CorruptDataError(detail::describeFailure("cannot read " + chunkLabel(info, chunk.index)));
    }
}

void readRawChunk(hid_t dataset, hid_t mem_type, const DatasetInfo& info,
                  const Shape& chunk_shape, Chunk& chunk) {
    std::vector<hsize_t> offset(chunk.offset.begin(), chunk.offset.end());

    hsize_t stored = 0;
    if (H5Dget_chunk_storage_size(dataset, offset.data(), &stored) < 0 || stored == 0) {
        // Never written: HDF5 supplies the fill value
        H5Eclear2(H5E_DEFAULT);
        readThroughLibrary(dataset, mem_type, info, chunk);
        return;
    }

    std::vector<std::uint8_t> raw(static_cast<std::size_t>(stored));
    std::uint32_t filter_mask = 0;
    if (H5Dread_chunk(dataset, H5P_DEFAULT, offset.data(), &filter_mask, raw.data()) < 0) {
        throw CorruptDataError(detail::describeFailure("cannot read " + chunkLabel(info, chunk.index)));
    }

    const std::size_t expected = static_cast<std::size_t>(elementCount(chunk_shape)) * chunk.element_size;

    // Undo the filter pipeline in reverse; a set mask bit means the filter was skipped
    for (std::size_t i = info.filters.size(); i-- > 0;) {
        if (filter_mask & (1u << i)) continue;
        const auto& filter = info.filters[i];
        if (filter.id == H5Z_FILTER_DEFLATE) {
            try {
                raw = Zlib::decompress(raw, expected);
            } catch (const std::runtime_error& e) {
                throw CorruptDataError(chunkLabel(info, chunk.index) + ": " + e.what());
            }
        } else if (filter.id == H5Z_FILTER_SHUFFLE) {
            raw = Shuffle::unshuffle(raw, chunk.element_size);
        }
    }

    if (raw.size() != expected) {
        throw CorruptDataError(chunkLabel(info, chunk.index) + " decodes to " +
                               std::to_string(raw.size()) + " bytes, expected " +
                               std::to_string(expected));
    }

    if (chunk.extent == chunk_shape) {
        chunk.bytes = std::move(raw);
        return;
    }

    // Edge chunk: drop the padding outside the dataset
    const Shape origin(chunk_shape.size(), 0);
    chunk.bytes.assign(chunk.elementCount() * chunk.element_size, 0);
    copyBlock(raw.data(), chunk_shape, origin, chunk.bytes.data(), chunk.extent, origin,
              chunk.extent, chunk.element_size);
}

bool isVariableLength(hid_t type) {
    return H5Tget_class(type) == H5T_VLEN || H5Tis_variable_str(type) > 0;
}

} // namespace

ChunkSequence::ChunkSequence(std::shared_ptr<detail::FileState> file, DatasetInfo info)
    : file_(std::move(file)), info_(std::move(info)) {
    const Shape& shape = info_.shape;
    const std::size_t rank = shape.size();

    if (info_.layout == DatasetLayout::CHUNKED && info_.chunk_shape.size() == rank) {
        chunk_shape_ = info_.chunk_shape;
    } else if (rank > 0) {
        // Whole-row blocks of roughly target_chunk_bytes
        std::uint64_t row_elements = 1;
        for (std::size_t d = 1; d < rank; ++d) row_elements *= shape[d];
        std::uint64_t row_bytes = std::max<std::uint64_t>(1, row_elements * info_.element_size);
        std::uint64_t target = file_ ? file_->options.target_chunk_bytes : ReaderOptions{}.target_chunk_bytes;
        std::uint64_t rows = std::max<std::uint64_t>(1, target / row_bytes);
        rows = std::min<std::uint64_t>(rows, std::max<std::uint64_t>(1, shape[0]));
        chunk_shape_ = shape;
        chunk_shape_[0] = rows;
    }

    grid_shape_.resize(rank);
    count_ = 1;
    for (std::size_t d = 0; d < rank; ++d) {
        std::uint64_t step = std::max<std::uint64_t>(1, chunk_shape_[d]);
        grid_shape_[d] = (shape[d] + step - 1) / step;
        count_ *= static_cast<std::size_t>(grid_shape_[d]);
    }

    // Decode in-process only where the stored bytes are already native
    if (info_.layout == DatasetLayout::CHUNKED &&
        (info_.value_class == ValueClass::SIGNED || info_.value_class == ValueClass::UNSIGNED ||
         info_.value_class == ValueClass::FLOAT)) {
        bool known_filters = std::all_of(info_.filters.begin(), info_.filters.end(),
                                         [](const FilterInfo& f) {
                                             return f.id == H5Z_FILTER_DEFLATE ||
                                                    f.id == H5Z_FILTER_SHUFFLE;
                                         });
        if (known_filters && file_ && file_->isOpen()) {
            detail::ErrorStackGuard guard;
            Handle dataset = detail::openDataset(file_->file.get(), info_.path);
            if (dataset) {
                Handle type = detail::typeHandle(H5Dget_type(dataset.get()));
                Handle native = detail::typeHandle(H5Tget_native_type(type.get(), H5T_DIR_ASCEND));
                raw_chunks_ = type && native && H5Tequal(type.get(), native.get()) > 0;
            }
        }
    }
}

Shape ChunkSequence::chunkOffset(Index index) const {
    Shape offset(grid_shape_.size(), 0);
    for (std::size_t d = grid_shape_.size(); d-- > 0;) {
        offset[d] = (index % grid_shape_[d]) * chunk_shape_[d];
        index /= static_cast<Index>(grid_shape_[d]);
    }
    return offset;
}

Chunk ChunkSequence::read(Index index) const {
    if (index >= count_) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " out of range for " +
                                info_.path);
    }
    if (!file_) {
        throw std::logic_error("chunk sequence is not attached to a file");
    }
    hid_t file = file_->require();
    detail::ErrorStackGuard guard;

    Handle dataset = detail::openDataset(file, info_.path);
    if (!dataset) {
        throw MissingKeyError(info_.path, "no such dataset");
    }
    Handle type = detail::typeHandle(H5Dget_type(dataset.get()));
    if (!type) {
        throw CorruptDataError(detail::describeFailure("cannot inspect " + info_.path));
    }
    if (isVariableLength(type.get())) {
        throw std::invalid_argument("variable-length dataset " + info_.path +
                                    " cannot be read as chunks");
    }
    Handle native = detail::typeHandle(H5Tget_native_type(type.get(), H5T_DIR_ASCEND));
    hid_t mem_type = native ? native.get() : type.get();

    Chunk chunk;
    chunk.index = index;
    chunk.offset = chunkOffset(index);
    chunk.extent.resize(chunk.offset.size());
    for (std::size_t d = 0; d < chunk.offset.size(); ++d) {
        chunk.extent[d] = std::min(chunk_shape_[d], info_.shape[d] - chunk.offset[d]);
    }
    chunk.element_size = H5Tget_size(mem_type);

    if (raw_chunks_) {
        readRawChunk(dataset.get(), mem_type, info_, chunk_shape_, chunk);
    } else {
        readThroughLibrary(dataset.get(), mem_type, info_, chunk);
    }
    return chunk;
}

std::vector<std::uint8_t> ChunkSequence::readAll() const {
    std::vector<std::uint8_t> result;
    const Shape origin(info_.shape.size(), 0);
    for (const Chunk& chunk : *this) {
        if (result.empty()) {
            result.assign(static_cast<std::size_t>(info_.elementCount()) * chunk.element_size, 0);
        }
        copyBlock(chunk.bytes.data(), chunk.extent, origin, result.data(), info_.shape,
                  chunk.offset, chunk.extent, chunk.element_size);
    }
    return result;
}

} // namespace io
} // namespace mpkit
