#pragma once

#include "../container.hpp"
#include "../errors.hpp"
#include "chunk_sequence.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mpkit {
namespace io {

namespace detail {
struct FileState;
}

/**
 * @brief Options for opening and reading mp files.
 */
struct ReaderOptions {
    /// Extra open attempts when a file with a valid signature is refused
    /// by HDF5 (typically still locked by the acquisition software)
    unsigned open_retries = 0;

    /// Delay between open attempts
    std::chrono::milliseconds retry_delay{200};

    /// Datasets with at most this many elements are raw attributes
    std::uint64_t max_attribute_elements = 4096;

    /// Approximate chunk size used to split contiguous datasets
    std::size_t target_chunk_bytes = 1 << 20;
};

/**
 * @brief Location and version of the HDF5 superblock.
 */
struct FormatSignature {
    std::uint64_t offset = 0;           // User block size before the superblock
    std::uint8_t superblock_version = 0;
};

/**
 * @brief An opened mp (mass photometry) container.
 *
 * The reader is schema-agnostic: it exposes groups, datasets and raw
 * attributes without interpreting them.
 *
 * The file is closed when the MPFile is destroyed or close() is called;
 * close() is idempotent. All HDF5 identifiers are released on close,
 * including those of objects opened through this file.
 *
 * Usage:
 * @code
 * auto file = MPFile::open("event.mp");
 * for (const auto& name : file.listGroups()) { ... }
 * auto rate = file.readAttribute("movie/configuration/acq_camera/frame_rate");
 * @endcode
 */
class MPFile {
public:
    ~MPFile();

    // Non-copyable
    MPFile(const MPFile&) = delete;
    MPFile& operator=(const MPFile&) = delete;

    // Movable
    MPFile(MPFile&&) noexcept;
    MPFile& operator=(MPFile&&) noexcept;

    /**
     * @brief Open an mp file for reading.
     *
     * @param path Path to the file
     * @param options Reader options
     * @return The opened file
     * @throws NotFoundError if the path does not exist or cannot be read
     * @throws FormatError if the HDF5 signature is missing or unsupported
     * @throws CorruptDataError if the signature is valid but the
     *         container structure cannot be opened
     */
    static MPFile open(const std::string& path, const ReaderOptions& options = {});

    /**
     * @brief Check if a file carries a valid HDF5 signature.
     *
     * @param path Path to check
     * @return true if the file appears to be an mp container
     */
    static bool isValidMP(const std::string& path);

    /// Release all HDF5 resources. Safe to call more than once.
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] const std::string& path() const noexcept;
    [[nodiscard]] const FormatSignature& signature() const noexcept;
    [[nodiscard]] const ReaderOptions& options() const noexcept;

    /**
     * @brief Names of the top-level groups and datasets.
     *
     * Creation order when the file tracks it, storage order otherwise.
     */
    [[nodiscard]] std::vector<std::string> listGroups() const;

    /**
     * @brief Entries of a group, in the same order as listGroups().
     *
     * @param group Group path ("/" or "" for the root)
     * @throws MissingKeyError if the group does not exist
     */
    [[nodiscard]] std::vector<EntryInfo> listEntries(const std::string& group = "/") const;

    /// True if readAttribute(path) would succeed
    [[nodiscard]] bool hasAttribute(const std::string& path) const;

    /// True if a dataset exists at path (of any size)
    [[nodiscard]] bool hasDataset(const std::string& path) const;

    /**
     * @brief Read one raw attribute.
     *
     * @param path Attribute key: a dataset path or "<object>@<attribute>",
     *        with '@' and '\\' in names escaped (see datasetKey())
     * @return The stored value, without type coercion
     * @throws MissingKeyError if nothing is stored under path
     * @throws CorruptDataError if the value cannot be read
     */
    [[nodiscard]] RawAttribute readAttribute(const std::string& path) const;

    /**
     * @brief Walk the whole container.
     *
     * Depth-first, in the order of listEntries(). Returns every raw
     * attribute and every bulk dataset.
     */
    [[nodiscard]] ContainerWalk walk() const;

    /// All raw attributes, as found by walk()
    [[nodiscard]] std::vector<RawAttribute> readAttributes() const {
        return walk().attributes;
    }

    /**
     * @brief Describe a dataset.
     *
     * @throws MissingKeyError if no dataset exists at path
     */
    [[nodiscard]] DatasetInfo datasetInfo(const std::string& path) const;

    /**
     * @brief Lazy, chunk-indexed access to a dataset.
     *
     * No data is read until a chunk is requested.
     *
     * @throws MissingKeyError if no dataset exists at path
     */
    [[nodiscard]] ChunkSequence readDataset(const std::string& path) const;

private:
    explicit MPFile(std::shared_ptr<detail::FileState> state);

    std::shared_ptr<detail::FileState> state_;
};

/// Open an mp file (see MPFile::open)
inline MPFile open(const std::string& path, const ReaderOptions& options = {}) {
    return MPFile::open(path, options);
}

/// Top-level entries of an opened file
inline std::vector<std::string> listGroups(const MPFile& file) {
    return file.listGroups();
}

/// Read one raw attribute of an opened file
inline RawAttribute readAttribute(const MPFile& file, const std::string& path) {
    return file.readAttribute(path);
}

/// Lazy chunk sequence over a dataset of an opened file
inline ChunkSequence readDataset(const MPFile& file, const std::string& path) {
    return file.readDataset(path);
}

/// Close an opened file (idempotent)
inline void close(MPFile& file) noexcept {
    file.close();
}

/**
 * @brief Attribute key of a small dataset.
 *
 * '@' and '\\' inside link names are escaped with a backslash, so a
 * dataset named "x@y" keys as "x\\@y" and cannot be taken for attribute
 * "y" of "x".
 */
std::string datasetKey(const std::string& dataset_path);

/// Attribute key of HDF5 attribute name on the object at object_path
std::string attributeKey(const std::string& object_path, const std::string& name);

/**
 * @brief Number of HDF5 identifiers currently open in this process.
 *
 * Intended for leak checks in tests and diagnostics.
 */
std::size_t openObjectCount();

} // namespace io
} // namespace mpkit
