#pragma once

#include "hdf5_handle.hpp"
#include "mpkit/io/mp_file.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace mpkit {
namespace io {
namespace detail {

/**
 * @brief State shared between an MPFile and the chunk sequences it created.
 *
 * Chunk sequences hold no HDF5 identifiers of their own, so closing the
 * file releases everything.
 */
struct FileState {
    std::string path;
    FormatSignature signature;
    ReaderOptions options;
    Handle file;

    [[nodiscard]] bool isOpen() const noexcept { return static_cast<bool>(file); }

    /// File identifier, or std::logic_error once closed
    hid_t require() const {
        if (!file) {
            throw std::logic_error("mp file is closed: " + path);
        }
        return file.get();
    }
};

/// Open an object by path relative to the file root; invalid Handle if absent
Handle openObject(hid_t file, const std::string& path);

/// Open a dataset by path; invalid Handle if absent or not a dataset
Handle openDataset(hid_t file, const std::string& path);

/// Describe an open dataset
DatasetInfo describeDataset(hid_t dataset, const std::string& path);

/// Split "a/b/c" into components, ignoring empty ones
std::vector<std::string> splitPath(const std::string& path);

} // namespace detail
} // namespace io
} // namespace mpkit
