#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace mpkit {

/// Storage of a raw value: one vector per value class, scalars hold one element
using RawValue = std::variant<std::vector<std::int64_t>,
                              std::vector<std::uint64_t>,
                              std::vector<double>,
                              std::vector<std::string>,
                              std::vector<std::uint8_t>>;

/**
 * @brief A key/value pair exactly as stored in the container.
 *
 * Keys are attribute paths: a small dataset is keyed by its dataset path
 * ("movie/configuration/acq_camera/frame_rate"), an HDF5 attribute by
 * "<object path>@<name>" ("movie@version", "@format" on the root group).
 * A '@' or '\\' inside a link or attribute name is escaped with a
 * backslash, so every stored value has a distinct key (see io::datasetKey).
 *
 * Integers are widened to 64 bits and floats to double; the stored
 * element size is kept in element_size. No other conversion is applied.
 */
struct RawAttribute {
    /// Where the value lives in the container
    enum class Source : std::uint8_t {
        DATASET = 0,
        ATTRIBUTE
    };

    std::string path;
    Source source = Source::DATASET;
    ValueClass value_class = ValueClass::UNKNOWN;
    std::size_t element_size = 0;
    Shape shape;
    RawValue value;

    /// Number of stored elements
    [[nodiscard]] std::size_t size() const {
        return static_cast<std::size_t>(elementCount(shape));
    }

    /// True for scalars and single-element arrays
    [[nodiscard]] bool isSingle() const { return size() == 1; }

    [[nodiscard]] const std::vector<std::int64_t>& signedValues() const {
        return std::get<std::vector<std::int64_t>>(value);
    }
    [[nodiscard]] const std::vector<std::uint64_t>& unsignedValues() const {
        return std::get<std::vector<std::uint64_t>>(value);
    }
    [[nodiscard]] const std::vector<double>& floatValues() const {
        return std::get<std::vector<double>>(value);
    }
    [[nodiscard]] const std::vector<std::string>& stringValues() const {
        return std::get<std::vector<std::string>>(value);
    }
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const {
        return std::get<std::vector<std::uint8_t>>(value);
    }

    bool operator==(const RawAttribute& other) const {
        return path == other.path && source == other.source &&
               value_class == other.value_class &&
               element_size == other.element_size &&
               shape == other.shape && value == other.value;
    }
    bool operator!=(const RawAttribute& other) const { return !(*this == other); }
};

/// Storage layout of a dataset
enum class DatasetLayout : std::uint8_t {
    COMPACT = 0,
    CONTIGUOUS,
    CHUNKED,
    OTHER
};

/// A filter in a dataset's compression pipeline
struct FilterInfo {
    int id = 0;
    std::string name;

    bool operator==(const FilterInfo& other) const {
        return id == other.id && name == other.name;
    }
};

/**
 * @brief Structural description of a dataset.
 */
struct DatasetInfo {
    std::string path;
    Shape shape;
    ValueClass value_class = ValueClass::UNKNOWN;
    std::size_t element_size = 0;
    DatasetLayout layout = DatasetLayout::CONTIGUOUS;
    Shape chunk_shape;                  // Empty unless layout is CHUNKED
    std::vector<FilterInfo> filters;    // Pipeline in write order

    [[nodiscard]] std::uint64_t elementCount() const {
        return mpkit::elementCount(shape);
    }

    bool operator==(const DatasetInfo& other) const {
        return path == other.path && shape == other.shape &&
               value_class == other.value_class &&
               element_size == other.element_size && layout == other.layout &&
               chunk_shape == other.chunk_shape && filters == other.filters;
    }
};

/// Kind of an entry of a group
enum class EntryKind : std::uint8_t {
    GROUP = 0,
    DATASET,
    OTHER
};

/// One link inside a group
struct EntryInfo {
    std::string name;
    std::string path;
    EntryKind kind = EntryKind::OTHER;
};

/**
 * @brief Result of walking a whole container.
 *
 * attributes holds every raw attribute in storage order; datasets holds
 * the bulk datasets too large to be treated as attributes.
 */
struct ContainerWalk {
    std::vector<RawAttribute> attributes;
    std::vector<DatasetInfo> datasets;
};

/// Convert layout to string
inline std::string toString(DatasetLayout l) {
    switch (l) {
        case DatasetLayout::COMPACT: return "compact";
        case DatasetLayout::CONTIGUOUS: return "contiguous";
        case DatasetLayout::CHUNKED: return "chunked";
        default: return "other";
    }
}

} // namespace mpkit
