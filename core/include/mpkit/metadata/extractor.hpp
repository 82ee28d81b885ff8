#pragma once

#include "../metadata_record.hpp"
#include "../io/mp_file.hpp"
#include "schema.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace mpkit {
namespace metadata {

/**
 * @brief Options for metadata extraction.
 */
struct ExtractorOptions {
    /// Options used when the extractor opens files itself
    io::ReaderOptions reader;

    /// Schema versions to choose from (null = built-in versions)
    std::shared_ptr<const SchemaRegistry> schemas;

    /// Also keep raw attributes consumed by canonical fields in extras
    bool include_native = false;

    /// Compute pixelsize, effective rates and field of view
    bool derive_fields = true;
};

/// Camera pixel size of a known instrument
struct PixelSize {
    double value = 1.0;
    std::string unit = "px";
};

/**
 * @brief Look up the camera pixel size of an instrument.
 *
 * @param instrument Instrument name as stored in the file
 * @return Pixel size in micrometres, or std::nullopt for unknown instruments
 */
std::optional<PixelSize> lookupPixelSize(const std::string& instrument);

/// Instrument model for an instrument name
InstrumentModel instrumentModel(const std::string& instrument);

/**
 * @brief Builds a MetadataRecord from an mp file.
 *
 * Extraction walks every raw attribute, selects a schema version, maps
 * the declared fields (coercing measured values, applying defaults for
 * absent ones) and keeps the remaining attributes as extras. A value that
 * is present but incompatible with its field fails the whole extraction.
 *
 * Extraction only reads; extracting the same open file twice yields equal
 * records.
 *
 * Usage:
 * @code
 * MetadataExtractor extractor;
 * auto file = io::MPFile::open("event.mp");
 * MetadataRecord record = extractor.extract(file);
 * double rate = record.real("framerate_effective");
 * @endcode
 */
class MetadataExtractor {
public:
    MetadataExtractor();
    explicit MetadataExtractor(ExtractorOptions options);
    ~MetadataExtractor();

    // Non-copyable
    MetadataExtractor(const MetadataExtractor&) = delete;
    MetadataExtractor& operator=(const MetadataExtractor&) = delete;

    // Movable
    MetadataExtractor(MetadataExtractor&&) noexcept;
    MetadataExtractor& operator=(MetadataExtractor&&) noexcept;

    /**
     * @brief Extract the metadata of an open file.
     *
     * @param file Open mp file
     * @return Normalized metadata
     * @throws SchemaError if a present value does not fit its field
     * @throws CorruptDataError if an attribute cannot be read
     */
    MetadataRecord extract(const io::MPFile& file);

    /**
     * @brief Extract with explicit options.
     *
     * @param file Open mp file
     * @param options Extraction options
     * @return Normalized metadata
     */
    MetadataRecord extract(const io::MPFile& file, const ExtractorOptions& options);

    /**
     * @brief Open a file, extract its metadata and close it.
     *
     * @param filename Path to the mp file
     * @return Normalized metadata
     * @throws NotFoundError, FormatError, CorruptDataError as MPFile::open
     */
    MetadataRecord extract(const std::string& filename);

    /**
     * @brief Schema version that extract() would use for a file.
     */
    const SchemaDefinition& selectSchema(const io::MPFile& file);

    /**
     * @brief Set default options for subsequent extractions.
     *
     * @param options Default options
     */
    void setDefaultOptions(ExtractorOptions options) {
        default_options_ = std::move(options);
    }

    [[nodiscard]] const ExtractorOptions& defaultOptions() const noexcept {
        return default_options_;
    }

    /**
     * @brief Get the last error message (if any).
     */
    [[nodiscard]] const std::string& lastError() const noexcept {
        return last_error_;
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    ExtractorOptions default_options_;
    std::string last_error_;
};

/**
 * @brief Convenience function to extract the metadata of a file.
 *
 * @param filename Path to the mp file
 * @return Normalized metadata
 */
inline MetadataRecord extractMetadata(const std::string& filename) {
    MetadataExtractor extractor;
    return extractor.extract(filename);
}

/**
 * @brief Convenience function to extract metadata with options.
 *
 * @param filename Path to the mp file
 * @param options Extraction options
 * @return Normalized metadata
 */
inline MetadataRecord extractMetadata(const std::string& filename,
                                      const ExtractorOptions& options) {
    MetadataExtractor extractor(options);
    return extractor.extract(filename);
}

} // namespace metadata
} // namespace mpkit
