#pragma once

/**
 * @file mpkit.hpp
 * @brief Main header for the mpkit library.
 *
 * Include this header to get access to all mpkit functionality.
 *
 * @example
 * @code
 * #include <mpkit/mpkit.hpp>
 *
 * int main() {
 *     // Extract the metadata of an mp file
 *     auto record = mpkit::metadata::extractMetadata("event.mp");
 *
 *     // Access canonical fields
 *     std::cout << "Frame rate: " << record.real("framerate_effective")
 *               << " " << record.unit("framerate_effective") << "\n";
 *
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "logging.hpp"

// Data structures
#include "container.hpp"
#include "metadata_record.hpp"

// I/O
#include "io/mp_file.hpp"
#include "io/chunk_sequence.hpp"
#include "io/movie.hpp"
#include "io/metadata_xml.hpp"
#include "io/codec.hpp"

// Metadata
#include "metadata/schema.hpp"
#include "metadata/extractor.hpp"
#include "metadata/batch.hpp"

/**
 * @namespace mpkit
 * @brief Root namespace for the mpkit library.
 */

/**
 * @namespace mpkit::io
 * @brief Reading mp containers and writing metadata exports.
 */

/**
 * @namespace mpkit::metadata
 * @brief Schema-driven metadata extraction.
 */
