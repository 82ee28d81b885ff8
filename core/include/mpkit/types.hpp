#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <chrono>

namespace mpkit {

/// Dimensions of a dataset or attribute (empty for scalars)
using Shape = std::vector<std::uint64_t>;

/// Index type for chunks and batch items
using Index = std::size_t;

/// Point in time with microsecond resolution (UTC)
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

/// Storage class of a raw value as found in the container
enum class ValueClass : std::uint8_t {
    UNKNOWN = 0,
    SIGNED,     // Signed integers (and enums over signed integers)
    UNSIGNED,   // Unsigned integers
    FLOAT,      // IEEE floating point
    STRING,     // Fixed or variable length strings
    BYTES,      // Opaque blobs
    STRUCTURED  // Compound, array or bitfield data kept as raw bytes
};

/// Kind of a canonical metadata field
enum class FieldKind : std::uint8_t {
    STRING = 0,
    REAL,
    INTEGER,
    TIMESTAMP,
    ENUM        // String restricted to a declared choice list
};

/// How the value of a canonical field was obtained
enum class FieldOrigin : std::uint8_t {
    MEASURED = 0,   // Read from the file
    DEFAULTED,      // Absent from the file, documented default applied
    DERIVED         // Computed from other fields
};

/// Instruments with a known camera pixel size
enum class InstrumentModel : std::uint8_t {
    UNKNOWN = 0,
    ONE_MP,
    TWO_MP
};

/// Error categories reported by the library
enum class ErrorKind : std::uint8_t {
    NONE = 0,
    NOT_FOUND,
    FORMAT,
    CORRUPT_DATA,
    MISSING_KEY,
    SCHEMA,
    CONFIGURATION,
    TIMEOUT,
    INTERNAL
};

/// Number of elements described by a shape
inline std::uint64_t elementCount(const Shape& shape) {
    std::uint64_t n = 1;
    for (auto d : shape) n *= d;
    return n;
}

/// Convert value class to string
inline std::string toString(ValueClass c) {
    switch (c) {
        case ValueClass::SIGNED: return "signed";
        case ValueClass::UNSIGNED: return "unsigned";
        case ValueClass::FLOAT: return "float";
        case ValueClass::STRING: return "string";
        case ValueClass::BYTES: return "bytes";
        case ValueClass::STRUCTURED: return "structured";
        default: return "unknown";
    }
}

/// Convert field kind to string
inline std::string toString(FieldKind k) {
    switch (k) {
        case FieldKind::STRING: return "string";
        case FieldKind::REAL: return "real";
        case FieldKind::INTEGER: return "integer";
        case FieldKind::TIMESTAMP: return "timestamp";
        case FieldKind::ENUM: return "enum";
    }
    return "unknown";
}

/// Convert field origin to string
inline std::string toString(FieldOrigin o) {
    switch (o) {
        case FieldOrigin::MEASURED: return "measured";
        case FieldOrigin::DEFAULTED: return "defaulted";
        case FieldOrigin::DERIVED: return "derived";
    }
    return "unknown";
}

/// Convert instrument model to string
inline std::string toString(InstrumentModel m) {
    switch (m) {
        case InstrumentModel::ONE_MP: return "OneMP";
        case InstrumentModel::TWO_MP: return "TwoMP";
        default: return "unknown";
    }
}

/// Convert error kind to string
inline std::string toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::FORMAT: return "format";
        case ErrorKind::CORRUPT_DATA: return "corrupt_data";
        case ErrorKind::MISSING_KEY: return "missing_key";
        case ErrorKind::SCHEMA: return "schema";
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::TIMEOUT: return "timeout";
        default: return "internal";
    }
}

} // namespace mpkit
