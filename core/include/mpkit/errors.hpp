#pragma once

#include "types.hpp"
#include <string>
#include <stdexcept>

namespace mpkit {

/**
 * @brief Base class of every error thrown by mpkit.
 *
 * Carries an ErrorKind so batch processing can report failures
 * without inspecting the concrete exception type.
 */
class MPError : public std::runtime_error {
public:
    MPError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown when a file does not exist or cannot be read.
 */
class NotFoundError : public MPError {
public:
    explicit NotFoundError(const std::string& path,
                           const std::string& reason = "cannot read file")
        : MPError(ErrorKind::NOT_FOUND, reason + ": " + path), path_(path) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Thrown when a file is not an mp container.
 */
class FormatError : public MPError {
public:
    explicit FormatError(const std::string& msg)
        : MPError(ErrorKind::FORMAT, "mp format error: " + msg) {}
};

/**
 * @brief Thrown when stored data cannot be decoded or fails verification.
 */
class CorruptDataError : public MPError {
public:
    explicit CorruptDataError(const std::string& msg)
        : MPError(ErrorKind::CORRUPT_DATA, "corrupt mp data: " + msg) {}
};

/**
 * @brief Thrown when a requested attribute or dataset does not exist.
 */
class MissingKeyError : public MPError {
public:
    explicit MissingKeyError(const std::string& key)
        : MPError(ErrorKind::MISSING_KEY, "missing key: " + key), key_(key) {}

    MissingKeyError(const std::string& key, const std::string& reason)
        : MPError(ErrorKind::MISSING_KEY, "missing key: " + key + " (" + reason + ")"),
          key_(key) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * @brief Thrown when a canonical field is stored with an incompatible type.
 */
class SchemaError : public MPError {
public:
    SchemaError(const std::string& field, const std::string& msg)
        : MPError(ErrorKind::SCHEMA, "schema error in field '" + field + "': " + msg),
          field_(field) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/**
 * @brief Thrown when a schema definition (built-in or XML) is malformed.
 */
class SchemaDefinitionError : public MPError {
public:
    explicit SchemaDefinitionError(const std::string& msg)
        : MPError(ErrorKind::CONFIGURATION, "schema definition error: " + msg) {}
};

} // namespace mpkit
