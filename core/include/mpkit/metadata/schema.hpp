#pragma once

#include "../metadata_record.hpp"
#include "../types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pugi {
class xml_node;
}

namespace mpkit {
namespace metadata {

/// Known layouts of mp files
enum class SchemaVersion : std::uint8_t {
    V2 = 0,             // Configuration at the root
    V3_DEVICES,         // Version 3 with movie/configuration/Devices
    V3_ACQ_CAMERA,      // Version 3 with movie/configuration/acq_camera
    CUSTOM              // Loaded from an XML schema file
};

/// Convert schema version to its registry name
inline std::string toString(SchemaVersion v) {
    switch (v) {
        case SchemaVersion::V2: return "v2";
        case SchemaVersion::V3_DEVICES: return "v3-devices";
        case SchemaVersion::V3_ACQ_CAMERA: return "v3-acq_camera";
        default: return "custom";
    }
}

/**
 * @brief Declaration of one canonical field.
 *
 * The value is read from the raw attribute at path or, for fields with
 * shape_of set, from dimension shape_dim of that dataset's shape.
 */
struct FieldSpec {
    std::string name;
    FieldKind kind = FieldKind::STRING;
    std::string path;
    std::string shape_of;
    std::size_t shape_dim = 0;
    FieldData default_value;
    std::string unit;                   // Unit of measured values
    std::string default_unit;           // Unit of the default (empty = unit)
    std::vector<std::string> choices;   // ENUM only

    [[nodiscard]] bool fromShape() const { return !shape_of.empty(); }

    /// Attribute path or dataset the value comes from
    [[nodiscard]] const std::string& source() const {
        return fromShape() ? shape_of : path;
    }

    [[nodiscard]] const std::string& unitFor(FieldOrigin origin) const {
        return origin == FieldOrigin::DEFAULTED && !default_unit.empty() ? default_unit : unit;
    }
};

/**
 * @brief One version of the field table.
 *
 * A definition applies to a file when the file's format version equals
 * format_version (any version if unset) and the discriminant path, if
 * given, exists in the file.
 */
struct SchemaDefinition {
    std::string name;
    SchemaVersion tag = SchemaVersion::CUSTOM;
    std::optional<std::int64_t> format_version;
    std::string discriminant;
    std::vector<FieldSpec> fields;

    /// Field by canonical name, or nullptr
    [[nodiscard]] const FieldSpec* find(const std::string& field_name) const;
};

/// Tells whether an attribute path or dataset exists in the file
using PathPredicate = std::function<bool(const std::string&)>;

/**
 * @brief Ordered set of schema definitions.
 *
 * A default-constructed registry holds the built-in versions, tried in
 * the order v3-devices, v3-acq_camera, v2. Versions added later are
 * tried before the built-ins; adding a version under an existing name
 * replaces it in place. v2 is used when no version applies.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<SchemaRegistry>();
 * registry->loadXml("site_schema.xml");
 * @endcode
 */
class SchemaRegistry {
public:
    /// Raw attribute holding the format version
    static constexpr const char* VERSION_KEY = "format_version_number";

    SchemaRegistry();

    /// Shared registry with the built-in versions only
    static std::shared_ptr<const SchemaRegistry> builtin();

    /**
     * @brief Add or replace a version.
     *
     * @throws SchemaDefinitionError if the definition is inconsistent
     */
    void add(SchemaDefinition definition);

    /**
     * @brief Load versions from an XML schema file.
     *
     * @param filename Path to the XML file
     * @throws SchemaDefinitionError if the file cannot be parsed or a
     *         declaration is invalid; the registry is unchanged then
     */
    void loadXml(const std::string& filename);

    /**
     * @brief Load versions from XML content.
     *
     * @throws SchemaDefinitionError as loadXml()
     */
    void loadXmlString(const std::string& content);

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @brief Version by name.
     *
     * @throws MissingKeyError if no version has that name
     */
    [[nodiscard]] const SchemaDefinition& get(const std::string& name) const;

    /// Version names in selection order
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return versions_.size(); }

    /// Name of the version used when none applies
    [[nodiscard]] const std::string& fallback() const noexcept { return fallback_; }

    /// @throws MissingKeyError if no version has that name
    void setFallback(const std::string& name);

    /**
     * @brief Select the version for a file.
     *
     * @param format_version Format version stored in the file, if any
     * @param exists Predicate for discriminant paths
     * @return First applicable version, or the fallback
     */
    [[nodiscard]] const SchemaDefinition& select(std::optional<std::int64_t> format_version,
                                                 const PathPredicate& exists) const;

private:
    void apply(const pugi::xml_node& root, const std::string& origin);

    std::vector<SchemaDefinition> versions_;
    std::string fallback_;
};

/// Built-in definition of a known layout
SchemaDefinition builtinSchema(SchemaVersion version);

} // namespace metadata
} // namespace mpkit
