#pragma once

#include "types.hpp"
#include "container.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mpkit {

/// Typed value of a canonical field (ENUM values are stored as strings)
using FieldData = std::variant<std::string, double, std::int64_t, Timestamp>;

/**
 * @brief Value of one canonical field together with its provenance.
 */
struct FieldValue {
    FieldKind kind = FieldKind::STRING;
    FieldData data;
    std::string unit;
    FieldOrigin origin = FieldOrigin::MEASURED;
    std::string source;     // Attribute path the value was read from

    [[nodiscard]] bool isMeasured() const { return origin == FieldOrigin::MEASURED; }
    [[nodiscard]] bool isDefaulted() const { return origin == FieldOrigin::DEFAULTED; }
    [[nodiscard]] bool isDerived() const { return origin == FieldOrigin::DERIVED; }

    /// Numeric value of a REAL or INTEGER field
    [[nodiscard]] double asReal() const;

    [[nodiscard]] std::int64_t asInteger() const {
        return std::get<std::int64_t>(data);
    }

    /// Value of a STRING or ENUM field
    [[nodiscard]] const std::string& asString() const {
        return std::get<std::string>(data);
    }

    [[nodiscard]] Timestamp asTimestamp() const {
        return std::get<Timestamp>(data);
    }

    /// Human readable value
    [[nodiscard]] std::string toText() const;

    bool operator==(const FieldValue& other) const {
        return kind == other.kind && data == other.data && unit == other.unit &&
               origin == other.origin && source == other.source;
    }
    bool operator!=(const FieldValue& other) const { return !(*this == other); }
};

/**
 * @brief Normalized metadata of one mp file.
 *
 * Every field of the selected schema version is present; fields absent
 * from the file carry their documented default and FieldOrigin::DEFAULTED.
 * Raw attributes not consumed by a canonical field are kept verbatim in
 * extras(), keyed by their attribute path.
 *
 * A MetadataRecord is a plain value: it does not refer to the file it was
 * extracted from and cannot be modified after construction.
 */
class MetadataRecord {
public:
    using FieldMap = std::map<std::string, FieldValue>;
    using ExtraMap = std::map<std::string, RawAttribute>;

    MetadataRecord() = default;

    MetadataRecord(std::string source_file,
                   std::string schema_version,
                   FieldMap fields,
                   ExtraMap extras,
                   std::vector<DatasetInfo> datasets)
        : source_file_(std::move(source_file)),
          schema_version_(std::move(schema_version)),
          fields_(std::move(fields)),
          extras_(std::move(extras)),
          datasets_(std::move(datasets)) {}

    /// Path of the file the record was extracted from
    [[nodiscard]] const std::string& sourceFile() const noexcept { return source_file_; }

    /// Name of the schema version used for extraction
    [[nodiscard]] const std::string& schemaVersion() const noexcept {
        return schema_version_;
    }

    [[nodiscard]] const FieldMap& fields() const noexcept { return fields_; }
    [[nodiscard]] const ExtraMap& extras() const noexcept { return extras_; }

    /// Bulk datasets found in the file (frames, keyframes, ...)
    [[nodiscard]] const std::vector<DatasetInfo>& datasets() const noexcept {
        return datasets_;
    }

    [[nodiscard]] bool hasField(const std::string& name) const {
        return fields_.count(name) > 0;
    }

    /// Access a field by canonical name
    /// @throws MissingKeyError if the field does not exist
    [[nodiscard]] const FieldValue& field(const std::string& name) const;

    [[nodiscard]] double real(const std::string& name) const {
        return field(name).asReal();
    }
    [[nodiscard]] std::int64_t integer(const std::string& name) const {
        return field(name).asInteger();
    }
    [[nodiscard]] const std::string& text(const std::string& name) const {
        return field(name).asString();
    }
    [[nodiscard]] const std::string& unit(const std::string& name) const {
        return field(name).unit;
    }
    [[nodiscard]] bool isDefaulted(const std::string& name) const {
        return field(name).isDefaulted();
    }

    /// Names of all fields that carry a default value
    [[nodiscard]] std::vector<std::string> defaultedFields() const;

    [[nodiscard]] bool hasExtra(const std::string& path) const {
        return extras_.count(path) > 0;
    }

    bool operator==(const MetadataRecord& other) const {
        return source_file_ == other.source_file_ &&
               schema_version_ == other.schema_version_ &&
               fields_ == other.fields_ && extras_ == other.extras_ &&
               datasets_ == other.datasets_;
    }
    bool operator!=(const MetadataRecord& other) const { return !(*this == other); }

private:
    std::string source_file_;
    std::string schema_version_;
    FieldMap fields_;
    ExtraMap extras_;
    std::vector<DatasetInfo> datasets_;
};

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD HH:MM:SS",
 * optionally followed by a fraction and "Z" or a "+HH:MM"/"-HH:MM" offset.
 *
 * @return std::nullopt if the text is not a timestamp
 */
std::optional<Timestamp> parseTimestamp(std::string_view text);

/// Format a timestamp as "YYYY-MM-DDTHH:MM:SS.ffffffZ"
std::string formatTimestamp(Timestamp ts);

} // namespace mpkit
