#include "mpkit/metadata/extractor.hpp"
#include "mpkit/errors.hpp"
#include "mpkit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>

namespace mpkit {
namespace metadata {

namespace {

constexpr double ONE_MP_PIXEL_SIZE = 0.0193;    // um
constexpr double TWO_MP_PIXEL_SIZE = 0.0118;    // um

// Epoch seconds whose microsecond count fits in 64 bits
constexpr double MAX_EPOCH_SECONDS = 9.2e12;

std::string shapeText(const Shape& shape) {
    if (shape.empty()) return "scalar";
    std::string text = "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) text += ", ";
        text += std::to_string(shape[i]);
    }
    return text + ")";
}

std::string describe(const RawAttribute& attr) {
    return toString(attr.value_class) + " value at " + attr.path;
}

double toReal(const FieldSpec& spec, const RawAttribute& attr) {
    switch (attr.value_class) {
        case ValueClass::SIGNED: return static_cast<double>(attr.signedValues().front());
        case ValueClass::UNSIGNED: return static_cast<double>(attr.unsignedValues().front());
        case ValueClass::FLOAT: return attr.floatValues().front();
        default:
            throw SchemaError(spec.name, "expected a number, found " + describe(attr));
    }
}

std::int64_t toInteger(const FieldSpec& spec, const RawAttribute& attr) {
    switch (attr.value_class) {
        case ValueClass::SIGNED:
            return attr.signedValues().front();
        case ValueClass::UNSIGNED: {
            std::uint64_t v = attr.unsignedValues().front();
            if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw SchemaError(spec.name, "value " + std::to_string(v) + " at " + attr.path +
                                             " is out of range");
            }
            return static_cast<std::int64_t>(v);
        }
        case ValueClass::FLOAT: {
            double v = attr.floatValues().front();
            // 2^63 is the first double above the int64 range
            if (!std::isfinite(v) || std::trunc(v) != v || v < -9223372036854775808.0 ||
                v >= 9223372036854775808.0) {
                throw SchemaError(spec.name, "expected an integer, found non-integral " +
                                             describe(attr));
            }
            return static_cast<std::int64_t>(v);
        }
        default:
            throw SchemaError(spec.name, "expected an integer, found " + describe(attr));
    }
}

std::string toText(const FieldSpec& spec, const RawAttribute& attr) {
    switch (attr.value_class) {
        case ValueClass::STRING:
            return attr.stringValues().front();
        case ValueClass::BYTES: {
            const auto& bytes = attr.bytes();
            std::string text(bytes.begin(), bytes.end());
            auto nul = text.find('\0');
            if (nul != std::string::npos) text.resize(nul);
            return text;
        }
        default:
            throw SchemaError(spec.name, "expected a string, found " + describe(attr));
    }
}

Timestamp toTimestamp(const FieldSpec& spec, const RawAttribute& attr) {
    switch (attr.value_class) {
        case ValueClass::STRING:
        case ValueClass::BYTES: {
            std::string text = toText(spec, attr);
            auto ts = parseTimestamp(text);
            if (!ts) {
                throw SchemaError(spec.name, "'" + text + "' at " + attr.path +
                                             " is not an ISO-8601 timestamp");
            }
            return *ts;
        }
        case ValueClass::SIGNED:
        case ValueClass::UNSIGNED:
        case ValueClass::FLOAT:
            break;
        default:
            throw SchemaError(spec.name, "expected a timestamp, found " + describe(attr));
    }
    double seconds = toReal(spec, attr);
    if (!std::isfinite(seconds) || std::fabs(seconds) > MAX_EPOCH_SECONDS) {
        throw SchemaError(spec.name, "epoch seconds at " + attr.path + " are out of range");
    }
    return Timestamp(std::chrono::microseconds(std::llround(seconds * 1e6)));
}

/// Convert a measured value to the kind of its field
FieldData coerce(const FieldSpec& spec, const RawAttribute& attr) {
    if (!attr.isSingle()) {
        throw SchemaError(spec.name, "expected a single value at " + attr.path + ", found shape " +
                                     shapeText(attr.shape));
    }

    switch (spec.kind) {
        case FieldKind::REAL:
            return toReal(spec, attr);
        case FieldKind::INTEGER:
            return toInteger(spec, attr);
        case FieldKind::STRING:
            return toText(spec, attr);
        case FieldKind::TIMESTAMP:
            return toTimestamp(spec, attr);
        case FieldKind::ENUM: {
            std::string text = toText(spec, attr);
            if (std::find(spec.choices.begin(), spec.choices.end(), text) == spec.choices.end()) {
                std::string allowed;
                for (const auto& c : spec.choices) {
                    allowed += allowed.empty() ? c : ", " + c;
                }
                throw SchemaError(spec.name, "'" + text + "' at " + attr.path +
                                             " is not one of " + allowed);
            }
            return text;
        }
    }
    throw SchemaError(spec.name, "unsupported field kind");
}

FieldValue makeValue(FieldKind kind, FieldData data, std::string unit, FieldOrigin origin,
                     std::string source = "") {
    FieldValue value;
    value.kind = kind;
    value.data = std::move(data);
    value.unit = std::move(unit);
    value.origin = origin;
    value.source = std::move(source);
    return value;
}

/// DEFAULTED when every input was defaulted, DERIVED otherwise
FieldOrigin derivedOrigin(std::initializer_list<const FieldValue*> inputs) {
    bool all_defaulted = std::all_of(inputs.begin(), inputs.end(),
                                     [](const FieldValue* v) { return v->isDefaulted(); });
    return all_defaulted ? FieldOrigin::DEFAULTED : FieldOrigin::DERIVED;
}

const FieldValue* numericField(const MetadataRecord::FieldMap& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end()) return nullptr;
    const FieldValue& v = it->second;
    return v.kind == FieldKind::REAL || v.kind == FieldKind::INTEGER ? &v : nullptr;
}

void requireBinning(const FieldValue* binning, const std::string& name) {
    if (binning && binning->asReal() < 1.0) {
        throw SchemaError(name, "binning must be at least 1, found " + binning->toText());
    }
}

/// Instrument-dependent and effective values; fields already declared by the schema are kept
void deriveFields(MetadataRecord::FieldMap& fields) {
    auto add = [&fields](const std::string& name, FieldValue value) {
        fields.emplace(name, std::move(value));
    };

    auto instrument_it = fields.find("instrument");
    const FieldValue* instrument =
        instrument_it != fields.end() && instrument_it->second.kind == FieldKind::STRING
            ? &instrument_it->second
            : nullptr;

    if (!fields.count("pixelsize")) {
        std::optional<PixelSize> known;
        if (instrument) known = lookupPixelSize(instrument->asString());
        if (known) {
            add("pixelsize", makeValue(FieldKind::REAL, known->value, known->unit,
                                       FieldOrigin::DERIVED, instrument->source));
        } else {
            add("pixelsize", makeValue(FieldKind::REAL, 1.0, "px", FieldOrigin::DEFAULTED));
        }
    }

    if (instrument && !fields.count("instrument_model")) {
        add("instrument_model",
            makeValue(FieldKind::ENUM, toString(instrumentModel(instrument->asString())), "",
                      derivedOrigin({instrument}), instrument->source));
    }

    const FieldValue* framerate = numericField(fields, "framerate");
    const FieldValue* framebinning = numericField(fields, "framebinning");
    const FieldValue* pixelbinning = numericField(fields, "pixelbinning");
    const FieldValue* exposuretime = numericField(fields, "exposuretime");
    const FieldValue* pixelsize = numericField(fields, "pixelsize");
    const FieldValue* height = numericField(fields, "image_height");
    const FieldValue* width = numericField(fields, "image_width");

    requireBinning(framebinning, "framebinning");
    requireBinning(pixelbinning, "pixelbinning");

    if (framerate && framebinning) {
        add("framerate_effective",
            makeValue(FieldKind::REAL, framerate->asReal() / framebinning->asReal(),
                      framerate->unit, derivedOrigin({framerate, framebinning})));
    }
    if (pixelsize && pixelbinning) {
        add("pixelsize_effective",
            makeValue(FieldKind::REAL, pixelsize->asReal() * pixelbinning->asReal(),
                      pixelsize->unit, derivedOrigin({pixelsize, pixelbinning})));
    }
    if (exposuretime && framebinning) {
        add("exposuretime_effective",
            makeValue(FieldKind::REAL, exposuretime->asReal() * framebinning->asReal(),
                      exposuretime->unit, derivedOrigin({exposuretime, framebinning})));
    }
    if (pixelsize && height) {
        add("field_of_view_height",
            makeValue(FieldKind::REAL, height->asReal() * pixelsize->asReal(),
                      pixelsize->unit, derivedOrigin({height, pixelsize})));
    }
    if (pixelsize && width) {
        add("field_of_view_width",
            makeValue(FieldKind::REAL, width->asReal() * pixelsize->asReal(),
                      pixelsize->unit, derivedOrigin({width, pixelsize})));
    }
}

/// Lookup tables over one container walk
struct WalkIndex {
    std::map<std::string, const RawAttribute*> attributes;
    std::map<std::string, const DatasetInfo*> datasets;

    explicit WalkIndex(const ContainerWalk& walk) {
        for (const auto& attr : walk.attributes) attributes.emplace(attr.path, &attr);
        for (const auto& info : walk.datasets) datasets.emplace(info.path, &info);
    }

    [[nodiscard]] bool exists(const std::string& path) const {
        return attributes.count(path) > 0 || datasets.count(path) > 0;
    }

    [[nodiscard]] const RawAttribute* attribute(const std::string& path) const {
        auto it = attributes.find(path);
        return it == attributes.end() ? nullptr : it->second;
    }

    /// Shape of a dataset, large or small
    [[nodiscard]] std::optional<Shape> shapeOf(const std::string& path) const {
        if (auto it = datasets.find(path); it != datasets.end()) return it->second->shape;
        auto it = attributes.find(io::datasetKey(path));
        if (it != attributes.end() && it->second->source == RawAttribute::Source::DATASET) {
            return it->second->shape;
        }
        return std::nullopt;
    }

    /// Integral format version, stored as a dataset or a root attribute
    [[nodiscard]] std::optional<std::int64_t> formatVersion() const {
        for (const std::string key : {std::string(SchemaRegistry::VERSION_KEY),
                                      "@" + std::string(SchemaRegistry::VERSION_KEY)}) {
            const RawAttribute* attr = attribute(key);
            if (!attr || !attr->isSingle()) continue;
            switch (attr->value_class) {
                case ValueClass::SIGNED:
                    return attr->signedValues().front();
                case ValueClass::UNSIGNED:
                    return static_cast<std::int64_t>(attr->unsignedValues().front());
                case ValueClass::FLOAT: {
                    double v = attr->floatValues().front();
                    if (std::isfinite(v) && std::trunc(v) == v) return static_cast<std::int64_t>(v);
                    break;
                }
                default:
                    break;
            }
        }
        return std::nullopt;
    }
};

} // namespace

std::optional<PixelSize> lookupPixelSize(const std::string& instrument) {
    switch (instrumentModel(instrument)) {
        case InstrumentModel::ONE_MP: return PixelSize{ONE_MP_PIXEL_SIZE, "um"};
        case InstrumentModel::TWO_MP: return PixelSize{TWO_MP_PIXEL_SIZE, "um"};
        default: return std::nullopt;
    }
}

InstrumentModel instrumentModel(const std::string& instrument) {
    if (instrument == "Refeyn OneMP") return InstrumentModel::ONE_MP;
    if (instrument == "Refeyn TwoMP") return InstrumentModel::TWO_MP;
    return InstrumentModel::UNKNOWN;
}

// ============================================================================
// MetadataExtractor Implementation
// ============================================================================

class MetadataExtractor::Impl {
public:
    Impl() = default;

    MetadataRecord extract(const io::MPFile& file, const ExtractorOptions& options) {
        ContainerWalk walk = file.walk();
        WalkIndex index(walk);

        const SchemaDefinition& schema = select(index, options);
        MPKIT_LOG_DEBUG("selected schema version",
                        {stringField("path", file.path()), stringField("schema", schema.name)});

        MetadataRecord::FieldMap fields;
        std::set<std::string> consumed;

        for (const auto& spec : schema.fields) {
            fields.emplace(spec.name, readField(spec, index, consumed, file.path()));
        }

        if (options.derive_fields) {
            deriveFields(fields);
        }

        MetadataRecord::ExtraMap extras;
        for (const auto& attr : walk.attributes) {
            if (options.include_native || !consumed.count(attr.path)) {
                if (!extras.emplace(attr.path, attr).second) {
                    throw FormatError("two values stored under key " + attr.path + " in " +
                                      file.path());
                }
            }
        }

        return MetadataRecord(file.path(), schema.name, std::move(fields), std::move(extras),
                              std::move(walk.datasets));
    }

    const SchemaDefinition& selectSchema(const io::MPFile& file, const ExtractorOptions& options) {
        ContainerWalk walk = file.walk();
        WalkIndex index(walk);
        return select(index, options);
    }

private:
    static const SchemaDefinition& select(const WalkIndex& index, const ExtractorOptions& options) {
        const SchemaRegistry& registry =
            options.schemas ? *options.schemas : *SchemaRegistry::builtin();
        return registry.select(index.formatVersion(),
                               [&index](const std::string& path) { return index.exists(path); });
    }

    static FieldValue readField(const FieldSpec& spec, const WalkIndex& index,
                                std::set<std::string>& consumed, const std::string& file_path) {
        if (spec.fromShape()) {
            if (auto shape = index.shapeOf(spec.shape_of)) {
                if (spec.shape_dim >= shape->size()) {
                    throw SchemaError(spec.name, "dataset " + spec.shape_of + " has shape " +
                                                 shapeText(*shape) + ", no dimension " +
                                                 std::to_string(spec.shape_dim));
                }
                // The dataset itself stays available as an extra or bulk dataset
                return makeValue(spec.kind, static_cast<std::int64_t>((*shape)[spec.shape_dim]),
                                 spec.unitFor(FieldOrigin::MEASURED), FieldOrigin::MEASURED,
                                 spec.shape_of);
            }
        } else if (const RawAttribute* attr = index.attribute(spec.path)) {
            FieldValue value = makeValue(spec.kind, coerce(spec, *attr),
                                         spec.unitFor(FieldOrigin::MEASURED),
                                         FieldOrigin::MEASURED, attr->path);
            consumed.insert(attr->path);
            return value;
        }

        MPKIT_LOG_DEBUG("field defaulted", {stringField("path", file_path),
                                            stringField("field", spec.name),
                                            stringField("source", spec.source())});
        return makeValue(spec.kind, spec.default_value, spec.unitFor(FieldOrigin::DEFAULTED),
                         FieldOrigin::DEFAULTED);
    }
};

MetadataExtractor::MetadataExtractor() : impl_(std::make_unique<Impl>()) {}

MetadataExtractor::MetadataExtractor(ExtractorOptions options)
    : impl_(std::make_unique<Impl>()), default_options_(std::move(options)) {}

MetadataExtractor::~MetadataExtractor() = default;
MetadataExtractor::MetadataExtractor(MetadataExtractor&&) noexcept = default;
MetadataExtractor& MetadataExtractor::operator=(MetadataExtractor&&) noexcept = default;

MetadataRecord MetadataExtractor::extract(const io::MPFile& file) {
    return extract(file, default_options_);
}

MetadataRecord MetadataExtractor::extract(const io::MPFile& file,
                                          const ExtractorOptions& options) {
    try {
        return impl_->extract(file, options);
    } catch (const MPError& e) {
        last_error_ = e.what();
        throw;
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::runtime_error& e) {
        last_error_ = e.what();
        throw CorruptDataError(e.what());
    }
}

MetadataRecord MetadataExtractor::extract(const std::string& filename) {
    auto file = io::MPFile::open(filename, default_options_.reader);
    return extract(file, default_options_);
}

const SchemaDefinition& MetadataExtractor::selectSchema(const io::MPFile& file) {
    return impl_->selectSchema(file, default_options_);
}

} // namespace metadata
} // namespace mpkit
