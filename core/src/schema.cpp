#include "mpkit/metadata/schema.hpp"
#include "mpkit/errors.hpp"
#include "mpkit/logging.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <set>
#include <sstream>

namespace mpkit {
namespace metadata {

namespace {

FieldSpec field(std::string name, FieldKind kind, std::string path, FieldData default_value,
                std::string unit = "", std::string default_unit = "") {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.kind = kind;
    spec.path = std::move(path);
    spec.default_value = std::move(default_value);
    spec.unit = std::move(unit);
    spec.default_unit = std::move(default_unit);
    return spec;
}

FieldSpec shapeField(std::string name, std::string dataset, std::size_t dim) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.kind = FieldKind::INTEGER;
    spec.shape_of = std::move(dataset);
    spec.shape_dim = dim;
    spec.default_value = std::int64_t{0};
    spec.unit = "px";
    return spec;
}

/// Attribute paths of one built-in layout
struct LayoutPaths {
    std::string framerate;
    std::string framebinning;
    std::string pixelbinning;
    std::string exposuretime;
    std::string instrument;
    std::string camera;
    std::string height;
    std::string width;
};

std::vector<FieldSpec> layoutFields(const LayoutPaths& p, bool shape_from_keyframe) {
    std::vector<FieldSpec> fields;
    fields.push_back(field("format_version", FieldKind::INTEGER, SchemaRegistry::VERSION_KEY,
                           std::int64_t{2}));
    fields.push_back(field("framerate", FieldKind::REAL, p.framerate, 1.0, "Hz", "1/frame"));
    fields.push_back(field("framebinning", FieldKind::INTEGER, p.framebinning, std::int64_t{1}));
    fields.push_back(field("pixelbinning", FieldKind::INTEGER, p.pixelbinning, std::int64_t{1}));
    fields.push_back(field("exposuretime", FieldKind::REAL, p.exposuretime, 1.0, "ms", "frame"));
    fields.push_back(field("instrument", FieldKind::STRING, p.instrument, std::string("unknown")));
    fields.push_back(field("camera", FieldKind::STRING, p.camera, std::string("unknown")));
    if (shape_from_keyframe) {
        fields.push_back(shapeField("image_height", "movie/keyframe", 1));
        fields.push_back(shapeField("image_width", "movie/keyframe", 2));
    } else {
        fields.push_back(field("image_height", FieldKind::INTEGER, p.height, std::int64_t{0}, "px"));
        fields.push_back(field("image_width", FieldKind::INTEGER, p.width, std::int64_t{0}, "px"));
    }
    return fields;
}

bool sameKind(FieldKind kind, const FieldData& value) {
    switch (kind) {
        case FieldKind::STRING:
        case FieldKind::ENUM:
            return std::holds_alternative<std::string>(value);
        case FieldKind::REAL:
            return std::holds_alternative<double>(value);
        case FieldKind::INTEGER:
            return std::holds_alternative<std::int64_t>(value);
        case FieldKind::TIMESTAMP:
            return std::holds_alternative<Timestamp>(value);
    }
    return false;
}

void validate(const SchemaDefinition& def) {
    if (def.name.empty()) {
        throw SchemaDefinitionError("version without a name");
    }
    const std::string where = "version '" + def.name + "'";

    std::set<std::string> seen;
    for (const auto& f : def.fields) {
        if (f.name.empty()) {
            throw SchemaDefinitionError(where + ": field without a name");
        }
        if (!seen.insert(f.name).second) {
            throw SchemaDefinitionError(where + ": duplicate field '" + f.name + "'");
        }
        if (f.path.empty() == f.shape_of.empty()) {
            throw SchemaDefinitionError(where + ": field '" + f.name +
                                        "' needs exactly one of path and shapeOf");
        }
        if (f.fromShape() && f.kind != FieldKind::INTEGER) {
            throw SchemaDefinitionError(where + ": shape field '" + f.name + "' must be an integer");
        }
        if (!sameKind(f.kind, f.default_value)) {
            throw SchemaDefinitionError(where + ": default of field '" + f.name +
                                        "' is not of kind " + toString(f.kind));
        }
        if (f.kind == FieldKind::ENUM) {
            if (f.choices.empty()) {
                throw SchemaDefinitionError(where + ": enum field '" + f.name + "' has no choices");
            }
            const auto& d = std::get<std::string>(f.default_value);
            if (std::find(f.choices.begin(), f.choices.end(), d) == f.choices.end()) {
                throw SchemaDefinitionError(where + ": default '" + d + "' of field '" + f.name +
                                            "' is not one of its choices");
            }
        } else if (!f.choices.empty()) {
            throw SchemaDefinitionError(where + ": field '" + f.name +
                                        "' has choices but is not an enum");
        }
    }
}

FieldKind parseKind(const std::string& text, const std::string& field_name) {
    if (text == "string") return FieldKind::STRING;
    if (text == "real") return FieldKind::REAL;
    if (text == "integer") return FieldKind::INTEGER;
    if (text == "timestamp") return FieldKind::TIMESTAMP;
    if (text == "enum") return FieldKind::ENUM;
    throw SchemaDefinitionError("field '" + field_name + "': unknown kind '" + text + "'");
}

std::int64_t parseInteger(const std::string& text, const std::string& what) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || *end != '\0') {
        throw SchemaDefinitionError(what + ": '" + text + "' is not an integer");
    }
    return static_cast<std::int64_t>(value);
}

FieldData parseDefault(FieldKind kind, const std::string& text, const std::string& field_name) {
    const std::string what = "default of field '" + field_name + "'";
    switch (kind) {
        case FieldKind::STRING:
        case FieldKind::ENUM:
            return text;
        case FieldKind::INTEGER:
            return parseInteger(text, what);
        case FieldKind::REAL: {
            errno = 0;
            char* end = nullptr;
            double value = std::strtod(text.c_str(), &end);
            if (text.empty() || errno != 0 || *end != '\0') {
                throw SchemaDefinitionError(what + ": '" + text + "' is not a number");
            }
            return value;
        }
        case FieldKind::TIMESTAMP: {
            auto ts = parseTimestamp(text);
            if (!ts) {
                throw SchemaDefinitionError(what + ": '" + text + "' is not a timestamp");
            }
            return *ts;
        }
    }
    throw SchemaDefinitionError(what + ": unsupported kind");
}

std::vector<std::string> splitChoices(const std::string& text) {
    std::vector<std::string> choices;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(' ');
        auto last = item.find_last_not_of(' ');
        if (first != std::string::npos) {
            choices.push_back(item.substr(first, last - first + 1));
        }
    }
    return choices;
}

SchemaDefinition parseVersion(const pugi::xml_node& node) {
    SchemaDefinition def;
    def.name = node.attribute("name").as_string();
    def.tag = SchemaVersion::CUSTOM;
    if (auto fv = node.attribute("formatVersion")) {
        def.format_version = parseInteger(fv.as_string(), "formatVersion of version '" + def.name + "'");
    }
    def.discriminant = node.attribute("discriminant").as_string();

    for (auto f : node.children("field")) {
        FieldSpec spec;
        spec.name = f.attribute("name").as_string();
        auto kind = f.attribute("kind");
        if (!kind) {
            throw SchemaDefinitionError("field '" + spec.name + "' has no kind");
        }
        spec.kind = parseKind(kind.as_string(), spec.name);
        spec.path = f.attribute("path").as_string();
        spec.shape_of = f.attribute("shapeOf").as_string();
        if (auto dim = f.attribute("dim")) {
            std::int64_t d = parseInteger(dim.as_string(), "dim of field '" + spec.name + "'");
            if (d < 0) {
                throw SchemaDefinitionError("dim of field '" + spec.name + "' is negative");
            }
            spec.shape_dim = static_cast<std::size_t>(d);
        }
        auto def_attr = f.attribute("default");
        if (!def_attr) {
            throw SchemaDefinitionError("field '" + spec.name + "' has no default");
        }
        spec.default_value = parseDefault(spec.kind, def_attr.as_string(), spec.name);
        spec.unit = f.attribute("unit").as_string();
        spec.default_unit = f.attribute("defaultUnit").as_string();
        spec.choices = splitChoices(f.attribute("choices").as_string());
        def.fields.push_back(std::move(spec));
    }

    validate(def);
    return def;
}

} // namespace

const FieldSpec* SchemaDefinition::find(const std::string& field_name) const {
    for (const auto& f : fields) {
        if (f.name == field_name) return &f;
    }
    return nullptr;
}

SchemaDefinition builtinSchema(SchemaVersion version) {
    SchemaDefinition def;
    def.tag = version;
    def.name = toString(version);

    switch (version) {
        case SchemaVersion::V3_DEVICES: {
            def.format_version = 3;
            def.discriminant = "movie/configuration/Devices/AcqCam/Height";
            LayoutPaths p;
            p.framerate = "movie/configuration/Devices/AcqCam/FrameRate";
            p.framebinning = "movie/configuration/Devices/AcqCam/SoftwareFrameBinning";
            p.pixelbinning = "movie/configuration/Devices/AcqCam/SoftwarePixelBinning";
            p.exposuretime = "movie/configuration/Devices/AcqCam/ExposureTime";
            p.instrument = "movie/device_info/InstrumentName";
            p.camera = "movie/configuration/Devices/AcqCam/CameraName";
            p.height = "movie/configuration/Devices/AcqCam/Height";
            p.width = "movie/configuration/Devices/AcqCam/Width";
            def.fields = layoutFields(p, false);
            break;
        }
        case SchemaVersion::V3_ACQ_CAMERA: {
            def.format_version = 3;
            LayoutPaths p;
            p.framerate = "movie/configuration/acq_camera/frame_rate";
            p.framebinning = "movie/configuration/acq_camera/frame_binning";
            p.pixelbinning = "movie/configuration/acq_camera/pixel_binning";
            p.exposuretime = "movie/configuration/acq_camera/exposure_time";
            p.instrument = "movie/device_serials/InstrumentName";
            p.camera = "movie/configuration/acq_camera/model";
            def.fields = layoutFields(p, true);
            break;
        }
        case SchemaVersion::V2: {
            def.format_version = 2;
            LayoutPaths p;
            p.framerate = "configuration/Devices/AcqCam/FrameRate";
            p.framebinning = "configuration/Engines/AcqMovieEngine/FrameBinning";
            p.pixelbinning = "configuration/Engines/AcqMovieEngine/PixelBinning";
            p.exposuretime = "configuration/Devices/AcqCam/ExposureTime";
            p.instrument = "device_info/InstrumentName";
            p.camera = "configuration/Devices/AcqCam/CameraName";
            p.height = "configuration/Devices/AcqCam/Height";
            p.width = "configuration/Devices/AcqCam/Width";
            def.fields = layoutFields(p, false);
            break;
        }
        default:
            throw std::invalid_argument("no built-in schema for " + toString(version));
    }
    return def;
}

SchemaRegistry::SchemaRegistry() {
    versions_.push_back(builtinSchema(SchemaVersion::V3_DEVICES));
    versions_.push_back(builtinSchema(SchemaVersion::V3_ACQ_CAMERA));
    versions_.push_back(builtinSchema(SchemaVersion::V2));
    fallback_ = toString(SchemaVersion::V2);
}

std::shared_ptr<const SchemaRegistry> SchemaRegistry::builtin() {
    static const auto registry = std::make_shared<const SchemaRegistry>();
    return registry;
}

void SchemaRegistry::add(SchemaDefinition definition) {
    validate(definition);
    for (auto& v : versions_) {
        if (v.name == definition.name) {
            v = std::move(definition);
            return;
        }
    }
    versions_.insert(versions_.begin(), std::move(definition));
}

void SchemaRegistry::loadXml(const std::string& filename) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());
    if (!result) {
        throw SchemaDefinitionError("failed to load " + filename + ": " +
                                    std::string(result.description()));
    }
    apply(doc.child("mpSchema"), filename);
}

void SchemaRegistry::loadXmlString(const std::string& content) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(content.c_str());
    if (!result) {
        throw SchemaDefinitionError("failed to parse content: " +
                                    std::string(result.description()));
    }
    apply(doc.child("mpSchema"), "<string>");
}

void SchemaRegistry::apply(const pugi::xml_node& root, const std::string& origin) {
    if (!root) {
        throw SchemaDefinitionError("no mpSchema element in " + origin);
    }

    // Build on a copy so a bad declaration leaves the registry unchanged
    SchemaRegistry updated(*this);
    std::size_t count = 0;
    for (auto node : root.children("version")) {
        updated.add(parseVersion(node));
        ++count;
    }
    std::string fallback = root.attribute("fallback").as_string();
    if (!fallback.empty()) {
        if (!updated.contains(fallback)) {
            throw SchemaDefinitionError("fallback version '" + fallback + "' is not defined");
        }
        updated.fallback_ = fallback;
    }
    *this = std::move(updated);

    MPKIT_LOG_DEBUG("loaded schema definitions",
                    {stringField("source", origin),
                     intField("versions", static_cast<std::int64_t>(count))});
}

bool SchemaRegistry::contains(const std::string& name) const {
    return std::any_of(versions_.begin(), versions_.end(),
                       [&name](const SchemaDefinition& v) { return v.name == name; });
}

const SchemaDefinition& SchemaRegistry::get(const std::string& name) const {
    for (const auto& v : versions_) {
        if (v.name == name) return v;
    }
    throw MissingKeyError(name, "no such schema version");
}

std::vector<std::string> SchemaRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& v : versions_) {
        result.push_back(v.name);
    }
    return result;
}

void SchemaRegistry::setFallback(const std::string& name) {
    if (!contains(name)) {
        throw MissingKeyError(name, "no such schema version");
    }
    fallback_ = name;
}

const SchemaDefinition& SchemaRegistry::select(std::optional<std::int64_t> format_version,
                                               const PathPredicate& exists) const {
    for (const auto& v : versions_) {
        if (v.format_version && v.format_version != format_version) continue;
        if (!v.discriminant.empty() && !(exists && exists(v.discriminant))) continue;
        return v;
    }
    return get(fallback_);
}

} // namespace metadata
} // namespace mpkit
