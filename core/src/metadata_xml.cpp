#include "mpkit/io/metadata_xml.hpp"
#include "mpkit/io/codec.hpp"
#include "mpkit/errors.hpp"

#include <pugixml.hpp>

#include <iomanip>
#include <limits>
#include <sstream>

namespace mpkit {
namespace io {

namespace {

std::string joinShape(const Shape& shape) {
    std::ostringstream out;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out << ' ';
        out << shape[i];
    }
    return out.str();
}

template<typename T>
std::string joinValues(const std::vector<T>& values) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ' ';
        out << values[i];
    }
    return out.str();
}

void appendField(pugi::xml_node& root, const std::string& name, const FieldValue& value) {
    auto node = root.append_child("field");
    node.append_attribute("name") = name.c_str();
    node.append_attribute("kind") = toString(value.kind).c_str();
    node.append_attribute("unit") = value.unit.c_str();
    node.append_attribute("origin") = toString(value.origin).c_str();
    if (!value.source.empty()) {
        node.append_attribute("source") = value.source.c_str();
    }
    node.text().set(value.toText().c_str());
}

void appendExtra(pugi::xml_node& root, const RawAttribute& attr) {
    auto node = root.append_child("extra");
    node.append_attribute("path") = attr.path.c_str();
    node.append_attribute("source") =
        attr.source == RawAttribute::Source::DATASET ? "dataset" : "attribute";
    node.append_attribute("class") = toString(attr.value_class).c_str();
    node.append_attribute("elementSize") = static_cast<unsigned long long>(attr.element_size);
    node.append_attribute("shape") = joinShape(attr.shape).c_str();

    switch (attr.value_class) {
        case ValueClass::SIGNED:
            node.text().set(joinValues(attr.signedValues()).c_str());
            break;
        case ValueClass::UNSIGNED:
            node.text().set(joinValues(attr.unsignedValues()).c_str());
            break;
        case ValueClass::FLOAT:
            node.text().set(joinValues(attr.floatValues()).c_str());
            break;
        case ValueClass::STRING:
            for (const auto& s : attr.stringValues()) {
                node.append_child("item").text().set(s.c_str());
            }
            break;
        case ValueClass::BYTES:
        case ValueClass::STRUCTURED:
            node.append_attribute("encoding") = "base64";
            node.text().set(Base64::encode(attr.bytes()).c_str());
            break;
        default:
            break;
    }
}

void appendDataset(pugi::xml_node& root, const DatasetInfo& info) {
    auto node = root.append_child("dataset");
    node.append_attribute("path") = info.path.c_str();
    node.append_attribute("class") = toString(info.value_class).c_str();
    node.append_attribute("elementSize") = static_cast<unsigned long long>(info.element_size);
    node.append_attribute("shape") = joinShape(info.shape).c_str();
    node.append_attribute("layout") = toString(info.layout).c_str();
    if (!info.chunk_shape.empty()) {
        node.append_attribute("chunkShape") = joinShape(info.chunk_shape).c_str();
    }
    for (const auto& filter : info.filters) {
        auto f = node.append_child("filter");
        f.append_attribute("id") = filter.id;
        f.append_attribute("name") = filter.name.c_str();
    }
}

void buildDocument(pugi::xml_document& doc, const MetadataRecord& record) {
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("mpMetadata");
    root.append_attribute("sourceFile") = record.sourceFile().c_str();
    root.append_attribute("schemaVersion") = record.schemaVersion().c_str();

    for (const auto& [name, value] : record.fields()) {
        appendField(root, name, value);
    }
    for (const auto& [path, attr] : record.extras()) {
        appendExtra(root, attr);
    }
    for (const auto& info : record.datasets()) {
        appendDataset(root, info);
    }
}

} // namespace

std::string MetadataXmlWriter::toString(const MetadataRecord& record) {
    pugi::xml_document doc;
    buildDocument(doc, record);
    std::ostringstream out;
    doc.save(out, "  ");
    return out.str();
}

void MetadataXmlWriter::write(const MetadataRecord& record, const std::string& filename) {
    pugi::xml_document doc;
    buildDocument(doc, record);
    if (!doc.save_file(filename.c_str(), "  ")) {
        throw NotFoundError(filename, "cannot write file");
    }
}

} // namespace io
} // namespace mpkit
