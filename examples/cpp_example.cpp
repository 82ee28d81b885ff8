/**
 * Example usage of the mpkit C++ library.
 *
 * Run with one or more .mp files:
 *   mpkit_example event1.mp event2.mp
 */

#include <iostream>
#include <string>
#include <vector>

#include "mpkit/mpkit.hpp"

using namespace mpkit;

void exampleSchemas() {
    std::cout << "========================================\n";
    std::cout << "Schema Versions\n";
    std::cout << "========================================\n";

    auto registry = metadata::SchemaRegistry::builtin();
    for (const auto& name : registry->names()) {
        const auto& schema = registry->get(name);
        std::cout << "  " << name;
        if (schema.format_version) {
            std::cout << " (format " << *schema.format_version << ")";
        }
        if (!schema.discriminant.empty()) {
            std::cout << " requires " << schema.discriminant;
        }
        std::cout << "\n";
        for (const auto& field : schema.fields) {
            std::cout << "    " << field.name << " [" << toString(field.kind) << "] <- "
                      << field.source() << "\n";
        }
    }
    std::cout << "  Fallback: " << registry->fallback() << "\n";

    std::cout << "\nPixel sizes:\n";
    for (const std::string instrument : {"Refeyn OneMP", "Refeyn TwoMP", "Prototype"}) {
        auto size = metadata::lookupPixelSize(instrument);
        std::cout << "  " << instrument << ": ";
        if (size) {
            std::cout << size->value << " " << size->unit << "\n";
        } else {
            std::cout << "unknown\n";
        }
    }
}

void exampleContainer(const std::string& path) {
    std::cout << "\n========================================\n";
    std::cout << "Container: " << path << "\n";
    std::cout << "========================================\n";

    auto file = io::open(path);
    std::cout << "Superblock version " << int(file.signature().superblock_version)
              << ", user block " << file.signature().offset << " bytes\n";

    std::cout << "Top-level entries:\n";
    for (const auto& entry : file.listEntries()) {
        std::cout << "  " << entry.name
                  << (entry.kind == EntryKind::GROUP ? "/" : "") << "\n";
    }

    auto walk = file.walk();
    std::cout << walk.attributes.size() << " raw attributes, "
              << walk.datasets.size() << " bulk datasets\n";
    for (const auto& info : walk.datasets) {
        auto chunks = file.readDataset(info.path);
        std::cout << "  " << info.path << ": " << chunks.size() << " chunks ("
                  << toString(info.layout) << ")\n";
    }

    metadata::MetadataExtractor extractor;
    auto record = extractor.extract(file);
    std::cout << "\nSchema version: " << record.schemaVersion() << "\n";
    for (const auto& [name, value] : record.fields()) {
        std::cout << "  " << name << " = " << value.toText();
        if (!value.unit.empty()) std::cout << " " << value.unit;
        std::cout << " (" << toString(value.origin) << ")\n";
    }
    std::cout << record.extras().size() << " extra attributes\n";

    if (file.hasDataset(io::MovieReader::FRAMES_PATH) ||
        file.hasDataset(io::MovieReader::LEGACY_FRAMES_PATH)) {
        auto movie = io::readMovie(file);
        std::cout << "\nMovie: " << movie.frame_count << " x " << movie.height << " x "
                  << movie.width << (movie.delta_encoded ? ", delta encoded" : "")
                  << (movie.verified ? ", verified" : "") << "\n";
    }
}

void exampleBatch(const std::vector<std::string>& paths) {
    std::cout << "\n========================================\n";
    std::cout << "Batch Extraction\n";
    std::cout << "========================================\n";

    metadata::BatchOptions options;
    options.concurrency = 2;
    for (const auto& result : metadata::extractAllParallel(paths, options)) {
        if (result.ok()) {
            std::cout << "  " << result.path << ": " << result.record->schemaVersion() << "\n";
        } else {
            std::cout << "  " << result.path << ": " << toString(result.error) << " ("
                      << result.message << ")\n";
        }
    }
}

int main(int argc, char** argv) {
    std::cout << "mpkit C++ Library Examples\n\n";

    try {
        initializeLogging();
        exampleSchemas();

        std::vector<std::string> paths(argv + 1, argv + argc);
        for (const auto& path : paths) {
            exampleContainer(path);
        }
        if (!paths.empty()) {
            exampleBatch(paths);
        }

        std::cout << "\n========================================\n";
        std::cout << "Examples completed successfully!\n";
        std::cout << "========================================\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
