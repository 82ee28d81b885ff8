#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mpkit/metadata/batch.hpp"
#include "mp_fixtures.hpp"

#include <stdexcept>

using namespace mpkit;
using namespace mpkit::metadata;
using namespace mpkit_test;
using Catch::Approx;

TEST_CASE("Batch extraction", "[batch]") {
    const auto first = tempPath("batch_first.mp");
    const auto broken = tempPath("batch_broken.mp");
    const auto third = tempPath("batch_third.mp");
    writeV3Devices(first);
    writeV3Devices(broken);
    truncateFile(broken, 1024);
    writeV2(third);
    const std::vector<std::string> paths = {first, broken, third};

    SECTION("A failing file does not stop the others") {
        auto results = extractAll(paths).collect();
        REQUIRE(results.size() == 3);

        REQUIRE(results[0].ok());
        REQUIRE(results[0].path == first);
        REQUIRE(results[0].record->schemaVersion() == "v3-devices");

        REQUIRE_FALSE(results[1].ok());
        REQUIRE(results[1].path == broken);
        REQUIRE(results[1].error == ErrorKind::CORRUPT_DATA);
        REQUIRE_FALSE(results[1].record.has_value());
        REQUIRE_FALSE(results[1].message.empty());

        REQUIRE(results[2].ok());
        REQUIRE(results[2].record->schemaVersion() == "v2");
    }

    SECTION("Results are produced lazily and in order") {
        auto batch = extractAll(paths);
        REQUIRE(batch.size() == 3);

        std::vector<std::string> seen;
        for (const auto& result : batch) {
            seen.push_back(result.path);
        }
        REQUIRE(seen == paths);
        REQUIRE(batch.at(2).record->real("framerate") == Approx(500.0));
        REQUIRE_THROWS_AS(batch.at(3), std::out_of_range);
    }

    SECTION("Iteration is restartable") {
        auto batch = extractAll(paths);
        auto once = batch.collect();
        auto twice = batch.collect();
        REQUIRE(once.size() == twice.size());
        for (std::size_t i = 0; i < once.size(); ++i) {
            REQUIRE(once[i].error == twice[i].error);
            REQUIRE(once[i].record == twice[i].record);
        }
    }

    SECTION("Parallel results keep input order") {
        std::vector<std::string> many;
        for (int i = 0; i < 4; ++i) {
            many.insert(many.end(), paths.begin(), paths.end());
        }
        BatchOptions options;
        options.concurrency = 3;
        auto parallel = extractAllParallel(many, options);
        auto sequential = extractAll(many).collect();

        REQUIRE(parallel.size() == many.size());
        for (std::size_t i = 0; i < many.size(); ++i) {
            REQUIRE(parallel[i].path == many[i]);
            REQUIRE(parallel[i].error == sequential[i].error);
            REQUIRE(parallel[i].record == sequential[i].record);
        }
        REQUIRE(io::openObjectCount() == 0);
    }

    SECTION("Empty batch") {
        REQUIRE(extractAll({}).empty());
        REQUIRE(extractAll({}).collect().empty());
        REQUIRE(extractAllParallel({}).empty());
    }
}

TEST_CASE("Batch error kinds", "[batch]") {
    SECTION("Missing file") {
        auto result = extractOne((tempDir() / "batch_missing.mp").string());
        REQUIRE(result.error == ErrorKind::NOT_FOUND);
    }

    SECTION("Not a container") {
        const auto path = tempPath("batch_text.mp");
        writeBytes(path, "frame rate: 1000\n");
        REQUIRE(extractOne(path).error == ErrorKind::FORMAT);
    }

    SECTION("Schema violation") {
        const auto path = tempPath("batch_schema.mp");
        writeV3Devices(path, {"movie/configuration/Devices/AcqCam/FrameRate"}, [](MpWriter& w) {
            w.string("movie/configuration/Devices/AcqCam/FrameRate", "fast");
        });
        auto result = extractOne(path);
        REQUIRE(result.error == ErrorKind::SCHEMA);
        REQUIRE(result.message.find("framerate") != std::string::npos);
    }

    SECTION("Generous timeout") {
        const auto path = tempPath("batch_timeout.mp");
        writeV2(path);
        BatchOptions options;
        options.per_file_timeout = std::chrono::minutes(10);
        REQUIRE(extractOne(path, options).ok());
    }

    SECTION("Options reach the extractor") {
        const auto path = tempPath("batch_native.mp");
        writeV2(path);
        BatchOptions options;
        options.extractor.include_native = true;
        auto result = extractOne(path, options);
        REQUIRE(result.record->hasExtra("configuration/Devices/AcqCam/FrameRate"));
    }
}

TEST_CASE("Batch with a custom extraction", "[batch]") {
    const auto good = tempPath("batch_custom_good.mp");
    writeV2(good);
    const std::vector<std::string> paths = {good, "raise-int", "raise-runtime", good};

    BatchOptions options;
    options.concurrency = 2;
    options.extract_file = [](const std::string& path, const ExtractorOptions& extractor) {
        if (path == "raise-int") throw 42;
        if (path == "raise-runtime") throw std::runtime_error("disk went away");
        return MetadataExtractor(extractor).extract(path);
    };

    SECTION("Any exception stays with its file") {
        auto results = extractAllParallel(paths, options);
        REQUIRE(results.size() == 4);
        REQUIRE(results[0].ok());
        REQUIRE(results[1].error == ErrorKind::INTERNAL);
        REQUIRE(results[1].message == "unknown exception");
        REQUIRE(results[2].error == ErrorKind::INTERNAL);
        REQUIRE(results[2].message == "disk went away");
        REQUIRE(results[3].ok());
        REQUIRE(results[3].record->schemaVersion() == "v2");
    }

    SECTION("Sequential batches use it too") {
        auto results = extractAll(paths, options).collect();
        REQUIRE(results[1].error == ErrorKind::INTERNAL);
        REQUIRE(results[3].ok());
    }
}

TEST_CASE("Batch concurrency", "[batch]") {
    BatchOptions options;
    options.concurrency = 8;
    REQUIRE(effectiveConcurrency(options, 3) <= 3);
    REQUIRE(effectiveConcurrency(options, 3) >= 1);
    REQUIRE(effectiveConcurrency(options, 0) == 1);

    options.concurrency = 1;
    REQUIRE(effectiveConcurrency(options, 10) == 1);

    options.concurrency = 0;
    REQUIRE(effectiveConcurrency(options, 1) == 1);
}
