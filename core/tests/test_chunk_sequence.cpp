#include <catch2/catch_test_macros.hpp>
#include "mpkit/io/mp_file.hpp"
#include "mp_fixtures.hpp"

#include <zlib.h>

#include <cstring>
#include <numeric>

using namespace mpkit;
using namespace mpkit::io;
using namespace mpkit_test;

namespace {

std::vector<std::uint16_t> asUint16(const std::vector<std::uint8_t>& bytes) {
    std::vector<std::uint16_t> values(bytes.size() / sizeof(std::uint16_t));
    std::memcpy(values.data(), bytes.data(), values.size() * sizeof(std::uint16_t));
    return values;
}

std::vector<std::uint8_t> zlibCompress(const std::vector<std::uint8_t>& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    std::vector<std::uint8_t> out(size);
    REQUIRE(compress2(out.data(), &size, data.data(), static_cast<uLong>(data.size()), 6) == Z_OK);
    out.resize(size);
    return out;
}

} // namespace

TEST_CASE("ChunkSequence over a deflated frame stack", "[chunks]") {
    const auto path = tempPath("chunks_deflate.mp");
    writeV3Devices(path);
    const auto frames = plainFrames(V3_FRAMES, V3_HEIGHT, V3_WIDTH);
    const std::size_t frame_pixels = V3_HEIGHT * V3_WIDTH;

    auto file = MPFile::open(path);
    auto chunks = file.readDataset("movie/frame");

    SECTION("One chunk per frame") {
        REQUIRE(chunks.size() == V3_FRAMES);
        REQUIRE(chunks.chunkShape() == Shape{1, V3_HEIGHT, V3_WIDTH});
        REQUIRE(chunks.gridShape() == Shape{V3_FRAMES, 1, 1});
        REQUIRE(chunks.decodesRawChunks());
    }

    SECTION("Chunks hold the stored frames") {
        Index expected_index = 0;
        for (const Chunk& chunk : chunks) {
            REQUIRE(chunk.index == expected_index);
            REQUIRE(chunk.offset == Shape{expected_index, 0, 0});
            REQUIRE(chunk.extent == Shape{1, V3_HEIGHT, V3_WIDTH});
            REQUIRE(chunk.element_size == 2);
            auto pixels = chunk.as<std::uint16_t>();
            std::vector<std::uint16_t> stored(frames.begin() + expected_index * frame_pixels,
                                              frames.begin() + (expected_index + 1) * frame_pixels);
            REQUIRE(pixels == stored);
            ++expected_index;
        }
        REQUIRE(expected_index == V3_FRAMES);
    }

    SECTION("Partial read of one chunk") {
        auto last = chunks.read(V3_FRAMES - 1);
        REQUIRE(last.offset == Shape{V3_FRAMES - 1, 0, 0});
        REQUIRE(last.as<std::uint16_t>().front() == frames[(V3_FRAMES - 1) * frame_pixels]);
    }

    SECTION("Iteration is restartable") {
        std::vector<std::vector<std::uint8_t>> first;
        for (const auto& chunk : chunks) first.push_back(chunk.bytes);
        std::vector<std::vector<std::uint8_t>> second;
        for (const auto& chunk : chunks) second.push_back(chunk.bytes);
        REQUIRE(first == second);
    }

    SECTION("readAll matches the stored data") {
        REQUIRE(asUint16(chunks.readAll()) == frames);
    }

    SECTION("Wrong element type is rejected") {
        REQUIRE_THROWS_AS(chunks.read(0).as<std::uint32_t>(), std::invalid_argument);
    }

    SECTION("Index out of range") {
        REQUIRE_THROWS_AS(chunks.read(V3_FRAMES), std::out_of_range);
    }

    SECTION("Reading after close") {
        file.close();
        REQUIRE_THROWS_AS(chunks.read(0), std::logic_error);
    }

    SECTION("Free function") {
        REQUIRE(readDataset(file, "movie/frame").size() == chunks.size());
        REQUIRE_THROWS_AS(readDataset(file, "movie/missing"), MissingKeyError);
    }
}

TEST_CASE("ChunkSequence with shuffle and deflate", "[chunks]") {
    const auto path = tempPath("chunks_shuffle.mp");
    writeV3AcqCamera(path);
    auto file = MPFile::open(path);
    auto chunks = file.readDataset("movie/frame");

    REQUIRE(chunks.size() == ACQ_FRAMES / 2);
    REQUIRE(chunks.decodesRawChunks());
    REQUIRE(chunks.info().filters.size() == 2);
    REQUIRE(chunks.info().filters[0].id == H5Z_FILTER_SHUFFLE);
    REQUIRE(chunks.info().filters[1].id == H5Z_FILTER_DEFLATE);
    REQUIRE(asUint16(chunks.readAll()) == plainFrames(ACQ_FRAMES, ACQ_HEIGHT, ACQ_WIDTH));
}

TEST_CASE("ChunkSequence edge chunks", "[chunks]") {
    const auto path = tempPath("chunks_edge.mp");
    std::vector<std::int32_t> values(10 * 10);
    std::iota(values.begin(), values.end(), -50);
    {
        MpWriter w(path);
        DatasetOptions options;
        options.chunk = {4, 4};
        options.deflate = 1;
        w.dataset<std::int32_t>("grid", values, {10, 10}, options);
    }

    auto file = MPFile::open(path);
    auto chunks = file.readDataset("grid");
    REQUIRE(chunks.gridShape() == Shape{3, 3});
    REQUIRE(chunks.size() == 9);

    SECTION("Corner chunk is clipped") {
        auto corner = chunks.read(8);
        REQUIRE(corner.offset == Shape{8, 8});
        REQUIRE(corner.extent == Shape{2, 2});
        REQUIRE(corner.as<std::int32_t>() == std::vector<std::int32_t>{38, 39, 48, 49});
    }

    SECTION("Right edge chunk") {
        auto edge = chunks.read(2);
        REQUIRE(edge.offset == Shape{0, 8});
        REQUIRE(edge.extent == Shape{4, 2});
        REQUIRE(edge.as<std::int32_t>() ==
                std::vector<std::int32_t>{-42, -41, -32, -31, -22, -21, -12, -11});
    }

    SECTION("Assembled grid") {
        auto all = chunks.readAll();
        REQUIRE(all.size() == values.size() * sizeof(std::int32_t));
        REQUIRE(std::memcmp(all.data(), values.data(), all.size()) == 0);
    }
}

TEST_CASE("ChunkSequence over contiguous data", "[chunks]") {
    const auto path = tempPath("chunks_contiguous.mp");
    writeV2(path);

    ReaderOptions options;
    options.target_chunk_bytes = 1000;
    auto file = MPFile::open(path, options);
    auto chunks = file.readDataset("frame");

    // 256 bytes per frame, three frames per block
    REQUIRE(chunks.info().layout == DatasetLayout::CONTIGUOUS);
    REQUIRE_FALSE(chunks.decodesRawChunks());
    REQUIRE(chunks.chunkShape() == Shape{3, V2_SIZE, V2_SIZE});
    REQUIRE(chunks.size() == 7);

    auto last = chunks.read(6);
    REQUIRE(last.offset == Shape{18, 0, 0});
    REQUIRE(last.extent == Shape{2, V2_SIZE, V2_SIZE});

    auto all = chunks.readAll();
    REQUIRE(all.size() == V2_FRAMES * V2_SIZE * V2_SIZE);
    for (std::size_t i = 0; i < all.size(); ++i) {
        REQUIRE(all[i] == static_cast<std::uint8_t>(100 + (i * 13) % 50));
    }
}

TEST_CASE("ChunkSequence over small datasets", "[chunks]") {
    const auto path = tempPath("chunks_small.mp");
    {
        MpWriter w(path);
        w.scalar<double>("scalar", 4.25);
        w.dataset<float>("empty", {}, {0});
    }
    auto file = MPFile::open(path);

    SECTION("Scalar is one chunk") {
        auto chunks = file.readDataset("scalar");
        REQUIRE(chunks.size() == 1);
        auto chunk = chunks.read(0);
        REQUIRE(chunk.extent.empty());
        REQUIRE(chunk.as<double>() == std::vector<double>{4.25});
    }

    SECTION("Zero extent has no chunks") {
        auto chunks = file.readDataset("empty");
        REQUIRE(chunks.empty());
        REQUIRE(chunks.begin() == chunks.end());
        REQUIRE(chunks.readAll().empty());
    }

    SECTION("Variable-length strings are not chunked data") {
        const auto vlen_path = tempPath("chunks_vlen.mp");
        MpWriter w(vlen_path);
        w.strings("labels", {"a", "b"});
        w.close();
        auto vlen = MPFile::open(vlen_path);
        REQUIRE_THROWS_AS(vlen.readDataset("labels").read(0), std::invalid_argument);
    }
}

TEST_CASE("ChunkSequence with a checksum filter", "[chunks]") {
    const auto path = tempPath("chunks_fletcher.mp");
    auto frames = plainFrames(3, 8, 8);
    {
        MpWriter w(path);
        DatasetOptions options;
        options.chunk = {1, 8, 8};
        options.deflate = 2;
        options.fletcher32 = true;
        w.dataset<std::uint16_t>("movie/frame", frames, {3, 8, 8}, options);
    }

    auto file = MPFile::open(path);
    auto chunks = file.readDataset("movie/frame");
    REQUIRE_FALSE(chunks.decodesRawChunks());
    REQUIRE(asUint16(chunks.readAll()) == frames);
}

TEST_CASE("ChunkSequence corrupt chunks", "[chunks]") {
    const auto path = tempPath("chunks_corrupt.mp");
    const auto frames = plainFrames(2, 8, 8);
    std::vector<std::uint8_t> frame_bytes(8 * 8 * sizeof(std::uint16_t));
    std::memcpy(frame_bytes.data(), frames.data(), frame_bytes.size());

    {
        MpWriter w(path);
        DatasetOptions options;
        options.chunk = {1, 8, 8};
        options.deflate = 6;
        w.dataset<std::uint16_t>("movie/frame", frames, {2, 8, 8}, options);

        // Not a zlib stream
        w.rawChunk("movie/frame", {0, 0, 0}, {0x13, 0x37, 0x00, 0xff, 0x10, 0x20});

        // A valid stream of half a frame
        std::vector<std::uint8_t> half(frame_bytes.begin(),
                                       frame_bytes.begin() + frame_bytes.size() / 2);
        w.rawChunk("movie/frame", {1, 0, 0}, zlibCompress(half));
    }

    auto file = MPFile::open(path);
    auto chunks = file.readDataset("movie/frame");
    REQUIRE(chunks.decodesRawChunks());

    SECTION("Invalid stream") {
        REQUIRE_THROWS_AS(chunks.read(0), CorruptDataError);
    }

    SECTION("Wrong decoded size") {
        REQUIRE_THROWS_AS(chunks.read(1), CorruptDataError);
    }

    SECTION("Chunk stored without compression") {
        const auto plain_path = tempPath("chunks_unfiltered.mp");
        MpWriter w(plain_path);
        DatasetOptions options;
        options.chunk = {1, 8, 8};
        options.deflate = 6;
        w.dataset<std::uint16_t>("movie/frame", frames, {2, 8, 8}, options);
        // Filter mask bit 0 set: deflate skipped for this chunk
        w.rawChunk("movie/frame", {1, 0, 0}, frame_bytes, 0x1);
        w.close();

        auto reopened = MPFile::open(plain_path);
        auto chunk = reopened.readDataset("movie/frame").read(1);
        REQUIRE(chunk.bytes == frame_bytes);
    }
}
