#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mpkit/metadata/schema.hpp"
#include "mpkit/errors.hpp"
#include "mp_fixtures.hpp"

#include <fstream>
#include <set>

using namespace mpkit;
using namespace mpkit::metadata;
using Catch::Approx;

namespace {

PathPredicate pathsIn(std::set<std::string> paths) {
    return [paths = std::move(paths)](const std::string& p) { return paths.count(p) > 0; };
}

const char* SITE_SCHEMA = R"(<?xml version="1.0"?>
<mpSchema>
  <version name="site-v4" formatVersion="4" discriminant="acquisition/camera/rate">
    <field name="framerate" kind="real" path="acquisition/camera/rate" default="1" unit="Hz" defaultUnit="1/frame"/>
    <field name="camera" kind="string" path="acquisition/camera/name" default="unknown"/>
    <field name="mode" kind="enum" path="acquisition/mode" default="standard" choices="standard, high_speed"/>
    <field name="started" kind="timestamp" path="@started" default="1970-01-01T00:00:00Z"/>
    <field name="frames" kind="integer" shapeOf="acquisition/frames" dim="0" default="0"/>
  </version>
</mpSchema>
)";

} // namespace

TEST_CASE("Built-in schema versions", "[schema]") {
    auto registry = SchemaRegistry::builtin();

    SECTION("Selection order and fallback") {
        REQUIRE(registry->names() ==
                std::vector<std::string>{"v3-devices", "v3-acq_camera", "v2"});
        REQUIRE(registry->size() == 3);
        REQUIRE(registry->fallback() == "v2");
        REQUIRE(registry->contains("v3-acq_camera"));
        REQUIRE_FALSE(registry->contains("v4"));
        REQUIRE_THROWS_AS(registry->get("v4"), MissingKeyError);
    }

    SECTION("Every version declares the canonical fields") {
        for (const auto& name : registry->names()) {
            const auto& schema = registry->get(name);
            for (const char* field : {"format_version", "framerate", "framebinning",
                                      "pixelbinning", "exposuretime", "instrument", "camera",
                                      "image_height", "image_width"}) {
                REQUIRE(schema.find(field) != nullptr);
            }
            REQUIRE(schema.find("gain") == nullptr);
        }
    }

    SECTION("Defaults and units") {
        const auto& v3 = registry->get("v3-devices");
        const auto* framerate = v3.find("framerate");
        REQUIRE(framerate->kind == FieldKind::REAL);
        REQUIRE(framerate->path == "movie/configuration/Devices/AcqCam/FrameRate");
        REQUIRE(std::get<double>(framerate->default_value) == Approx(1.0));
        REQUIRE(framerate->unitFor(FieldOrigin::MEASURED) == "Hz");
        REQUIRE(framerate->unitFor(FieldOrigin::DEFAULTED) == "1/frame");

        const auto* exposure = v3.find("exposuretime");
        REQUIRE(exposure->unitFor(FieldOrigin::MEASURED) == "ms");
        REQUIRE(exposure->unitFor(FieldOrigin::DEFAULTED) == "frame");

        const auto* binning = v3.find("framebinning");
        REQUIRE(std::get<std::int64_t>(binning->default_value) == 1);

        REQUIRE(std::get<std::int64_t>(v3.find("format_version")->default_value) == 2);
        REQUIRE(std::get<std::string>(v3.find("instrument")->default_value) == "unknown");
    }

    SECTION("Image size from the keyframe shape") {
        const auto& acq = registry->get("v3-acq_camera");
        const auto* height = acq.find("image_height");
        REQUIRE(height->fromShape());
        REQUIRE(height->source() == "movie/keyframe");
        REQUIRE(height->shape_dim == 1);
        REQUIRE(acq.find("image_width")->shape_dim == 2);

        const auto& v2 = registry->get("v2");
        REQUIRE_FALSE(v2.find("image_height")->fromShape());
        REQUIRE(v2.find("image_height")->source() == "configuration/Devices/AcqCam/Height");
    }

    SECTION("builtinSchema") {
        REQUIRE(builtinSchema(SchemaVersion::V2).tag == SchemaVersion::V2);
        REQUIRE(builtinSchema(SchemaVersion::V3_DEVICES).name == "v3-devices");
        REQUIRE(*builtinSchema(SchemaVersion::V3_ACQ_CAMERA).format_version == 3);
        REQUIRE_THROWS_AS(builtinSchema(SchemaVersion::CUSTOM), std::invalid_argument);
    }
}

TEST_CASE("Schema selection", "[schema]") {
    SchemaRegistry registry;
    const auto devices = pathsIn({"movie/configuration/Devices/AcqCam/Height"});
    const auto nothing = pathsIn({});

    REQUIRE(registry.select(3, devices).name == "v3-devices");
    REQUIRE(registry.select(3, nothing).name == "v3-acq_camera");
    REQUIRE(registry.select(2, devices).name == "v2");
    REQUIRE(registry.select(2, nothing).name == "v2");
    REQUIRE(registry.select(std::nullopt, nothing).name == "v2");
    REQUIRE(registry.select(7, nothing).name == "v2");
    REQUIRE(registry.select(3, nullptr).name == "v3-acq_camera");

    SECTION("Fallback can be changed") {
        registry.setFallback("v3-acq_camera");
        REQUIRE(registry.select(7, nothing).name == "v3-acq_camera");
        REQUIRE_THROWS_AS(registry.setFallback("v9"), MissingKeyError);
    }
}

TEST_CASE("Schema registry additions", "[schema]") {
    SchemaRegistry registry;

    SECTION("Added version is tried first") {
        auto def = builtinSchema(SchemaVersion::V2);
        def.name = "any-version";
        def.tag = SchemaVersion::CUSTOM;
        def.format_version.reset();
        registry.add(def);
        REQUIRE(registry.names().front() == "any-version");
        REQUIRE(registry.select(3, pathsIn({})).name == "any-version");
    }

    SECTION("Replacing keeps the position") {
        auto def = builtinSchema(SchemaVersion::V3_ACQ_CAMERA);
        def.fields.pop_back();
        registry.add(def);
        REQUIRE(registry.names() ==
                std::vector<std::string>{"v3-devices", "v3-acq_camera", "v2"});
        REQUIRE(registry.get("v3-acq_camera").find("image_width") == nullptr);
    }

    SECTION("Inconsistent definitions are rejected") {
        auto def = builtinSchema(SchemaVersion::V2);
        def.name = "broken";

        SECTION("Duplicate field") {
            def.fields.push_back(def.fields.front());
            REQUIRE_THROWS_AS(registry.add(def), SchemaDefinitionError);
        }

        SECTION("Default of the wrong kind") {
            def.fields[1].default_value = std::string("fast");
            REQUIRE_THROWS_AS(registry.add(def), SchemaDefinitionError);
        }

        SECTION("Both path and shape") {
            def.fields[1].shape_of = "movie/frame";
            REQUIRE_THROWS_AS(registry.add(def), SchemaDefinitionError);
        }

        SECTION("No name") {
            def.name.clear();
            REQUIRE_THROWS_AS(registry.add(def), SchemaDefinitionError);
        }

        REQUIRE_FALSE(registry.contains("broken"));
    }
}

TEST_CASE("Schema XML loading", "[schema]") {
    SchemaRegistry registry;

    SECTION("Load from string") {
        registry.loadXmlString(SITE_SCHEMA);
        REQUIRE(registry.size() == 4);
        REQUIRE(registry.names().front() == "site-v4");

        const auto& site = registry.get("site-v4");
        REQUIRE(site.tag == SchemaVersion::CUSTOM);
        REQUIRE(*site.format_version == 4);
        REQUIRE(site.discriminant == "acquisition/camera/rate");
        REQUIRE(site.fields.size() == 5);

        const auto* mode = site.find("mode");
        REQUIRE(mode->kind == FieldKind::ENUM);
        REQUIRE(mode->choices == std::vector<std::string>{"standard", "high_speed"});

        const auto* started = site.find("started");
        REQUIRE(std::get<Timestamp>(started->default_value).time_since_epoch().count() == 0);

        const auto* frames = site.find("frames");
        REQUIRE(frames->fromShape());
        REQUIRE(frames->source() == "acquisition/frames");

        REQUIRE(registry.select(4, pathsIn({"acquisition/camera/rate"})).name == "site-v4");
        REQUIRE(registry.select(4, pathsIn({})).name == "v2");
    }

    SECTION("Load from file") {
        const auto path = mpkit_test::tempPath("site_schema.xml");
        {
            std::ofstream out(path);
            out << SITE_SCHEMA;
        }
        registry.loadXml(path);
        REQUIRE(registry.contains("site-v4"));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(registry.loadXml("/nonexistent/schema.xml"), SchemaDefinitionError);
    }

    SECTION("Fallback attribute") {
        registry.loadXmlString(R"(<mpSchema fallback="v3-acq_camera"/>)");
        REQUIRE(registry.fallback() == "v3-acq_camera");
        REQUIRE(registry.size() == 3);
    }

    SECTION("Invalid declarations leave the registry unchanged") {
        const std::vector<std::string> invalid = {
            "<mpSchema><version name='x'",
            "<schema/>",
            R"(<mpSchema><version name="x"><field name="a" kind="colour" path="a" default="red"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="real" path="a"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="real" path="a" default="fast"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="enum" path="a" default="c" choices="a,b"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="enum" path="a" default="a"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="string" shapeOf="frame" default="a"/></version></mpSchema>)",
            R"(<mpSchema><version name="x"><field name="a" kind="integer" default="1"/></version></mpSchema>)",
            R"(<mpSchema><version name="x" formatVersion="three"/></mpSchema>)",
            R"(<mpSchema fallback="v9"/>)",
            R"(<mpSchema><version name="ok"><field name="a" kind="integer" path="a" default="1"/></version><version name=""/></mpSchema>)",
        };
        for (const auto& content : invalid) {
            INFO(content);
            REQUIRE_THROWS_AS(registry.loadXmlString(content), SchemaDefinitionError);
            REQUIRE(registry.names() ==
                    std::vector<std::string>{"v3-devices", "v3-acq_camera", "v2"});
            REQUIRE(registry.fallback() == "v2");
        }
    }

    SECTION("Errors carry the configuration kind") {
        try {
            registry.loadXmlString("<schema/>");
            FAIL("expected SchemaDefinitionError");
        } catch (const SchemaDefinitionError& e) {
            REQUIRE(e.kind() == ErrorKind::CONFIGURATION);
        }
    }
}
