#include <doctest/doctest.h>
#include <brushkit/formats/abr_legacy.hpp>

#include "helpers/brush_builder.hpp"

#include <vector>

using test_helpers::be_writer;

namespace {

struct plane_layout {
    std::int32_t height = 2;
    std::int32_t width = 2;
    std::uint16_t depth = 8;
    std::uint8_t compression = 0;
    std::vector<std::uint8_t> data = {10, 20, 30, 40};
};

// Sampled-brush entry body for the given file version
std::vector<std::uint8_t> sampled_body(int version, const plane_layout& plane,
                                       std::string_view name = "Brush") {
    be_writer w;
    w.zeros(6);
    if (version == 2) {
        w.unicode(name);
    }
    w.zeros(9);
    w.i32(0).i32(0).i32(plane.height).i32(plane.width);
    w.u16(plane.depth).u8(plane.compression);
    w.bytes(plane.data);
    return w.data();
}

void add_entry(be_writer& w, std::uint16_t type, const std::vector<std::uint8_t>& body) {
    w.u16(type).u32(static_cast<std::uint32_t>(body.size())).bytes(body);
}

} // namespace

TEST_CASE("ABR legacy decoder: check") {
    CHECK(brushkit::abr_legacy_decoder::check(std::vector<std::uint8_t>{0, 1, 0, 0}));
    CHECK(brushkit::abr_legacy_decoder::check(std::vector<std::uint8_t>{0, 2, 0, 3}));
    CHECK_FALSE(brushkit::abr_legacy_decoder::check(std::vector<std::uint8_t>{0, 6, 0, 2}));
    CHECK_FALSE(brushkit::abr_legacy_decoder::check(std::vector<std::uint8_t>{0, 1}));
}

TEST_CASE("ABR legacy decoder: version 1 raw brush") {
    be_writer w;
    w.u16(1).u16(1);
    add_entry(w, 2, sampled_body(1, {}));

    brushkit::parsed_brush_file file;
    auto result = brushkit::abr_legacy_decoder::parse(w.data(), file);
    REQUIRE(result.ok);
    CHECK(file.version == brushkit::format_version{1, 0});
    REQUIRE(file.samples.size() == 1);

    const auto& sample = file.samples[0];
    CHECK(sample.pixels.height() == 2);
    CHECK(sample.pixels.width() == 2);
    CHECK(sample.pixels.bit_depth() == 8);
    CHECK(sample.pixels.at(0, 0) == 10);
    CHECK(sample.pixels.at(0, 1) == 20);
    CHECK(sample.pixels.at(1, 0) == 30);
    CHECK(sample.pixels.at(1, 1) == 40);
    CHECK_FALSE(sample.name.has_value());
    CHECK_FALSE(sample.parameters.has_value());
}

TEST_CASE("ABR legacy decoder: version 2 skips the brush name") {
    plane_layout plane;
    plane.height = 1;
    plane.width = 3;
    plane.compression = 1;
    plane.data = {0, 2, 254, 77};   // count table, then repeat 3

    be_writer w;
    w.u16(2).u16(1);
    add_entry(w, 2, sampled_body(2, plane, "Chalk 60"));

    brushkit::parsed_brush_file file;
    REQUIRE(brushkit::abr_legacy_decoder::parse(w.data(), file).ok);
    REQUIRE(file.samples.size() == 1);
    CHECK(file.samples[0].pixels.width() == 3);
    CHECK(file.samples[0].pixels.at(0, 0) == 77);
    CHECK(file.samples[0].pixels.at(0, 2) == 77);
}

TEST_CASE("ABR legacy decoder: entries that are not decoded") {
    SUBCASE("Computed brushes are skipped") {
        be_writer w;
        w.u16(1).u16(2);
        add_entry(w, 1, std::vector<std::uint8_t>(14, 0xEE));
        add_entry(w, 2, sampled_body(1, {}));

        brushkit::parsed_brush_file file;
        REQUIRE(brushkit::abr_legacy_decoder::parse(w.data(), file).ok);
        CHECK(file.samples.size() == 1);
        CHECK(file.member_failures.empty());
    }

    SUBCASE("Segmented planes produce no sample") {
        plane_layout tall;
        tall.height = 16385;
        tall.width = 1;
        tall.data.clear();

        be_writer w;
        w.u16(1).u16(1);
        add_entry(w, 2, sampled_body(1, tall));

        brushkit::parsed_brush_file file;
        REQUIRE(brushkit::abr_legacy_decoder::parse(w.data(), file).ok);
        CHECK(file.samples.empty());
        CHECK(file.member_failures.empty());
    }

    SUBCASE("A bad entry does not stop the next one") {
        plane_layout bad;
        bad.depth = 12;

        be_writer w;
        w.u16(1).u16(2);
        add_entry(w, 2, sampled_body(1, bad));
        add_entry(w, 2, sampled_body(1, {}));

        brushkit::parsed_brush_file file;
        REQUIRE(brushkit::abr_legacy_decoder::parse(w.data(), file).ok);
        CHECK(file.samples.size() == 1);
        REQUIRE(file.member_failures.size() == 1);
        CHECK(file.member_failures[0].error == brushkit::decode_error::unsupported_bit_depth);
    }
}

TEST_CASE("ABR legacy decoder: failures") {
    brushkit::parsed_brush_file file;

    SUBCASE("Unsupported version") {
        be_writer w;
        w.u16(3).u16(0);
        CHECK(brushkit::abr_legacy_decoder::parse(w.data(), file).error ==
              brushkit::decode_error::unsupported_version);
    }

    SUBCASE("Entry length past the end stops the walk") {
        be_writer w;
        w.u16(1).u16(2);
        w.u16(2).u32(500).bytes(sampled_body(1, {}));

        // The plane itself is complete, only the next entry cannot be located
        REQUIRE(brushkit::abr_legacy_decoder::parse(w.data(), file).ok);
        CHECK(file.samples.size() == 1);
        REQUIRE(file.member_failures.size() == 1);
        CHECK(file.member_failures[0].error == brushkit::decode_error::out_of_bounds);
    }

    SUBCASE("Truncated entry header") {
        be_writer w;
        w.u16(1).u16(1).u16(2);
        auto result = brushkit::abr_legacy_decoder::parse(w.data(), file);
        CHECK_FALSE(result.ok);
        CHECK(result.error == brushkit::decode_error::out_of_bounds);
    }

    SUBCASE("Sample cap is fatal") {
        be_writer w;
        w.u16(1).u16(2);
        add_entry(w, 2, sampled_body(1, {}));
        add_entry(w, 2, sampled_body(1, {}));

        brushkit::decode_options options;
        options.max_samples = 1;
        CHECK(brushkit::abr_legacy_decoder::parse(w.data(), file, options).error ==
              brushkit::decode_error::limit_exceeded);
    }
}
