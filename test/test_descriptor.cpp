#include <doctest/doctest.h>
#include <brushkit/descriptor.hpp>

#include "helpers/brush_builder.hpp"

using test_helpers::be_writer;

namespace {

// Descriptor body header: unicode name, class id, item count
void begin_descriptor(be_writer& w, std::uint32_t count) {
    w.unicode("").key("null").u32(count);
}

} // namespace

TEST_CASE("Descriptor: every value type") {
    be_writer w;
    begin_descriptor(w, 9);
    w.key("Dmtr").text("UntF").text("#Pxl").f64(25.0);
    w.key("Hrdn").text("UntF").text("#Prc").f64(100.0);
    w.key("Nm  ").text("TEXT").unicode("Soft Round");
    w.key("Intr").text("bool").u8(1);
    w.compact("count").text("long").i32(-3);
    w.compact("ratio").text("doub").f64(0.5);
    w.key("Md  ").text("enum").key("BlnM").key("Nrml");
    w.key("Zzzz").text("VlLs").u32(2).text("long").i32(1).text("TEXT").unicode("two");
    w.key("Brsh").text("Objc").unicode("").key("computedBrush").u32(1)
        .key("Angl").text("UntF").text("#Ang").f64(-45.0);

    brushkit::byte_cursor cursor(w.data());
    brushkit::descriptor desc;
    auto result = brushkit::parse_descriptor(cursor, desc);
    REQUIRE(result.ok);
    CHECK(cursor.at_end());
    CHECK(desc.name.empty());
    CHECK(desc.class_id == "null");

    const auto& items = desc.items;
    REQUIRE(items.size() == 9);

    SUBCASE("Unit floats") {
        const auto* diameter = items.find("diameter")->get_if<brushkit::unit_float>();
        REQUIRE(diameter != nullptr);
        CHECK(diameter->value == doctest::Approx(25.0));
        CHECK(diameter->unit == brushkit::unit_kind::pixels);
        CHECK(items.find("hardness")->get_if<brushkit::unit_float>()->unit == brushkit::unit_kind::percent);
    }

    SUBCASE("Scalars") {
        CHECK(*items.find("name")->as_string() == "Soft Round");
        CHECK(*items.find("interpolation")->get_if<bool>() == true);
        CHECK(*items.find("count")->get_if<std::int64_t>() == -3);
        CHECK(*items.find("ratio")->get_if<double>() == doctest::Approx(0.5));
    }

    SUBCASE("Enumerations keep the value name") {
        CHECK(*items.find("mode")->as_string() == "Nrml");
    }

    SUBCASE("Unknown keys fall back to their tag text") {
        const auto* list = items.find("Zzzz")->get_if<brushkit::parameter_list>();
        REQUIRE(list != nullptr);
        REQUIRE(list->size() == 2);
        CHECK(*(*list)[0].get_if<std::int64_t>() == 1);
        CHECK(*(*list)[1].as_string() == "two");
    }

    SUBCASE("Nested objects yield their item map") {
        const auto* brush = items.find("brush")->get_if<brushkit::parameter_map>();
        REQUIRE(brush != nullptr);
        const auto* angle = brush->find("angle")->get_if<brushkit::unit_float>();
        REQUIRE(angle != nullptr);
        CHECK(angle->value == doctest::Approx(-45.0));
        CHECK(angle->unit == brushkit::unit_kind::angle);
    }
}

TEST_CASE("Descriptor: malformed input") {
    SUBCASE("Unknown value tag reports offset and tag") {
        be_writer w;
        begin_descriptor(w, 1);
        const std::size_t tag_offset = w.size() + 8;
        w.key("Dmtr").text("Wrng").u32(0);

        brushkit::byte_cursor cursor(w.data());
        brushkit::descriptor desc;
        auto result = brushkit::parse_descriptor(cursor, desc);
        CHECK_FALSE(result.ok);
        CHECK(result.error == brushkit::decode_error::unrecognized_value_type);
        CHECK(result.offset == tag_offset);
        CHECK(result.tag == brushkit::make_tag("Wrng"));
    }

    SUBCASE("Nesting deeper than the limit") {
        be_writer w;
        begin_descriptor(w, 1);
        for (int i = 0; i < 3; ++i) {
            w.key("Brsh").text("Objc").unicode("").key("null").u32(1);
        }
        w.key("Dmtr").text("long").i32(1);

        brushkit::decode_options options;
        options.max_nesting_depth = 2;

        brushkit::byte_cursor cursor(w.data());
        brushkit::descriptor desc;
        auto result = brushkit::parse_descriptor(cursor, desc, options);
        CHECK_FALSE(result.ok);
        CHECK(result.error == brushkit::decode_error::limit_exceeded);

        brushkit::byte_cursor again(w.data());
        options.max_nesting_depth = 3;
        CHECK(brushkit::parse_descriptor(again, desc, options).ok);
    }

    SUBCASE("Item count larger than the data") {
        be_writer w;
        begin_descriptor(w, 1000);
        w.key("Dmtr").text("long").i32(1);

        brushkit::byte_cursor cursor(w.data());
        brushkit::descriptor desc;
        auto result = brushkit::parse_descriptor(cursor, desc);
        CHECK(result.error == brushkit::decode_error::invalid_format);
    }

    SUBCASE("Truncated value") {
        be_writer w;
        begin_descriptor(w, 1);
        w.key("Dmtr").text("doub").u32(0);

        brushkit::byte_cursor cursor(w.data());
        brushkit::descriptor desc;
        auto result = brushkit::parse_descriptor(cursor, desc);
        CHECK(result.error == brushkit::decode_error::out_of_bounds);
    }
}

TEST_CASE("Descriptor: strings") {
    SUBCASE("Compact strings trim trailing NUL") {
        be_writer w;
        w.u32(6).text("brush").u8(0);
        brushkit::byte_cursor cursor(w.data());
        std::string s;
        REQUIRE(brushkit::read_compact_string(cursor, s).ok);
        CHECK(s == "brush");
    }

    SUBCASE("Unicode strings convert to UTF-8") {
        be_writer w;
        w.u32(4).u16(0x00E9).u16(0xD83D).u16(0xDE00).u16(0);
        brushkit::byte_cursor cursor(w.data());
        std::string s;
        REQUIRE(brushkit::read_unicode_string(cursor, s).ok);
        CHECK(s == "\xC3\xA9\xF0\x9F\x98\x80");
    }

    SUBCASE("Unpaired surrogates become U+FFFD") {
        std::string s;
        {
            be_writer w;
            w.u32(1).u16(0xD800);
            brushkit::byte_cursor cursor(w.data());
            REQUIRE(brushkit::read_unicode_string(cursor, s).ok);
            CHECK(s == "\xEF\xBF\xBD");
        }
        {
            be_writer w;
            w.u32(2).u16(0xDC00).u16('x');
            brushkit::byte_cursor cursor(w.data());
            REQUIRE(brushkit::read_unicode_string(cursor, s).ok);
            CHECK(s == "\xEF\xBF\xBDx");
        }
        {
            be_writer w;
            w.u32(2).u16(0xDBFF).u16('y');
            brushkit::byte_cursor cursor(w.data());
            REQUIRE(brushkit::read_unicode_string(cursor, s).ok);
            CHECK(s == "\xEF\xBF\xBDy");
        }
    }

    SUBCASE("Unicode length past the end") {
        be_writer w;
        w.u32(10).u16('a');
        brushkit::byte_cursor cursor(w.data());
        std::string s;
        CHECK(brushkit::read_unicode_string(cursor, s).error == brushkit::decode_error::out_of_bounds);
    }

    SUBCASE("Dictionary lookups") {
        CHECK(brushkit::property_name(brushkit::make_tag("Spcn")) == "spacing");
        CHECK(brushkit::property_name(brushkit::make_tag("Wtdg")) == "wet_edges");
        CHECK(brushkit::property_name(brushkit::make_tag("Xxxx")).empty());
        CHECK(brushkit::unit_from_tag(brushkit::make_tag("#Rlt")) == brushkit::unit_kind::distance);
        CHECK(brushkit::unit_from_tag(brushkit::make_tag("#Foo")) == brushkit::unit_kind::unrecognized);
    }
}

TEST_CASE("Descriptor: typed value entry point") {
    be_writer w;
    w.text("long").i32(42);
    brushkit::byte_cursor cursor(w.data());
    brushkit::parameter_value value;
    REQUIRE(brushkit::parse_typed_value(cursor, value).ok);
    CHECK(*value.get_if<std::int64_t>() == 42);
}
