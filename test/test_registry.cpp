#include <doctest/doctest.h>
#include <brushkit/codec.hpp>

#include "helpers/brush_builder.hpp"

#include <memory>
#include <string>
#include <vector>

using test_helpers::be_writer;

namespace {

std::vector<std::uint8_t> tiny_gbr() {
    be_writer w;
    w.u32(29).u32(2).u32(1).u32(1).u32(1).text("GIMP").u32(10).u8(0).u8(42);
    return w.data();
}

std::vector<std::uint8_t> tiny_abr6() {
    be_writer w;
    w.u16(6).u16(2).text("8BIM").text("samp").u32(0);
    return w.data();
}

std::vector<std::uint8_t> tiny_abr1() {
    be_writer w;
    w.u16(1).u16(0);
    return w.data();
}

std::vector<std::uint8_t> tiny_gih() {
    be_writer w;
    w.text("Hose\n1 ncells:1\n").bytes(tiny_gbr());
    return w.data();
}

class marker_decoder : public brushkit::decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "marker"; }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return EXTENSIONS;
    }

    [[nodiscard]] bool check(std::span<const std::uint8_t> data) const noexcept override {
        return data.size() >= 4 && data[0] == 'M' && data[1] == 'R' && data[2] == 'K' && data[3] == '!';
    }

    [[nodiscard]] brushkit::decode_result parse(std::span<const std::uint8_t>,
                                                brushkit::parsed_brush_file& out,
                                                const brushkit::decode_options&) const override {
        out.version = {9, 9};
        return brushkit::decode_result::success();
    }

private:
    static constexpr std::string_view EXTENSIONS[] = {".mrk"};
};

} // namespace

TEST_CASE("Registry: built-in decoders in sniff order") {
    const auto& registry = brushkit::decoder_registry::instance();
    REQUIRE(registry.decoder_count() >= 4);
    CHECK(registry.decoder_at(0)->name() == "gbr");
    CHECK(registry.decoder_at(1)->name() == "abr");
    CHECK(registry.decoder_at(2)->name() == "abr_legacy");
    CHECK(registry.decoder_at(3)->name() == "gih");
    CHECK(registry.decoder_at(1000) == nullptr);
}

TEST_CASE("Registry: content sniffing") {
    const auto& registry = brushkit::decoder_registry::instance();
    CHECK(registry.find_decoder(tiny_gbr())->name() == "gbr");
    CHECK(registry.find_decoder(tiny_abr6())->name() == "abr");
    CHECK(registry.find_decoder(tiny_abr1())->name() == "abr_legacy");
    CHECK(registry.find_decoder(tiny_gih())->name() == "gih");
    CHECK(registry.find_decoder(std::vector<std::uint8_t>{0xFF, 0xD8, 0xFF, 0xE0}) == nullptr);
}

TEST_CASE("Registry: lookup by name and extension") {
    const auto& registry = brushkit::decoder_registry::instance();
    REQUIRE(registry.find_decoder(std::string_view("gih")) != nullptr);
    CHECK(registry.find_decoder(std::string_view("png")) == nullptr);

    CHECK(registry.find_decoder_for_extension(".ABR", tiny_abr1())->name() == "abr_legacy");
    CHECK(registry.find_decoder_for_extension(".abr", tiny_abr6())->name() == "abr");

    // Mislabelled files fall back to sniffing
    CHECK(registry.find_decoder_for_extension(".gih", tiny_gbr())->name() == "gbr");
    CHECK(registry.find_decoder_for_extension(".gbr", std::vector<std::uint8_t>{1, 2, 3}) == nullptr);
}

TEST_CASE("Format routing by extension") {
    CHECK(brushkit::format_for_extension(".gbr") == brushkit::brush_format::gbr);
    CHECK(brushkit::format_for_extension("GIH") == brushkit::brush_format::gih);
    CHECK(brushkit::format_for_extension(".Abr") == brushkit::brush_format::abr);
    CHECK(brushkit::format_for_extension(".brushset") == brushkit::brush_format::brushset);
    CHECK(brushkit::format_for_extension(".brush") == brushkit::brush_format::brushset);
    CHECK(brushkit::format_for_extension("sut") == brushkit::brush_format::sut);
    CHECK(brushkit::format_for_extension(".png") == brushkit::brush_format::unknown);
    CHECK(brushkit::format_for_extension("") == brushkit::brush_format::unknown);
    CHECK(std::string(brushkit::to_string(brushkit::brush_format::brushset)) == "brushset");
}

TEST_CASE("Convenience parse") {
    SUBCASE("Auto-detect") {
        brushkit::parsed_brush_file file;
        REQUIRE(brushkit::parse(tiny_gbr(), file).ok);
        REQUIRE(file.samples.size() == 1);
        CHECK(file.samples[0].pixels.at(0, 0) == 42);
    }

    SUBCASE("Explicit decoder") {
        brushkit::parsed_brush_file file;
        CHECK(brushkit::parse(tiny_abr6(), file, "abr").ok);
        CHECK(file.version == brushkit::format_version{6, 2});
        CHECK(brushkit::parse(tiny_abr6(), file, "nope").error == brushkit::decode_error::invalid_format);
    }

    SUBCASE("Unknown data") {
        brushkit::parsed_brush_file file;
        CHECK(brushkit::parse(std::vector<std::uint8_t>{0, 0, 0}, file).error ==
              brushkit::decode_error::invalid_format);
    }
}

TEST_CASE("Registry: runtime registration") {
    auto& registry = brushkit::decoder_registry::instance();
    if (registry.find_decoder(std::string_view("marker")) == nullptr) {
        registry.register_decoder(std::make_unique<marker_decoder>());
    }
    registry.register_decoder(nullptr);

    const std::vector<std::uint8_t> data = {'M', 'R', 'K', '!'};
    const auto* dec = registry.find_decoder_for_extension(".MRK", data);
    REQUIRE(dec != nullptr);
    CHECK(dec->name() == "marker");

    brushkit::parsed_brush_file file;
    REQUIRE(brushkit::parse(data, file).ok);
    CHECK(file.version == brushkit::format_version{9, 9});
}
