#include <brushkit/codec.hpp>
#include <brushkit/formats/abr.hpp>
#include <brushkit/formats/abr_legacy.hpp>
#include <brushkit/formats/gbr.hpp>

#include <algorithm>
#include <cctype>

namespace brushkit {

// ============================================================================
// Decoder Wrappers
// ============================================================================

namespace {

class gbr_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return gbr_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return gbr_decoder::extensions;
    }

    [[nodiscard]] bool check(std::span<const std::uint8_t> data) const noexcept override {
        return gbr_decoder::check(data);
    }

    [[nodiscard]] decode_result parse(std::span<const std::uint8_t> data,
                                      parsed_brush_file& out,
                                      const decode_options& options) const override {
        return gbr_decoder::parse(data, out, options);
    }
};

class abr_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return abr_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return abr_decoder::extensions;
    }

    [[nodiscard]] bool check(std::span<const std::uint8_t> data) const noexcept override {
        return abr_decoder::check(data);
    }

    [[nodiscard]] decode_result parse(std::span<const std::uint8_t> data,
                                      parsed_brush_file& out,
                                      const decode_options& options) const override {
        return abr_decoder::parse(data, out, options);
    }
};

class abr_legacy_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return abr_legacy_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return abr_legacy_decoder::extensions;
    }

    [[nodiscard]] bool check(std::span<const std::uint8_t> data) const noexcept override {
        return abr_legacy_decoder::check(data);
    }

    [[nodiscard]] decode_result parse(std::span<const std::uint8_t> data,
                                      parsed_brush_file& out,
                                      const decode_options& options) const override {
        return abr_legacy_decoder::parse(data, out, options);
    }
};

class gih_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return gih_decoder::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return gih_decoder::extensions;
    }

    [[nodiscard]] bool check(std::span<const std::uint8_t> data) const noexcept override {
        return gih_decoder::check(data);
    }

    [[nodiscard]] decode_result parse(std::span<const std::uint8_t> data,
                                      parsed_brush_file& out,
                                      const decode_options& options) const override {
        return gih_decoder::parse(data, out, options);
    }
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

bool lists_extension(const decoder& dec, std::string_view extension) noexcept {
    const auto exts = dec.extensions();
    return std::any_of(exts.begin(), exts.end(), [&](std::string_view e) {
        return iequals(e, extension);
    });
}

} // namespace

// ============================================================================
// Decoder Registry
// ============================================================================

decoder_registry& decoder_registry::instance() {
    static decoder_registry registry;
    return registry;
}

decoder_registry::decoder_registry() {
    register_builtin_decoders();
}

decoder_registry::~decoder_registry() = default;

void decoder_registry::register_builtin_decoders() {
    decoders_.push_back(std::make_unique<gbr_decoder_impl>());
    decoders_.push_back(std::make_unique<abr_decoder_impl>());
    decoders_.push_back(std::make_unique<abr_legacy_decoder_impl>());
    decoders_.push_back(std::make_unique<gih_decoder_impl>());
}

void decoder_registry::register_decoder(std::unique_ptr<decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const decoder* decoder_registry::find_decoder(std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (dec->check(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* decoder_registry::find_decoder(std::string_view name) const {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* decoder_registry::find_decoder_for_extension(std::string_view extension,
                                                            std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (lists_extension(*dec, extension) && dec->check(data)) {
            return dec.get();
        }
    }
    return find_decoder(data);
}

// ============================================================================
// Format Routing
// ============================================================================

const char* to_string(brush_format format) noexcept {
    switch (format) {
        case brush_format::unknown: return "unknown";
        case brush_format::gbr: return "gbr";
        case brush_format::gih: return "gih";
        case brush_format::abr: return "abr";
        case brush_format::brushset: return "brushset";
        case brush_format::sut: return "sut";
    }
    return "unknown";
}

brush_format format_for_extension(std::string_view extension) noexcept {
    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }

    if (iequals(extension, "gbr")) return brush_format::gbr;
    if (iequals(extension, "gih")) return brush_format::gih;
    if (iequals(extension, "abr")) return brush_format::abr;
    if (iequals(extension, "brushset") || iequals(extension, "brush")) return brush_format::brushset;
    if (iequals(extension, "sut")) return brush_format::sut;
    return brush_format::unknown;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result parse(std::span<const std::uint8_t> data,
                    parsed_brush_file& out,
                    const decode_options& options) {
    out = {};
    const auto* dec = decoder_registry::instance().find_decoder(data);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format, "Unknown brush format");
    }
    return dec->parse(data, out, options);
}

decode_result parse(std::span<const std::uint8_t> data,
                    parsed_brush_file& out,
                    std::string_view decoder_name,
                    const decode_options& options) {
    out = {};
    const auto* dec = decoder_registry::instance().find_decoder(decoder_name);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("Unknown decoder: ") + std::string(decoder_name));
    }
    return dec->parse(data, out, options);
}

} // namespace brushkit
