#include <brushkit/png.hpp>
#include <brushkit/byte_cursor.hpp>
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <string>

namespace brushkit {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR chunk structure:
// Offset 8-11: IHDR length (should be 13)
// Offset 12-15: IHDR type ("IHDR")
// Offset 16-19: Width (big-endian)
// Offset 20-23: Height (big-endian)
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_IHDR_WIDTH_OFFSET = 16;
constexpr std::size_t PNG_IHDR_HEIGHT_OFFSET = 20;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;
constexpr std::uint32_t PNG_IHDR_TYPE = make_tag("IHDR");
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;

constexpr int RGBA_CHANNELS = 4;

LodePNGColorType color_type_for(int channels) {
    switch (channels) {
        case 1: return LCT_GREY;
        case 2: return LCT_GREY_ALPHA;
        case 3: return LCT_RGB;
        default: return LCT_RGBA;
    }
}

} // namespace

// ============================================================================
// PNG Bitmap Decoder
// ============================================================================

png_bitmap_decoder::png_bitmap_decoder(const decode_options& options)
    : options_(options) {}

bool png_bitmap_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }
    return std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin());
}

decode_result png_bitmap_decoder::decode(std::span<const std::uint8_t> bytes,
                                         pixel_matrix& pixels) const {
    if (!sniff(bytes)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid PNG stream");
    }

    constexpr auto max_int = static_cast<std::uint32_t>(std::numeric_limits<int>::max());

    // Pre-decode dimension check from IHDR chunk to avoid inflating huge images
    if (bytes.size() >= PNG_MIN_SIZE_FOR_DIMENSIONS &&
        read_be32(bytes.data() + PNG_IHDR_LENGTH_OFFSET) == PNG_IHDR_LENGTH &&
        read_be32(bytes.data() + PNG_IHDR_TYPE_OFFSET) == PNG_IHDR_TYPE) {
        const std::uint32_t ihdr_width = read_be32(bytes.data() + PNG_IHDR_WIDTH_OFFSET);
        const std::uint32_t ihdr_height = read_be32(bytes.data() + PNG_IHDR_HEIGHT_OFFSET);

        if (ihdr_width > max_int || ihdr_height > max_int) {
            return decode_result::failure(decode_error::dimensions_exceeded,
                "PNG dimensions exceed maximum supported size");
        }

        auto result = validate_dimensions(static_cast<int>(ihdr_width),
                                          static_cast<int>(ihdr_height), options_);
        if (!result) return result;
    }

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> rgba;

    unsigned error = lodepng::decode(rgba, width, height, bytes.data(), bytes.size());
    if (error) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    if (width > max_int || height > max_int) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG dimensions exceed maximum supported size");
    }

    auto result = validate_dimensions(static_cast<int>(width), static_cast<int>(height), options_);
    if (!result) return result;

    if (!pixels.reset(static_cast<int>(height), static_cast<int>(width), RGBA_CHANNELS, 1)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate pixel matrix");
    }

    auto dst = pixels.mutable_samples<std::uint8_t>();
    if (rgba.size() != dst.size()) {
        return decode_result::failure(decode_error::internal_error, "Unexpected PNG buffer size");
    }
    std::copy(rgba.begin(), rgba.end(), dst.begin());

    return decode_result::success();
}

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const pixel_matrix& pixels) {
    if (pixels.empty() || pixels.channels() < 1 || pixels.channels() > RGBA_CHANNELS) {
        return {};
    }

    const pixel_matrix narrowed = pixels.sample_bytes() == 1 ? pixels : pixels.to_8bit();
    const auto samples = narrowed.samples<std::uint8_t>();
    const std::vector<std::uint8_t> raw(samples.begin(), samples.end());

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, raw,
                                     static_cast<unsigned>(narrowed.width()),
                                     static_cast<unsigned>(narrowed.height()),
                                     color_type_for(narrowed.channels()), 8);
    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const pixel_matrix& pixels, const std::filesystem::path& path) {
    auto png_data = encode_png(pixels);
    if (png_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    return file.good();
}

} // namespace brushkit
