#include <brushkit/formats/gbr.hpp>
#include <brushkit/byte_cursor.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace brushkit {

namespace {

constexpr std::uint32_t GBR_VERSION = 2;
constexpr std::uint32_t GBR_MAGIC = make_tag("GIMP");

// Header layout
constexpr std::size_t GBR_MAGIC_OFFSET = 20;
constexpr std::size_t GBR_SPACING_OFFSET = 24;
constexpr std::size_t GBR_NAME_OFFSET = 28;
constexpr std::size_t GBR_MIN_HEADER_SIZE = 24;     // Through the magic
constexpr int GBR_MAX_CHANNELS = 4;
constexpr std::uint32_t MAX_GBR_DIMENSION = 0x7FFFFFFF;

struct gbr_record {
    std::uint32_t header_size = 0;
    std::uint32_t version = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t channels = 0;
    std::uint32_t magic = 0;
    std::uint32_t spacing = 0;
    bool has_spacing = false;
    std::string name;
    std::size_t pixel_offset = 0;
    std::size_t pixel_bytes = 0;
};

bool header_matches(std::span<const std::uint8_t> data, std::size_t offset) noexcept {
    if (offset > data.size() || data.size() - offset < GBR_MIN_HEADER_SIZE) {
        return false;
    }
    const auto* p = data.data() + offset;
    return read_be32(p + 4) == GBR_VERSION && read_be32(p + GBR_MAGIC_OFFSET) == GBR_MAGIC;
}

// Read one record header at offset. On success the pixel range is known, even if
// the pixels themselves run past the buffer.
decode_result read_record_header(std::span<const std::uint8_t> data, std::size_t offset,
                                 gbr_record& rec) {
    byte_cursor cursor(data, offset);
    if (offset > data.size()) {
        return decode_result::failure_at(decode_error::out_of_bounds, offset,
            "GBR record starts past end of data");
    }

    if (!cursor.read_u32(rec.header_size) || !cursor.read_u32(rec.version) ||
        !cursor.read_u32(rec.width) || !cursor.read_u32(rec.height) ||
        !cursor.read_u32(rec.channels) || !cursor.read_u32(rec.magic)) {
        return cursor.out_of_bounds("GBR header");
    }

    if (rec.version != GBR_VERSION) {
        return decode_result::failure_at(decode_error::unsupported_version, offset + 4,
            "Unsupported GBR version " + std::to_string(rec.version));
    }
    if (rec.magic != GBR_MAGIC) {
        return decode_result::failure_at(decode_error::unsupported_version, offset + GBR_MAGIC_OFFSET,
            "GBR magic mismatch", rec.magic);
    }
    if (rec.header_size < GBR_MIN_HEADER_SIZE) {
        return decode_result::failure_at(decode_error::malformed_header, offset,
            "GBR header size " + std::to_string(rec.header_size) + " is too small");
    }
    if (rec.channels == 0 || rec.channels > static_cast<std::uint32_t>(GBR_MAX_CHANNELS)) {
        return decode_result::failure_at(decode_error::unsupported_encoding, offset + 16,
            "Unsupported GBR channel count " + std::to_string(rec.channels));
    }

    if (rec.width > MAX_GBR_DIMENSION || rec.height > MAX_GBR_DIMENSION) {
        return decode_result::failure_at(decode_error::dimensions_exceeded, offset + 8,
            "GBR dimensions " + std::to_string(rec.width) + "x" + std::to_string(rec.height) +
            " exceed maximum supported size");
    }

    const std::size_t header_end = offset + rec.header_size;

    if (rec.header_size >= GBR_NAME_OFFSET) {
        if (data.size() - offset >= GBR_NAME_OFFSET) {
            rec.spacing = read_be32(data.data() + offset + GBR_SPACING_OFFSET);
            rec.has_spacing = true;
        }

        // Name runs from after the spacing field to the first NUL or the header end
        if (header_end <= data.size()) {
            const auto begin = data.begin() + static_cast<std::ptrdiff_t>(offset + GBR_NAME_OFFSET);
            const auto end = data.begin() + static_cast<std::ptrdiff_t>(header_end);
            rec.name.assign(begin, std::find(begin, end, std::uint8_t{0}));
        }
    }

    rec.pixel_offset = header_end;
    rec.pixel_bytes = static_cast<std::size_t>(rec.width) * rec.height * rec.channels;
    return decode_result::success();
}

decode_result decode_record_pixels(std::span<const std::uint8_t> data, const gbr_record& rec,
                                   const decode_options& options, pixel_matrix& pixels) {
    auto result = validate_dimensions(static_cast<int>(rec.width), static_cast<int>(rec.height),
                                      options, rec.pixel_offset);
    if (!result) return result;

    if (rec.pixel_offset > data.size() || data.size() - rec.pixel_offset < rec.pixel_bytes) {
        return decode_result::failure_at(decode_error::out_of_bounds, rec.pixel_offset,
            "GBR pixel data truncated: need " + std::to_string(rec.pixel_bytes) + " bytes");
    }

    const int width = static_cast<int>(rec.width);
    const int height = static_cast<int>(rec.height);
    const int channels = static_cast<int>(rec.channels);
    if (!pixels.reset(height, width, channels, 1)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate pixel matrix");
    }

    const auto src = data.subspan(rec.pixel_offset, rec.pixel_bytes);
    auto dst = pixels.mutable_samples<std::uint8_t>();
    std::copy(src.begin(), src.end(), dst.begin());
    return decode_result::success();
}

// Locate the end of the next line; npos if there is none
std::size_t find_newline(std::span<const std::uint8_t> data, std::size_t from) noexcept {
    for (std::size_t i = from; i < data.size(); ++i) {
        if (data[i] == '\n') {
            return i;
        }
    }
    return std::string::npos;
}

struct gih_preamble {
    std::size_t name_length = 0;
    std::size_t header_size = 0;
    int count = 0;
};

bool read_preamble(std::span<const std::uint8_t> data, gih_preamble& out) noexcept {
    const std::size_t first = find_newline(data, 0);
    if (first == std::string::npos) {
        return false;
    }
    const std::size_t second = find_newline(data, first + 1);
    if (second == std::string::npos) {
        return false;
    }

    // Count is the first space-delimited token of the second line
    const char* line = reinterpret_cast<const char*>(data.data()) + first + 1;
    const char* line_end = reinterpret_cast<const char*>(data.data()) + second;
    const char* token_end = std::find(line, line_end, ' ');
    while (token_end > line && (token_end[-1] == '\r' || token_end[-1] == '\t')) {
        --token_end;
    }

    int count = 0;
    const auto [ptr, ec] = std::from_chars(line, token_end, count);
    if (ec != std::errc{} || ptr != token_end || count < 0) {
        return false;
    }

    out.name_length = first;
    out.header_size = second + 1;
    out.count = count;
    return true;
}

} // namespace

// ============================================================================
// GBR Decoder
// ============================================================================

bool gbr_decoder::check(std::span<const std::uint8_t> data) noexcept {
    return header_matches(data, 0);
}

decode_result gbr_decoder::parse(std::span<const std::uint8_t> data,
                                 parsed_brush_file& out,
                                 const decode_options& options) {
    out = {};
    gbr_record rec;
    auto result = read_record_header(data, 0, rec);
    if (!result) return result;

    brush_sample sample;
    result = decode_record_pixels(data, rec, options, sample.pixels);
    if (!result) return result;

    if (!rec.name.empty()) {
        sample.name = rec.name;
    }
    if (rec.has_spacing) {
        parameter_map params;
        params.insert_or_assign("spacing", static_cast<std::int64_t>(rec.spacing));
        sample.parameters = std::move(params);
    }

    out.version = {static_cast<int>(rec.version), 0};
    return append_sample(out, std::move(sample), options);
}

// ============================================================================
// GIH Decoder
// ============================================================================

bool gih_decoder::check(std::span<const std::uint8_t> data) noexcept {
    gih_preamble preamble;
    return read_preamble(data, preamble);
}

decode_result gih_decoder::parse(std::span<const std::uint8_t> data,
                                 parsed_brush_file& out,
                                 const decode_options& options) {
    out = {};
    gih_preamble preamble;
    if (!read_preamble(data, preamble)) {
        return decode_result::failure_at(decode_error::malformed_header, 0,
            "GIH preamble needs a name line and a brush count line");
    }
    if (static_cast<std::size_t>(preamble.count) > options.max_samples) {
        return decode_result::failure(decode_error::limit_exceeded,
            "GIH brush count " + std::to_string(preamble.count) + " exceeds limit");
    }

    const std::string collection(reinterpret_cast<const char*>(data.data()), preamble.name_length);
    out.version = {static_cast<int>(GBR_VERSION), 0};

    std::size_t offset = preamble.header_size;
    for (int i = 0; i < preamble.count; ++i) {
        gbr_record rec;
        auto result = read_record_header(data, offset, rec);
        if (!result) {
            // Without a header the next record cannot be located
            out.member_failures.push_back(std::move(result));
            break;
        }
        offset = rec.pixel_offset + rec.pixel_bytes;

        brush_sample sample;
        result = decode_record_pixels(data, rec, options, sample.pixels);
        if (!result) {
            out.member_failures.push_back(std::move(result));
            continue;
        }

        sample.name = collection;
        result = append_sample(out, std::move(sample), options);
        if (!result) return result;
    }

    if (out.samples.empty() && !out.member_failures.empty()) {
        return out.member_failures.front();
    }
    return decode_result::success();
}

} // namespace brushkit
