#include "abr_common.hpp"
#include "decode_helpers.hpp"
#include <brushkit/rle.hpp>

#include <algorithm>
#include <limits>
#include <string>

namespace brushkit::abr {

decode_result read_plane_header(byte_cursor& cursor, plane_header& header) {
    if (!cursor.read_i32(header.top) || !cursor.read_i32(header.left) ||
        !cursor.read_i32(header.bottom) || !cursor.read_i32(header.right)) {
        return cursor.out_of_bounds("brush bounding box");
    }
    if (!cursor.read_u16(header.depth_bits) || !cursor.read_u8(header.compression)) {
        return cursor.out_of_bounds("brush depth and compression");
    }
    return decode_result::success();
}

decode_result decode_plane(const byte_cursor& cursor,
                           std::size_t end,
                           const plane_header& header,
                           const decode_options& options,
                           pixel_matrix& pixels,
                           plane_status& status) {
    const std::size_t base = cursor.offset();
    const std::int64_t height = header.height();
    const std::int64_t width = header.width();

    if (height > SEGMENTED_HEIGHT_THRESHOLD) {
        status = plane_status::segmented;
        return decode_result::success();
    }
    status = plane_status::decoded;

    if (height < 0 || width < 0) {
        return decode_result::failure_at(decode_error::invalid_format, base,
            "Inverted brush bounding box");
    }
    if (width > std::numeric_limits<int>::max()) {
        return decode_result::failure_at(decode_error::dimensions_exceeded, base,
            "Brush width " + std::to_string(width) + " exceeds limits");
    }
    auto result = validate_dimensions(static_cast<int>(width), static_cast<int>(height), options, base);
    if (!result) return result;

    if (header.depth_bits != 8 && header.depth_bits != 16 && header.depth_bits != 32) {
        return decode_result::failure_at(decode_error::unsupported_bit_depth, base,
            "Unsupported brush depth " + std::to_string(header.depth_bits) + " bits");
    }
    const int depth_bytes = header.depth_bits / 8;

    const std::size_t limit = std::min(end, cursor.size());
    if (limit < base) {
        return decode_result::failure_at(decode_error::out_of_bounds, base,
            "Brush plane starts past the end of its entry");
    }
    const auto plane = cursor.data().subspan(base, limit - base);

    switch (header.compression) {
        case COMPRESSION_RAW:
            result = decode_raw_plane(plane, static_cast<int>(height), static_cast<int>(width),
                                      depth_bytes, pixels);
            break;
        case COMPRESSION_RLE:
            result = decode_scanline_rle(plane, static_cast<int>(height), static_cast<int>(width),
                                         depth_bytes, pixels);
            break;
        default:
            return decode_result::failure_at(decode_error::unsupported_encoding, base - 1,
                "Unsupported brush compression " + std::to_string(header.compression));
    }

    if (!result) {
        // Codec offsets are relative to the plane
        result.offset += base;
        result.message = "Brush plane at offset " + std::to_string(base) + ": " + result.message;
    }
    return result;
}

} // namespace brushkit::abr
