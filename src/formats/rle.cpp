#include <brushkit/rle.hpp>
#include <brushkit/byte_cursor.hpp>

#include <string>
#include <vector>

namespace brushkit {

namespace {

constexpr std::uint8_t RLE_NOOP = 128;

bool read_sample(byte_cursor& cursor, int depth_bytes, std::uint32_t& out) {
    std::int64_t v = 0;
    if (!cursor.read_fixed(static_cast<std::size_t>(depth_bytes), false, v)) {
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool valid_depth(int depth_bytes) {
    return depth_bytes == 1 || depth_bytes == 2 || depth_bytes == 4;
}

} // namespace

decode_result decode_scanline_rle(std::span<const std::uint8_t> data,
                                  int height,
                                  int width,
                                  int depth_bytes,
                                  pixel_matrix& out) {
    if (height < 0 || width < 0) {
        return decode_result::failure(decode_error::invalid_format, "Negative plane dimensions");
    }
    if (!valid_depth(depth_bytes)) {
        return decode_result::failure(decode_error::unsupported_bit_depth,
            "Unsupported sample width: " + std::to_string(depth_bytes) + " bytes");
    }

    byte_cursor cursor(data);
    if (static_cast<std::size_t>(height) * 2 > cursor.remaining()) {
        return decode_result::failure_at(decode_error::out_of_bounds, 0,
            "RLE scanline byte count table truncated");
    }

    // Scanline byte counts
    std::vector<std::uint16_t> line_bytes(static_cast<std::size_t>(height));
    for (auto& count : line_bytes) {
        if (!cursor.read_u16(count)) {
            return cursor.out_of_bounds("RLE scanline byte counts");
        }
    }

    if (!out.reset(height, width, 1, depth_bytes)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate plane");
    }

    if (height == 0 || width == 0) {
        return decode_result::success();
    }

    for (int y = 0; y < height; ++y) {
        const std::size_t end = cursor.offset() + line_bytes[static_cast<std::size_t>(y)];
        int x = 0;

        while (cursor.offset() < end) {
            std::uint8_t n = 0;
            if (!cursor.read_u8(n)) {
                return cursor.out_of_bounds("RLE control byte");
            }

            if (n == RLE_NOOP) {
                continue;
            }

            if (n < RLE_NOOP) {
                const int count = n + 1;
                if (x + count > width) {
                    return decode_result::failure_at(decode_error::invalid_format, cursor.offset() - 1,
                        "RLE literal run exceeds row " + std::to_string(y) + " width");
                }
                for (int i = 0; i < count; ++i) {
                    std::uint32_t sample = 0;
                    if (!read_sample(cursor, depth_bytes, sample)) {
                        return cursor.out_of_bounds("RLE literal run");
                    }
                    out.set(y, x++, 0, sample);
                }
            } else {
                const int count = (256 - n) + 1;
                if (x + count > width) {
                    return decode_result::failure_at(decode_error::invalid_format, cursor.offset() - 1,
                        "RLE repeat run exceeds row " + std::to_string(y) + " width");
                }
                std::uint32_t sample = 0;
                if (!read_sample(cursor, depth_bytes, sample)) {
                    return cursor.out_of_bounds("RLE repeat run");
                }
                for (int i = 0; i < count; ++i) {
                    out.set(y, x++, 0, sample);
                }
            }
        }
    }

    return decode_result::success();
}

decode_result decode_raw_plane(std::span<const std::uint8_t> data,
                               int height,
                               int width,
                               int depth_bytes,
                               pixel_matrix& out) {
    if (height < 0 || width < 0) {
        return decode_result::failure(decode_error::invalid_format, "Negative plane dimensions");
    }
    if (!valid_depth(depth_bytes)) {
        return decode_result::failure(decode_error::unsupported_bit_depth,
            "Unsupported sample width: " + std::to_string(depth_bytes) + " bytes");
    }

    const std::size_t needed = static_cast<std::size_t>(height) * static_cast<std::size_t>(width) *
                               static_cast<std::size_t>(depth_bytes);
    if (data.size() < needed) {
        return decode_result::failure_at(decode_error::out_of_bounds, data.size(),
            "Uncompressed plane truncated: need " + std::to_string(needed) + " bytes");
    }

    if (!out.reset(height, width, 1, depth_bytes)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate plane");
    }

    byte_cursor cursor(data);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            std::uint32_t sample = 0;
            if (!read_sample(cursor, depth_bytes, sample)) {
                return cursor.out_of_bounds("uncompressed plane");
            }
            out.set(y, x, 0, sample);
        }
    }

    return decode_result::success();
}

} // namespace brushkit
