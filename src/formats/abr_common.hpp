#ifndef BRUSHKIT_FORMATS_ABR_COMMON_HPP_
#define BRUSHKIT_FORMATS_ABR_COMMON_HPP_

#include <brushkit/byte_cursor.hpp>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/types.hpp>

#include <cstddef>
#include <cstdint>

namespace brushkit::abr {

// ============================================================================
// ABR Common Definitions
// ============================================================================

// Compression flags
constexpr std::uint8_t COMPRESSION_RAW = 0;
constexpr std::uint8_t COMPRESSION_RLE = 1;

// Bounding box and sample format preceding every brush plane
struct plane_header {
    std::int32_t top = 0;
    std::int32_t left = 0;
    std::int32_t bottom = 0;
    std::int32_t right = 0;
    std::uint16_t depth_bits = 0;
    std::uint8_t compression = 0;

    [[nodiscard]] std::int64_t height() const noexcept {
        return static_cast<std::int64_t>(bottom) - top;
    }
    [[nodiscard]] std::int64_t width() const noexcept {
        return static_cast<std::int64_t>(right) - left;
    }
};

enum class plane_status {
    decoded,
    segmented   // Too tall for a single block; not decoded
};

/**
 * Read the bounding box, depth and compression flag at the cursor.
 */
[[nodiscard]] decode_result read_plane_header(byte_cursor& cursor, plane_header& header);

/**
 * Decode the plane that follows a plane header.
 * @param cursor Positioned just after the header
 * @param end Offset one past the last byte available to this plane
 * @param header Header read by read_plane_header
 * @param options Dimension limits
 * @param pixels Receives a height x width matrix
 * @param status Set to segmented when the plane is skipped
 */
[[nodiscard]] decode_result decode_plane(const byte_cursor& cursor,
                                         std::size_t end,
                                         const plane_header& header,
                                         const decode_options& options,
                                         pixel_matrix& pixels,
                                         plane_status& status);

} // namespace brushkit::abr

#endif // BRUSHKIT_FORMATS_ABR_COMMON_HPP_
