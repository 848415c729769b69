#ifndef BRUSHKIT_BOUNDARY_SCAN_HPP_
#define BRUSHKIT_BOUNDARY_SCAN_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Container Boundary Scanner
// ============================================================================

/**
 * Half-open byte range [begin, end) within a blob.
 */
struct byte_range {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t size() const noexcept { return end > begin ? end - begin : 0; }

    friend bool operator==(const byte_range&, const byte_range&) = default;
};

/**
 * Signatures delimiting an embedded image. Defaults describe a PNG stream:
 * "PNG" follows the 0x89 lead byte, and "IEND" is followed by a 4-byte CRC.
 */
struct image_signature {
    std::string_view start = "PNG";
    std::string_view end = "IEND";
    std::size_t bytes_before_start = 1;
    std::size_t bytes_after_end = 8;
};

/**
 * Locate the one valid image embedded in a blob that may also hold stale copies.
 *
 * Every occurrence of both signatures is collected. The last start and the last end
 * delimit the image: [last_start - bytes_before_start, last_end + bytes_after_end),
 * clamped to the blob.
 *
 * @param blob Opaque container cell
 * @param range Receives the image byte range
 * @param signature Start and end markers
 * @return no_image_found if either signature is missing or the end precedes the start
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result find_embedded_image(std::span<const std::uint8_t> blob,
                                                                 byte_range& range,
                                                                 const image_signature& signature = {});

} // namespace brushkit

#endif // BRUSHKIT_BOUNDARY_SCAN_HPP_
