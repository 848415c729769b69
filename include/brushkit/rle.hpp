#ifndef BRUSHKIT_RLE_HPP_
#define BRUSHKIT_RLE_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>

namespace brushkit {

// ============================================================================
// Scanline RLE Codec
// ============================================================================

/**
 * Decode one packed run-length compressed plane (Photoshop "PackBits" with a
 * per-row byte count table).
 *
 * Layout: height big-endian u16 scanline byte counts, then the packed rows. For each
 * row, control bytes are consumed until the running cursor reaches the row's start
 * plus its declared count:
 *   - 0..127:   literal run of (n + 1) samples
 *   - 128:      no-op
 *   - 129..255: one sample repeated (256 - n) + 1 times
 *
 * Rows that decode short are zero-filled. A run that would write past the row
 * width fails with decode_error::invalid_format.
 *
 * @param data Packed plane, starting at the byte count table
 * @param height Rows
 * @param width Columns
 * @param depth_bytes Sample width (1, 2 or 4); samples are big-endian
 * @param out Receives a height x width matrix
 * @return Decode result; error offsets are relative to data
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result decode_scanline_rle(std::span<const std::uint8_t> data,
                                                                 int height,
                                                                 int width,
                                                                 int depth_bytes,
                                                                 pixel_matrix& out);

/**
 * Read height x width uncompressed big-endian samples into a planar matrix.
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result decode_raw_plane(std::span<const std::uint8_t> data,
                                                              int height,
                                                              int width,
                                                              int depth_bytes,
                                                              pixel_matrix& out);

} // namespace brushkit

#endif // BRUSHKIT_RLE_HPP_
