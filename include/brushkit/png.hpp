#ifndef BRUSHKIT_PNG_HPP_
#define BRUSHKIT_PNG_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/containers.hpp>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace brushkit {

// ============================================================================
// PNG Bitmap Decoder
// ============================================================================

/**
 * bitmap_decoder backed by lodepng. Every PNG is expanded to 8-bit RGBA.
 */
class BRUSHKIT_EXPORT png_bitmap_decoder : public bitmap_decoder {
public:
    explicit png_bitmap_decoder(const decode_options& options = {});

    /**
     * Check if data starts with the PNG signature.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> bytes,
                                       pixel_matrix& pixels) const override;

private:
    decode_options options_;
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a pixel matrix as PNG.
 * One channel is written as grayscale, two as gray+alpha, three as RGB and four
 * as RGBA. Samples wider than 8 bits are reduced with pixel_matrix::to_8bit().
 * @param pixels Source matrix
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] BRUSHKIT_EXPORT std::vector<std::uint8_t> encode_png(const pixel_matrix& pixels);

/**
 * Save a pixel matrix to a PNG file.
 * @param pixels Source matrix
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] BRUSHKIT_EXPORT bool save_png(const pixel_matrix& pixels,
                                            const std::filesystem::path& path);

} // namespace brushkit

#endif // BRUSHKIT_PNG_HPP_
