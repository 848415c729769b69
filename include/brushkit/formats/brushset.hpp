#ifndef BRUSHKIT_FORMATS_BRUSHSET_HPP_
#define BRUSHKIT_FORMATS_BRUSHSET_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/containers.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Procreate Brush Set
// ============================================================================

/**
 * Procreate .brushset / .brush: a zip archive with one folder per brush.
 *
 * Each "<folder>/Shape.png" and "<folder>/Grain.png" becomes a sample, taken from
 * the first channel of the image. Grain images are flagged as secondary
 * textures. The sibling "<folder>/Brush.archive" keyed archive supplies the
 * name and parameters. Members whose path contains "Reset" are ignored.
 */
class BRUSHKIT_EXPORT brushset_decoder {
public:
    static constexpr std::string_view name = "brushset";
    static constexpr std::string_view extensions[] = {".brushset", ".brush"};

    /**
     * Check if data starts with a zip local file header.
     * @param data Raw file data
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Check if the archive holds at least one brush shape or grain image.
     */
    [[nodiscard]] static bool check(const archive_source& archive) noexcept;

    /**
     * Decode every shape and grain image.
     * @param archive Opened archive
     * @param plist Property list reader for Brush.archive members
     * @param bitmaps Decoder for the PNG members
     * @param out Receives one sample per image, in archive order; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(const archive_source& archive,
                                              const property_list_reader& plist,
                                              const bitmap_decoder& bitmaps,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

} // namespace brushkit

#endif // BRUSHKIT_FORMATS_BRUSHSET_HPP_
