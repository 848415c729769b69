#ifndef BRUSHKIT_FORMATS_ABR_HPP_
#define BRUSHKIT_FORMATS_ABR_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Photoshop Brush, version 6 and later
// ============================================================================

/**
 * Photoshop ABR version 6+: a u16 major and u16 minor version followed by
 * "8BIM" tagged blocks.
 *
 * - "samp" blocks hold the sampled images. Minor version 1 stores each plane
 *   inline; minor version 2 wraps it in a virtual memory array list, of which
 *   the last decodable channel is kept.
 * - "desc" blocks hold the preset descriptor. Each preset is matched to its
 *   image by the "sampledData" identifier and supplies the sample's name and
 *   parameter map.
 *
 * Other blocks ("patt", "phry", ...) are skipped.
 */
class BRUSHKIT_EXPORT abr_decoder {
public:
    static constexpr std::string_view name = "abr";
    static constexpr std::string_view extensions[] = {".abr"};

    /**
     * Check if data starts with an ABR 6+ header and a sampled-image block.
     * @param data Raw file data
     * @return true if major >= 6, minor is 1 or 2 and "8BIMsamp" follows
     */
    [[nodiscard]] static bool check(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode all sampled brushes and attach preset names and parameters.
     * @param data Raw file data
     * @param out Receives version and one sample per decodable image; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(std::span<const std::uint8_t> data,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

} // namespace brushkit

#endif // BRUSHKIT_FORMATS_ABR_HPP_
