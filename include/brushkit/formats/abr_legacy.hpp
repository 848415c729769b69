#ifndef BRUSHKIT_FORMATS_ABR_LEGACY_HPP_
#define BRUSHKIT_FORMATS_ABR_LEGACY_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Photoshop Brush, versions 1 and 2
// ============================================================================

/**
 * Photoshop ABR version 1/2: a u16 version and u16 brush count followed by
 * (u16 type, u32 length) entries.
 *
 * Only sampled brushes (type 2) are decoded. Computed brushes and segmented
 * images (taller than 16384 rows) are skipped without error. Samples carry
 * no name or parameters.
 */
class BRUSHKIT_EXPORT abr_legacy_decoder {
public:
    static constexpr std::string_view name = "abr_legacy";
    static constexpr std::string_view extensions[] = {".abr"};

    /**
     * Check if data starts with an ABR version 1 or 2 header.
     * @param data Raw file data
     * @return true if the version field is 1 or 2
     */
    [[nodiscard]] static bool check(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode all sampled brushes.
     * @param data Raw file data
     * @param out Receives version and one sample per sampled brush; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(std::span<const std::uint8_t> data,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

} // namespace brushkit

#endif // BRUSHKIT_FORMATS_ABR_LEGACY_HPP_
