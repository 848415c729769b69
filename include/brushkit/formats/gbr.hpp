#ifndef BRUSHKIT_FORMATS_GBR_HPP_
#define BRUSHKIT_FORMATS_GBR_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// GIMP Brush (GBR)
// ============================================================================

/**
 * GIMP brush, version 2.
 *
 * Header (big-endian): header size, version, width, height, channel count,
 * magic "GIMP", spacing, NUL-terminated UTF-8 name. Raw 8-bit pixels follow the
 * header, one sample per channel.
 *
 * The single sample carries the stored name and a "spacing" parameter.
 */
class BRUSHKIT_EXPORT gbr_decoder {
public:
    static constexpr std::string_view name = "gbr";
    static constexpr std::string_view extensions[] = {".gbr"};

    /**
     * Check if data starts with a version 2 GBR header.
     * @param data Raw file data
     * @return true if the version is 2 and the magic matches
     */
    [[nodiscard]] static bool check(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode the brush.
     * @param data Raw file data
     * @param out Receives version and the single sample; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(std::span<const std::uint8_t> data,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

// ============================================================================
// GIMP Image Hose (GIH)
// ============================================================================

/**
 * GIMP image pipe: a two-line text preamble (collection name, then a line whose
 * first token is the brush count) followed by that many GBR records back to back.
 *
 * Every sample is named after the collection and has no parameters.
 */
class BRUSHKIT_EXPORT gih_decoder {
public:
    static constexpr std::string_view name = "gih";
    static constexpr std::string_view extensions[] = {".gih"};

    /**
     * Check if data starts with a readable GIH preamble.
     * @param data Raw file data
     * @return true if there are two preamble lines and the count parses
     */
    [[nodiscard]] static bool check(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode all brush records.
     * @param data Raw file data
     * @param out Receives one sample per decodable record; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(std::span<const std::uint8_t> data,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

} // namespace brushkit

#endif // BRUSHKIT_FORMATS_GBR_HPP_
