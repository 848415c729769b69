#ifndef BRUSHKIT_FORMATS_SUT_HPP_
#define BRUSHKIT_FORMATS_SUT_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/containers.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Clip Studio Paint Sub Tool
// ============================================================================

/**
 * Clip Studio Paint .sut: an SQLite database holding one brush.
 *
 * The first Variant row supplies the parameters and the first Node row the
 * name (also stored as parameter "BrushName"). Every MaterialFile blob embeds a
 * PNG, located with find_embedded_image() and decoded to an RGBA sample. All
 * samples share the name and parameters.
 */
class BRUSHKIT_EXPORT sut_decoder {
public:
    static constexpr std::string_view name = "sut";
    static constexpr std::string_view extensions[] = {".sut"};

    /**
     * Check if data starts with the SQLite 3 file header.
     * @param data Raw file data
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Check if the database has a MaterialFile table.
     */
    [[nodiscard]] static bool check(const table_source& tables) noexcept;

    /**
     * Decode the brush textures and parameters.
     * @param tables Opened database
     * @param bitmaps Decoder for the embedded PNG streams
     * @param out Receives one sample per decodable MaterialFile row; cleared first
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result parse(const table_source& tables,
                                              const bitmap_decoder& bitmaps,
                                              parsed_brush_file& out,
                                              const decode_options& options = {});
};

} // namespace brushkit

#endif // BRUSHKIT_FORMATS_SUT_HPP_
