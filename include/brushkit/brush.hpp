#ifndef BRUSHKIT_BRUSH_HPP_
#define BRUSHKIT_BRUSH_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/types.hpp>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/parameter_value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brushkit {

// ============================================================================
// Brush Sample
// ============================================================================

/**
 * One extracted brush: a pixel matrix plus whatever name and parameters the
 * format stores alongside it.
 */
struct brush_sample {
    pixel_matrix pixels;
    std::optional<std::string> name;
    std::optional<parameter_map> parameters;
    std::optional<std::string> identifier;     // Per-brush id (ABR sample UUID, Procreate folder)
    bool is_secondary_texture = false;         // Procreate grain texture

    friend bool operator==(const brush_sample&, const brush_sample&) = default;
};

// ============================================================================
// Parsed Brush File
// ============================================================================

struct parsed_brush_file {
    format_version version;
    std::vector<brush_sample> samples;

    // Members that failed to decode and were skipped while the rest of the file decoded
    std::vector<decode_result> member_failures;
};

/**
 * Fallback display name for a sample without a stored name.
 * @param stem File name without extension
 * @param index Sample index within the file
 * @param count Number of samples in the file
 * @return stem for single-sample files, otherwise stem_<index>
 */
[[nodiscard]] BRUSHKIT_EXPORT std::string default_sample_name(std::string_view stem,
                                                              std::size_t index,
                                                              std::size_t count);

} // namespace brushkit

#endif // BRUSHKIT_BRUSH_HPP_
