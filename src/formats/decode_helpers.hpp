#pragma once

#include <brushkit/brush.hpp>
#include <brushkit/types.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace brushkit {

// Default dimension limits
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Planes taller than this are stored segmented and are not decoded
constexpr int SEGMENTED_HEIGHT_THRESHOLD = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options) {
    int max_w = options.max_width > 0 ? options.max_width : DEFAULT_MAX_DIMENSION;
    int max_h = options.max_height > 0 ? options.max_height : DEFAULT_MAX_DIMENSION;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
inline decode_result validate_dimensions(int width, int height,
                                         const decode_options& options,
                                         std::size_t offset = 0) {
    if (width < 0 || height < 0) {
        return decode_result::failure_at(decode_error::invalid_format, offset,
            "Negative sample dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }
    auto [max_w, max_h] = get_dimension_limits(options);
    if (width > max_w || height > max_h) {
        return decode_result::failure_at(decode_error::dimensions_exceeded, offset,
            "Sample dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits");
    }
    return decode_result::success();
}

// Block and record lengths are padded to a multiple of 4
constexpr std::size_t padded_to_4(std::size_t n) noexcept {
    return (n + 3) & ~static_cast<std::size_t>(3);
}

// Append a sample unless the per-file cap has been reached
inline decode_result append_sample(parsed_brush_file& out, brush_sample sample,
                                   const decode_options& options) {
    if (out.samples.size() >= options.max_samples) {
        return decode_result::failure(decode_error::limit_exceeded,
            "File holds more than " + std::to_string(options.max_samples) + " samples");
    }
    out.samples.push_back(std::move(sample));
    return decode_result::success();
}

} // namespace brushkit
