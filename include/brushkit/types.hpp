#ifndef BRUSHKIT_TYPES_HPP_
#define BRUSHKIT_TYPES_HPP_

#include <brushkit/brushkit_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace brushkit {

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    out_of_bounds,
    unsupported_version,
    malformed_header,
    unrecognized_value_type,
    no_image_found,
    invalid_format,
    unsupported_encoding,
    unsupported_bit_depth,
    dimensions_exceeded,
    limit_exceeded,
    io_error,
    internal_error
};

[[nodiscard]] BRUSHKIT_EXPORT const char* to_string(decode_error err) noexcept;

/**
 * Format a 4-byte tag as printable text ("8BIM", "desc").
 * Non-printable bytes are rendered as '?'.
 */
[[nodiscard]] BRUSHKIT_EXPORT std::string tag_to_string(std::uint32_t tag);

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;
    std::size_t offset = 0;   // Byte offset where the failure was detected
    std::uint32_t tag = 0;    // Offending 4-byte tag, when one is involved

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}, 0, 0};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg), 0, 0};
    }

    [[nodiscard]] static decode_result failure_at(decode_error err, std::size_t offset,
                                                  std::string msg, std::uint32_t tag = 0) {
        msg += " (offset " + std::to_string(offset);
        if (tag != 0) {
            msg += ", tag '" + tag_to_string(tag) + "'";
        }
        msg += ")";
        return {false, err, std::move(msg), offset, tag};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed sample dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Maximum nesting of descriptor maps/lists/objects
    int max_nesting_depth = 64;

    // Maximum records decoded from one file
    std::size_t max_samples = 65536;
};

// ============================================================================
// Format Version
// ============================================================================

struct format_version {
    int major = 0;
    int minor = 0;

    friend bool operator==(const format_version&, const format_version&) = default;
};

} // namespace brushkit

#endif // BRUSHKIT_TYPES_HPP_
