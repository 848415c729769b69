#ifndef BRUSHKIT_DESCRIPTOR_HPP_
#define BRUSHKIT_DESCRIPTOR_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/byte_cursor.hpp>
#include <brushkit/parameter_value.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace brushkit {

// ============================================================================
// Action Descriptor Parser
// ============================================================================

/**
 * A self-describing object: unicode name, class id, and a map of typed items.
 */
struct descriptor {
    std::string name;
    std::string class_id;
    parameter_map items;
};

/**
 * Parse a descriptor body (name, class id, item map) at the cursor.
 * @param cursor Positioned at the unicode name
 * @param out Receives the descriptor
 * @param options max_nesting_depth bounds map/list/object nesting
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result parse_descriptor(byte_cursor& cursor,
                                                              descriptor& out,
                                                              const decode_options& options = {});

/**
 * Parse one tag-prefixed value at the cursor.
 *
 * Supported tags: Objc, GlbO (nested descriptor, yields its item map), VlLs (list),
 * TEXT (unicode string), UntF (unit float), bool, long, doub, enum (value name only).
 * Any other tag fails with decode_error::unrecognized_value_type.
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result parse_typed_value(byte_cursor& cursor,
                                                               parameter_value& out,
                                                               const decode_options& options = {});

/**
 * Read a compact string: a u32 length, then either that many ASCII bytes (trailing
 * NUL trimmed) or, for length zero, a packed 4-byte key resolved through
 * property_name().
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result read_compact_string(byte_cursor& cursor,
                                                                 std::string& out);

/**
 * Read a unicode string: a u32 count of UTF-16BE code units, trailing NUL trimmed,
 * converted to UTF-8.
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result read_unicode_string(byte_cursor& cursor,
                                                                 std::string& out);

/**
 * Readable name of a packed 4-character property key, e.g. 'Dmtr' -> "diameter".
 * @return Empty view if the key is not in the dictionary
 */
[[nodiscard]] BRUSHKIT_EXPORT std::string_view property_name(std::uint32_t key) noexcept;

/**
 * Unit kind of a unit float tag ('#Ang', '#Pxl', ...).
 */
[[nodiscard]] BRUSHKIT_EXPORT unit_kind unit_from_tag(std::uint32_t tag) noexcept;

} // namespace brushkit

#endif // BRUSHKIT_DESCRIPTOR_HPP_
