#include <brushkit/descriptor.hpp>

#include <array>
#include <string>
#include <utility>

namespace brushkit {

namespace {

// Value type tags
constexpr std::uint32_t TYPE_OBJECT        = make_tag("Objc");
constexpr std::uint32_t TYPE_GLOBAL_OBJECT = make_tag("GlbO");
constexpr std::uint32_t TYPE_LIST          = make_tag("VlLs");
constexpr std::uint32_t TYPE_TEXT          = make_tag("TEXT");
constexpr std::uint32_t TYPE_UNIT_FLOAT    = make_tag("UntF");
constexpr std::uint32_t TYPE_BOOLEAN       = make_tag("bool");
constexpr std::uint32_t TYPE_INTEGER       = make_tag("long");
constexpr std::uint32_t TYPE_DOUBLE        = make_tag("doub");
constexpr std::uint32_t TYPE_ENUMERATED    = make_tag("enum");

// Smallest encodings, used to reject counts larger than the remaining data
constexpr std::size_t MIN_MAP_ITEM_BYTES = 8;     // key length + type tag
constexpr std::size_t MIN_LIST_ITEM_BYTES = 4;    // type tag

constexpr std::uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

struct property_key {
    std::uint32_t code;
    std::string_view name;
};

constexpr std::array<property_key, 28> PROPERTY_KEYS = {{
    {make_tag("Nm  "), "name"},
    {make_tag("Dmtr"), "diameter"},
    {make_tag("Spcn"), "spacing"},
    {make_tag("Opct"), "opacity"},
    {make_tag("Txtr"), "texture"},
    {make_tag("Angl"), "angle"},
    {make_tag("Rndn"), "roundness"},
    {make_tag("Hrdn"), "hardness"},
    {make_tag("Intr"), "interpolation"},
    {make_tag("Brsh"), "brush"},
    {make_tag("Idnt"), "identifier"},
    {make_tag("Sz  "), "size"},
    {make_tag("Clr "), "color"},
    {make_tag("Md  "), "mode"},
    {make_tag("Scl "), "scale"},
    {make_tag("Dpth"), "depth"},
    {make_tag("Invr"), "invert"},
    {make_tag("Brgh"), "brightness"},
    {make_tag("Cntr"), "contrast"},
    {make_tag("Ptrn"), "pattern"},
    {make_tag("Rd  "), "red"},
    {make_tag("Grn "), "green"},
    {make_tag("Bl  "), "blue"},
    {make_tag("H   "), "hue"},
    {make_tag("Strt"), "saturation"},
    {make_tag("Lmnc"), "luminance"},
    {make_tag("Nose"), "noise"},
    {make_tag("Wtdg"), "wet_edges"},
}};

struct unit_tag {
    std::uint32_t code;
    unit_kind unit;
};

constexpr std::array<unit_tag, 6> UNIT_TAGS = {{
    {make_tag("#Ang"), unit_kind::angle},
    {make_tag("#Rsl"), unit_kind::density},
    {make_tag("#Rlt"), unit_kind::distance},
    {make_tag("#Nne"), unit_kind::none},
    {make_tag("#Prc"), unit_kind::percent},
    {make_tag("#Pxl"), unit_kind::pixels},
}};

void trim_trailing_nul(std::string& s) {
    while (!s.empty() && s.back() == '\0') {
        s.pop_back();
    }
}

void append_utf8(std::string& out, std::uint32_t cp) {
    // Unpaired surrogates have no UTF-8 encoding
    if (cp >= 0xD800 && cp <= 0xDFFF) {
        cp = REPLACEMENT_CHARACTER;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ============================================================================
// Value Handlers
// ============================================================================

using value_handler = decode_result (*)(byte_cursor&, parameter_value&, const decode_options&, int);

decode_result parse_value(byte_cursor& cursor, parameter_value& out,
                          const decode_options& options, int depth);

decode_result check_depth(const byte_cursor& cursor, const decode_options& options, int depth) {
    if (depth > options.max_nesting_depth) {
        return decode_result::failure_at(decode_error::limit_exceeded, cursor.offset(),
            "Descriptor nesting exceeds " + std::to_string(options.max_nesting_depth) + " levels");
    }
    return decode_result::success();
}

decode_result parse_map(byte_cursor& cursor, parameter_map& out,
                        const decode_options& options, int depth) {
    auto result = check_depth(cursor, options, depth);
    if (!result) return result;

    std::uint32_t count = 0;
    if (!cursor.read_u32(count)) {
        return cursor.out_of_bounds("descriptor item count");
    }
    if (count > cursor.remaining() / MIN_MAP_ITEM_BYTES) {
        return decode_result::failure_at(decode_error::invalid_format, cursor.offset() - 4,
            "Descriptor item count " + std::to_string(count) + " exceeds remaining data");
    }

    for (std::uint32_t i = 0; i < count; ++i) {
        std::string key;
        result = read_compact_string(cursor, key);
        if (!result) return result;

        parameter_value value;
        result = parse_value(cursor, value, options, depth + 1);
        if (!result) return result;

        out.insert_or_assign(std::move(key), std::move(value));
    }
    return decode_result::success();
}

decode_result parse_descriptor_body(byte_cursor& cursor, descriptor& out,
                                    const decode_options& options, int depth) {
    auto result = read_unicode_string(cursor, out.name);
    if (!result) return result;

    result = read_compact_string(cursor, out.class_id);
    if (!result) return result;

    return parse_map(cursor, out.items, options, depth);
}

decode_result handle_object(byte_cursor& cursor, parameter_value& out,
                            const decode_options& options, int depth) {
    descriptor nested;
    auto result = parse_descriptor_body(cursor, nested, options, depth);
    if (!result) return result;
    out = parameter_value(std::move(nested.items));
    return decode_result::success();
}

decode_result handle_list(byte_cursor& cursor, parameter_value& out,
                          const decode_options& options, int depth) {
    auto result = check_depth(cursor, options, depth);
    if (!result) return result;

    std::uint32_t count = 0;
    if (!cursor.read_u32(count)) {
        return cursor.out_of_bounds("list item count");
    }
    if (count > cursor.remaining() / MIN_LIST_ITEM_BYTES) {
        return decode_result::failure_at(decode_error::invalid_format, cursor.offset() - 4,
            "List item count " + std::to_string(count) + " exceeds remaining data");
    }

    parameter_list items;
    items.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        parameter_value item;
        result = parse_value(cursor, item, options, depth + 1);
        if (!result) return result;
        items.push_back(std::move(item));
    }
    out = parameter_value(std::move(items));
    return decode_result::success();
}

decode_result handle_text(byte_cursor& cursor, parameter_value& out,
                          const decode_options&, int) {
    std::string text;
    auto result = read_unicode_string(cursor, text);
    if (!result) return result;
    out = parameter_value(std::move(text));
    return decode_result::success();
}

decode_result handle_unit_float(byte_cursor& cursor, parameter_value& out,
                                const decode_options&, int) {
    unit_float value;
    if (!cursor.read_u32(value.raw_unit)) {
        return cursor.out_of_bounds("unit tag");
    }
    if (!cursor.read_f64(value.value)) {
        return cursor.out_of_bounds("unit float value");
    }
    value.unit = unit_from_tag(value.raw_unit);
    out = parameter_value(value);
    return decode_result::success();
}

decode_result handle_boolean(byte_cursor& cursor, parameter_value& out,
                             const decode_options&, int) {
    std::uint8_t v = 0;
    if (!cursor.read_u8(v)) {
        return cursor.out_of_bounds("boolean");
    }
    out = parameter_value(v != 0);
    return decode_result::success();
}

decode_result handle_integer(byte_cursor& cursor, parameter_value& out,
                             const decode_options&, int) {
    std::int32_t v = 0;
    if (!cursor.read_i32(v)) {
        return cursor.out_of_bounds("integer");
    }
    out = parameter_value(static_cast<std::int64_t>(v));
    return decode_result::success();
}

decode_result handle_double(byte_cursor& cursor, parameter_value& out,
                            const decode_options&, int) {
    double v = 0.0;
    if (!cursor.read_f64(v)) {
        return cursor.out_of_bounds("double");
    }
    out = parameter_value(v);
    return decode_result::success();
}

decode_result handle_enumerated(byte_cursor& cursor, parameter_value& out,
                                const decode_options&, int) {
    std::string type_name;
    auto result = read_compact_string(cursor, type_name);
    if (!result) return result;

    std::string value_name;
    result = read_compact_string(cursor, value_name);
    if (!result) return result;

    out = parameter_value(std::move(value_name));
    return decode_result::success();
}

struct value_type_entry {
    std::uint32_t tag;
    value_handler handler;
};

constexpr std::array<value_type_entry, 9> VALUE_TYPES = {{
    {TYPE_OBJECT, handle_object},
    {TYPE_GLOBAL_OBJECT, handle_object},
    {TYPE_LIST, handle_list},
    {TYPE_TEXT, handle_text},
    {TYPE_UNIT_FLOAT, handle_unit_float},
    {TYPE_BOOLEAN, handle_boolean},
    {TYPE_INTEGER, handle_integer},
    {TYPE_DOUBLE, handle_double},
    {TYPE_ENUMERATED, handle_enumerated},
}};

decode_result parse_value(byte_cursor& cursor, parameter_value& out,
                          const decode_options& options, int depth) {
    const std::size_t tag_offset = cursor.offset();
    std::uint32_t tag = 0;
    if (!cursor.read_u32(tag)) {
        return cursor.out_of_bounds("value type tag");
    }

    for (const auto& entry : VALUE_TYPES) {
        if (entry.tag == tag) {
            return entry.handler(cursor, out, options, depth);
        }
    }

    return decode_result::failure_at(decode_error::unrecognized_value_type, tag_offset,
        "Unrecognized descriptor value type", tag);
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

decode_result parse_descriptor(byte_cursor& cursor, descriptor& out, const decode_options& options) {
    return parse_descriptor_body(cursor, out, options, 0);
}

decode_result parse_typed_value(byte_cursor& cursor, parameter_value& out, const decode_options& options) {
    return parse_value(cursor, out, options, 0);
}

decode_result read_compact_string(byte_cursor& cursor, std::string& out) {
    std::uint32_t length = 0;
    if (!cursor.read_u32(length)) {
        return cursor.out_of_bounds("compact string length");
    }

    if (length == 0) {
        std::uint32_t key = 0;
        if (!cursor.read_u32(key)) {
            return cursor.out_of_bounds("packed property key");
        }
        const auto known = property_name(key);
        out = known.empty() ? tag_to_string(key) : std::string(known);
        return decode_result::success();
    }

    std::span<const std::uint8_t> bytes;
    if (!cursor.read_bytes(length, bytes)) {
        return cursor.out_of_bounds("compact string");
    }
    out.assign(bytes.begin(), bytes.end());
    trim_trailing_nul(out);
    return decode_result::success();
}

decode_result read_unicode_string(byte_cursor& cursor, std::string& out) {
    std::uint32_t count = 0;
    if (!cursor.read_u32(count)) {
        return cursor.out_of_bounds("unicode string length");
    }
    if (count > cursor.remaining() / 2) {
        return cursor.out_of_bounds("unicode string");
    }

    out.clear();
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint16_t unit = 0;
        if (!cursor.read_u16(unit)) {
            return cursor.out_of_bounds("unicode string");
        }

        std::uint32_t cp = unit;
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < count) {
            std::span<const std::uint8_t> next;
            if (cursor.peek_bytes(2, next)) {
                const std::uint16_t low = read_be16(next.data());
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    if (!cursor.skip(2)) {
                        return cursor.out_of_bounds("unicode string");
                    }
                    ++i;
                    cp = 0x10000 + ((static_cast<std::uint32_t>(unit) - 0xD800) << 10) +
                         (static_cast<std::uint32_t>(low) - 0xDC00);
                }
            }
        }
        append_utf8(out, cp);
    }

    trim_trailing_nul(out);
    return decode_result::success();
}

std::string_view property_name(std::uint32_t key) noexcept {
    for (const auto& entry : PROPERTY_KEYS) {
        if (entry.code == key) {
            return entry.name;
        }
    }
    return {};
}

unit_kind unit_from_tag(std::uint32_t tag) noexcept {
    for (const auto& entry : UNIT_TAGS) {
        if (entry.code == tag) {
            return entry.unit;
        }
    }
    return unit_kind::unrecognized;
}

} // namespace brushkit
