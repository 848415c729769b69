#include <brushkit/formats/abr.hpp>
#include <brushkit/byte_cursor.hpp>
#include <brushkit/descriptor.hpp>
#include "abr_common.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>

namespace brushkit {

namespace {

constexpr std::uint32_t BLOCK_SIGNATURE = make_tag("8BIM");
constexpr std::uint32_t BLOCK_SAMPLES = make_tag("samp");
constexpr std::uint32_t BLOCK_DESCRIPTOR = make_tag("desc");

constexpr std::size_t HEADER_SIZE = 4;
constexpr std::size_t BLOCK_HEADER_SIZE = 12;

// Minor version 1: unknown bytes between the identifier and the plane header
constexpr std::size_t INLINE_SKIP = 10;

// Virtual memory array list
constexpr std::uint32_t VMAL_VERSION = 3;
constexpr std::size_t VMAL_RECT_SIZE = 16;
constexpr std::size_t VMAL_MIN_CHANNEL_SIZE = 4;

constexpr std::string_view SAMPLED_DATA_KEY = "sampledData";
constexpr std::string_view NAME_KEY = "name";

struct brush_preset {
    std::optional<std::string> name;
    parameter_map parameters;
};

using preset_table = std::map<std::string, brush_preset, std::less<>>;

// ============================================================================
// Sampled Images
// ============================================================================

decode_result decode_vmal(byte_cursor& cursor, std::size_t record_end,
                          const decode_options& options,
                          pixel_matrix& pixels, bool& kept) {
    std::uint32_t version = 0;
    if (!cursor.read_u32(version)) {
        return cursor.out_of_bounds("VMAL version");
    }
    if (version != VMAL_VERSION) {
        return decode_result::failure_at(decode_error::unsupported_version, cursor.offset() - 4,
            "Unsupported VMAL version " + std::to_string(version));
    }

    std::uint32_t length = 0;
    std::uint32_t channel_count = 0;
    if (!cursor.read_u32(length) || !cursor.skip(VMAL_RECT_SIZE) || !cursor.read_u32(channel_count)) {
        return cursor.out_of_bounds("VMAL header");
    }
    if (channel_count > cursor.remaining() / VMAL_MIN_CHANNEL_SIZE) {
        return decode_result::failure_at(decode_error::invalid_format, cursor.offset() - 4,
            "VMAL channel count " + std::to_string(channel_count) + " exceeds remaining data");
    }

    decode_result last_failure = decode_result::success();
    kept = false;

    for (std::uint32_t c = 0; c < channel_count; ++c) {
        std::uint32_t written = 0;
        if (!cursor.read_u32(written)) {
            return cursor.out_of_bounds("VMAL channel flag");
        }
        if (written == 0) {
            continue;
        }

        std::uint32_t channel_length = 0;
        if (!cursor.read_u32(channel_length)) {
            return cursor.out_of_bounds("VMAL channel length");
        }
        if (channel_length == 0) {
            continue;
        }
        const std::size_t channel_end = cursor.offset() + channel_length;

        std::uint32_t depth = 0;
        abr::plane_header header;
        if (!cursor.read_u32(depth)) {
            return cursor.out_of_bounds("VMAL channel depth");
        }
        auto result = abr::read_plane_header(cursor, header);
        if (!result) return result;

        pixel_matrix plane;
        abr::plane_status status = abr::plane_status::decoded;
        result = abr::decode_plane(cursor, std::min(channel_end, record_end), header, options,
                                   plane, status);
        if (!result) {
            last_failure = std::move(result);
        } else if (status == abr::plane_status::decoded) {
            pixels = std::move(plane);
            kept = true;
        }

        if (!cursor.seek(channel_end)) {
            if (kept) break;
            return decode_result::failure_at(decode_error::out_of_bounds, cursor.offset(),
                "VMAL channel " + std::to_string(c) + " runs past end of record");
        }
    }

    if (!kept) {
        return last_failure;
    }
    return decode_result::success();
}

decode_result decode_sample_record(std::span<const std::uint8_t> data,
                                   std::size_t record_begin,
                                   std::size_t record_end,
                                   int minor,
                                   const decode_options& options,
                                   parsed_brush_file& out) {
    byte_cursor cursor(data.first(record_end), record_begin);

    std::uint8_t id_length = 0;
    std::span<const std::uint8_t> id_bytes;
    if (!cursor.read_u8(id_length) || !cursor.read_bytes(id_length, id_bytes)) {
        return cursor.out_of_bounds("sample identifier");
    }

    brush_sample sample;
    sample.identifier = std::string(id_bytes.begin(), id_bytes.end());

    bool kept = false;
    if (minor == 1) {
        if (!cursor.skip(INLINE_SKIP)) {
            return cursor.out_of_bounds("sample prefix");
        }
        abr::plane_header header;
        auto result = abr::read_plane_header(cursor, header);
        if (!result) return result;

        abr::plane_status status = abr::plane_status::decoded;
        result = abr::decode_plane(cursor, record_end, header, options, sample.pixels, status);
        if (!result) return result;
        kept = status == abr::plane_status::decoded;
    } else {
        auto result = decode_vmal(cursor, record_end, options, sample.pixels, kept);
        if (!result) return result;
    }

    if (!kept) {
        return decode_result::success();
    }
    return append_sample(out, std::move(sample), options);
}

void parse_sample_block(std::span<const std::uint8_t> data,
                        std::size_t begin,
                        std::size_t end,
                        int minor,
                        const decode_options& options,
                        parsed_brush_file& out,
                        decode_result& fatal) {
    byte_cursor cursor(data.first(end), begin);

    while (!cursor.at_end()) {
        std::uint32_t length = 0;
        if (!cursor.read_u32(length)) {
            out.member_failures.push_back(cursor.out_of_bounds("sample record length"));
            return;
        }

        const std::size_t record_begin = cursor.offset();
        const std::size_t record_end = record_begin + length;
        if (record_end > end) {
            out.member_failures.push_back(decode_result::failure_at(decode_error::out_of_bounds,
                record_begin - 4, "Sample record length " + std::to_string(length) +
                " runs past its block"));
            return;
        }

        auto result = decode_sample_record(data, record_begin, record_end, minor, options, out);
        if (!result) {
            if (result.error == decode_error::limit_exceeded) {
                fatal = std::move(result);
                return;
            }
            out.member_failures.push_back(std::move(result));
        }

        if (!cursor.seek(std::min(record_begin + padded_to_4(length), end))) {
            return;
        }
    }
}

// ============================================================================
// Preset Descriptor
// ============================================================================

const std::string* find_sampled_data(const parameter_value& value);

const std::string* find_sampled_data(const parameter_map& map) {
    if (const auto* v = map.find(SAMPLED_DATA_KEY)) {
        if (const auto* s = v->as_string()) {
            return s;
        }
    }
    for (const auto& entry : map) {
        if (const auto* s = find_sampled_data(entry.value)) {
            return s;
        }
    }
    return nullptr;
}

const std::string* find_sampled_data(const parameter_value& value) {
    if (const auto* map = value.as_map()) {
        return find_sampled_data(*map);
    }
    if (const auto* list = value.as_list()) {
        for (const auto& item : *list) {
            if (const auto* s = find_sampled_data(item)) {
                return s;
            }
        }
    }
    return nullptr;
}

void collect_presets(const descriptor& root, preset_table& presets) {
    for (const auto& entry : root.items) {
        const auto* list = entry.value.as_list();
        if (!list) {
            continue;
        }
        for (const auto& item : *list) {
            const auto* map = item.as_map();
            if (!map) {
                continue;
            }
            const auto* identifier = find_sampled_data(*map);
            if (!identifier) {
                continue;
            }

            brush_preset preset;
            if (const auto* name = map->find(NAME_KEY)) {
                if (const auto* s = name->as_string()) {
                    preset.name = *s;
                }
            }
            preset.parameters = *map;
            presets.emplace(*identifier, std::move(preset));
        }
    }
}

decode_result parse_descriptor_block(std::span<const std::uint8_t> data,
                                     std::size_t begin,
                                     std::size_t end,
                                     const decode_options& options,
                                     preset_table& presets) {
    byte_cursor cursor(data.first(end), begin);

    std::uint32_t version = 0;
    if (!cursor.read_u32(version)) {
        return cursor.out_of_bounds("descriptor version");
    }

    descriptor root;
    auto result = parse_descriptor(cursor, root, options);
    if (!result) return result;

    collect_presets(root, presets);
    return decode_result::success();
}

} // namespace

bool abr_decoder::check(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < HEADER_SIZE + 8) {
        return false;
    }
    const std::uint16_t major = read_be16(data.data());
    const std::uint16_t minor = read_be16(data.data() + 2);
    if (major < 6 || (minor != 1 && minor != 2)) {
        return false;
    }
    return read_be32(data.data() + 4) == BLOCK_SIGNATURE &&
           read_be32(data.data() + 8) == BLOCK_SAMPLES;
}

decode_result abr_decoder::parse(std::span<const std::uint8_t> data,
                                 parsed_brush_file& out,
                                 const decode_options& options) {
    out = {};
    byte_cursor cursor(data);

    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    if (!cursor.read_u16(major) || !cursor.read_u16(minor)) {
        return cursor.out_of_bounds("ABR header");
    }
    if (major < 6 || (minor != 1 && minor != 2)) {
        return decode_result::failure_at(decode_error::unsupported_version, 0,
            "Unsupported ABR version " + std::to_string(major) + "." + std::to_string(minor));
    }
    if (!cursor.peek_equals("8BIMsamp")) {
        return decode_result::failure_at(decode_error::malformed_header, HEADER_SIZE,
            "ABR sampled-image block missing");
    }
    out.version = {major, minor};

    preset_table presets;

    while (cursor.remaining() >= BLOCK_HEADER_SIZE) {
        const std::size_t block_start = cursor.offset();
        std::uint32_t tag = 0;
        std::uint32_t subtag = 0;
        std::uint32_t length = 0;
        if (!cursor.read_u32(tag) || !cursor.read_u32(subtag) || !cursor.read_u32(length)) {
            return cursor.out_of_bounds("block header");
        }

        const std::size_t begin = cursor.offset();
        const std::size_t end = begin + length;
        if (end > data.size()) {
            out.member_failures.push_back(decode_result::failure_at(decode_error::out_of_bounds,
                block_start, "Block length " + std::to_string(length) + " runs past end of data",
                subtag));
            break;
        }

        if (subtag == BLOCK_SAMPLES) {
            decode_result fatal = decode_result::success();
            parse_sample_block(data, begin, end, minor, options, out, fatal);
            if (!fatal) return fatal;
        } else if (subtag == BLOCK_DESCRIPTOR) {
            auto result = parse_descriptor_block(data, begin, end, options, presets);
            if (!result) {
                out.member_failures.push_back(std::move(result));
            }
        }

        if (!cursor.seek(std::min(begin + padded_to_4(length), data.size()))) {
            break;
        }
    }

    for (auto& sample : out.samples) {
        if (!sample.identifier) {
            continue;
        }
        const auto it = presets.find(*sample.identifier);
        if (it == presets.end()) {
            continue;
        }
        sample.name = it->second.name;
        sample.parameters = it->second.parameters;
    }

    if (out.samples.empty() && !out.member_failures.empty()) {
        return out.member_failures.front();
    }
    return decode_result::success();
}

} // namespace brushkit
