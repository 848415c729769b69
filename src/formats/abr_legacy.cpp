#include <brushkit/formats/abr_legacy.hpp>
#include <brushkit/byte_cursor.hpp>
#include "abr_common.hpp"
#include "decode_helpers.hpp"

#include <string>

namespace brushkit {

namespace {

constexpr std::uint16_t ENTRY_SAMPLED = 2;

// Unknown fields around the optional name
constexpr std::size_t SKIP_BEFORE_NAME = 6;
constexpr std::size_t SKIP_AFTER_NAME = 9;

decode_result decode_sampled_entry(std::span<const std::uint8_t> data,
                                   std::size_t body,
                                   std::size_t entry_end,
                                   int version,
                                   const decode_options& options,
                                   parsed_brush_file& out) {
    byte_cursor cursor(data, body);

    if (!cursor.skip(SKIP_BEFORE_NAME)) {
        return cursor.out_of_bounds("sampled brush prefix");
    }

    if (version == 2) {
        std::uint32_t name_length = 0;
        if (!cursor.read_u32(name_length)) {
            return cursor.out_of_bounds("brush name length");
        }
        if (!cursor.skip(static_cast<std::size_t>(name_length) * 2)) {
            return cursor.out_of_bounds("brush name");
        }
    }

    if (!cursor.skip(SKIP_AFTER_NAME)) {
        return cursor.out_of_bounds("sampled brush fields");
    }

    abr::plane_header header;
    auto result = abr::read_plane_header(cursor, header);
    if (!result) return result;

    brush_sample sample;
    abr::plane_status status = abr::plane_status::decoded;
    result = abr::decode_plane(cursor, entry_end, header, options, sample.pixels, status);
    if (!result) return result;

    if (status == abr::plane_status::segmented) {
        return decode_result::success();
    }
    return append_sample(out, std::move(sample), options);
}

} // namespace

bool abr_legacy_decoder::check(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 4) {
        return false;
    }
    const std::uint16_t version = read_be16(data.data());
    return version == 1 || version == 2;
}

decode_result abr_legacy_decoder::parse(std::span<const std::uint8_t> data,
                                        parsed_brush_file& out,
                                        const decode_options& options) {
    out = {};
    byte_cursor cursor(data);

    std::uint16_t version = 0;
    std::uint16_t count = 0;
    if (!cursor.read_u16(version) || !cursor.read_u16(count)) {
        return cursor.out_of_bounds("ABR header");
    }
    if (version != 1 && version != 2) {
        return decode_result::failure_at(decode_error::unsupported_version, 0,
            "Unsupported ABR version " + std::to_string(version));
    }
    out.version = {version, 0};

    for (std::uint16_t i = 0; i < count; ++i) {
        std::uint16_t type = 0;
        std::uint32_t length = 0;
        if (!cursor.read_u16(type) || !cursor.read_u32(length)) {
            out.member_failures.push_back(cursor.out_of_bounds("ABR entry header"));
            break;
        }

        const std::size_t body = cursor.offset();
        const std::size_t entry_end = body + length;

        if (type == ENTRY_SAMPLED) {
            auto result = decode_sampled_entry(data, body, entry_end, version, options, out);
            if (!result) {
                if (result.error == decode_error::limit_exceeded) return result;
                out.member_failures.push_back(std::move(result));
            }
        }

        // Next entry starts after the declared length, decoded or not
        if (!cursor.seek(entry_end)) {
            out.member_failures.push_back(decode_result::failure_at(decode_error::out_of_bounds, body,
                "ABR entry " + std::to_string(i) + " length " + std::to_string(length) +
                " runs past end of data"));
            break;
        }
    }

    if (out.samples.empty() && !out.member_failures.empty()) {
        return out.member_failures.front();
    }
    return decode_result::success();
}

} // namespace brushkit
