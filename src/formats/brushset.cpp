#include <brushkit/formats/brushset.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace brushkit {

namespace {

constexpr std::uint8_t ZIP_SIGNATURE[] = {'P', 'K', 0x03, 0x04};

constexpr std::string_view SHAPE_SUFFIX = "Shape.png";
constexpr std::string_view GRAIN_SUFFIX = "Grain.png";
constexpr std::string_view PARAMETER_FILE = "Brush.archive";
constexpr std::string_view RESET_MARKER = "Reset";

constexpr std::string_view OBJECTS_KEY = "$objects";
constexpr std::string_view PAINT_SIZE_KEY = "paintSize";

bool is_skipped(std::string_view member) noexcept {
    return member.find(RESET_MARKER) != std::string_view::npos;
}

bool is_brush_image(std::string_view member) noexcept {
    return member.ends_with(SHAPE_SUFFIX) || member.ends_with(GRAIN_SUFFIX);
}

bool looks_like_name(const std::string& s) {
    if (s.starts_with('$') || s.starts_with('{')) {
        return false;
    }
    return !s.ends_with(".png") && !s.ends_with(".jpg") && !s.ends_with(".jpeg");
}

// Name and parameters from the keyed archive's object table
void apply_archive(const parameter_value& root, brush_sample& sample) {
    const auto* map = root.as_map();
    if (!map) {
        return;
    }
    const auto* objects_value = map->find(OBJECTS_KEY);
    const auto* objects = objects_value ? objects_value->as_list() : nullptr;
    if (!objects) {
        return;
    }

    for (const auto& object : *objects) {
        if (!sample.name) {
            if (const auto* s = object.as_string(); s && looks_like_name(*s)) {
                sample.name = *s;
            }
        }
        // Later settings maps replace earlier ones
        if (const auto* m = object.as_map(); m && m->contains(PAINT_SIZE_KEY)) {
            sample.parameters = *m;
        }
    }
}

decode_result decode_member(const archive_source& archive,
                            const property_list_reader& plist,
                            const bitmap_decoder& bitmaps,
                            std::string_view member,
                            brush_sample& sample) {
    std::vector<std::uint8_t> bytes;
    auto result = archive.read_member(member, bytes);
    if (!result) {
        result.message = std::string(member) + ": " + result.message;
        return result;
    }

    pixel_matrix rgba;
    result = bitmaps.decode(bytes, rgba);
    if (!result) {
        result.message = std::string(member) + ": " + result.message;
        return result;
    }
    sample.pixels = rgba.channel(0);
    sample.is_secondary_texture = member.ends_with(GRAIN_SUFFIX);

    // Folder path without the "/Shape.png" or "/Grain.png" suffix
    const std::size_t suffix = SHAPE_SUFFIX.size() + 1;
    sample.identifier = std::string(member.substr(0, member.size() > suffix ? member.size() - suffix : 0));

    const std::string archive_path =
        std::string(member.substr(0, member.size() - SHAPE_SUFFIX.size())) + std::string(PARAMETER_FILE);
    const auto names = archive.member_names();
    if (std::find(names.begin(), names.end(), archive_path) == names.end()) {
        return decode_result::success();
    }

    bytes.clear();
    result = archive.read_member(archive_path, bytes);
    if (!result) {
        result.message = archive_path + ": " + result.message;
        return result;
    }

    parameter_value root;
    result = plist.read(bytes, root);
    if (!result) {
        result.message = archive_path + ": " + result.message;
        return result;
    }
    apply_archive(root, sample);
    return decode_result::success();
}

} // namespace

bool brushset_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < sizeof(ZIP_SIGNATURE)) {
        return false;
    }
    return std::equal(std::begin(ZIP_SIGNATURE), std::end(ZIP_SIGNATURE), data.begin());
}

bool brushset_decoder::check(const archive_source& archive) noexcept {
    const auto names = archive.member_names();
    return std::any_of(names.begin(), names.end(), [](const std::string& member) {
        return !is_skipped(member) && is_brush_image(member);
    });
}

decode_result brushset_decoder::parse(const archive_source& archive,
                                      const property_list_reader& plist,
                                      const bitmap_decoder& bitmaps,
                                      parsed_brush_file& out,
                                      const decode_options& options) {
    out = {};
    if (!check(archive)) {
        return decode_result::failure(decode_error::no_image_found,
            "Archive holds no brush shape or grain images");
    }

    for (const auto& member : archive.member_names()) {
        if (is_skipped(member) || !is_brush_image(member)) {
            continue;
        }

        brush_sample sample;
        auto result = decode_member(archive, plist, bitmaps, member, sample);
        if (!result) {
            out.member_failures.push_back(std::move(result));
            continue;
        }

        result = append_sample(out, std::move(sample), options);
        if (!result) return result;
    }

    if (out.samples.empty() && !out.member_failures.empty()) {
        return out.member_failures.front();
    }
    return decode_result::success();
}

} // namespace brushkit
