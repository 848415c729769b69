#include <brushkit/formats/sut.hpp>
#include <brushkit/boundary_scan.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace brushkit {

namespace {

constexpr std::string_view SQLITE_SIGNATURE{"SQLite format 3\0", 16};

constexpr std::string_view MATERIAL_TABLE = "MaterialFile";
constexpr std::string_view VARIANT_QUERY = "SELECT * FROM Variant";
constexpr std::string_view NODE_NAME_QUERY = "SELECT NodeName FROM Node";
constexpr std::string_view MATERIAL_QUERY = "SELECT FileData FROM MaterialFile";

constexpr std::string_view BRUSH_NAME_KEY = "BrushName";

std::optional<parameter_value> to_parameter(const table_cell& cell) {
    if (const auto* i = std::get_if<std::int64_t>(&cell)) {
        return parameter_value(*i);
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        return parameter_value(*d);
    }
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return parameter_value(*s);
    }
    return std::nullopt;
}

decode_result read_variant(const table_source& tables, parameter_map& params) {
    query_result rows;
    auto result = tables.query(VARIANT_QUERY, rows);
    if (!result) return result;

    if (rows.rows.empty()) {
        return decode_result::success();
    }

    const auto& row = rows.rows.front();
    const std::size_t n = std::min(row.size(), rows.columns.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (auto value = to_parameter(row[i])) {
            params.insert_or_assign(rows.columns[i], std::move(*value));
        }
    }
    return decode_result::success();
}

decode_result read_brush_name(const table_source& tables, std::optional<std::string>& name) {
    query_result rows;
    auto result = tables.query(NODE_NAME_QUERY, rows);
    if (!result) return result;

    if (!rows.rows.empty() && !rows.rows.front().empty()) {
        if (const auto* s = std::get_if<std::string>(&rows.rows.front().front())) {
            name = *s;
        }
    }
    return decode_result::success();
}

decode_result decode_material(const table_cell& cell, std::size_t row,
                              const bitmap_decoder& bitmaps, pixel_matrix& pixels) {
    const auto* blob = std::get_if<std::vector<std::uint8_t>>(&cell);
    if (!blob) {
        return decode_result::failure(decode_error::invalid_format,
            "MaterialFile row " + std::to_string(row) + " has no FileData blob");
    }

    byte_range range;
    auto result = find_embedded_image(*blob, range);
    if (!result) {
        result.message = "MaterialFile row " + std::to_string(row) + ": " + result.message;
        return result;
    }

    const std::span<const std::uint8_t> image(blob->data() + range.begin, range.size());
    result = bitmaps.decode(image, pixels);
    if (!result) {
        result.message = "MaterialFile row " + std::to_string(row) + ": " + result.message;
    }
    return result;
}

} // namespace

bool sut_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < SQLITE_SIGNATURE.size()) {
        return false;
    }
    return std::equal(SQLITE_SIGNATURE.begin(), SQLITE_SIGNATURE.end(), data.begin(),
        [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
}

bool sut_decoder::check(const table_source& tables) noexcept {
    return tables.has_table(MATERIAL_TABLE);
}

decode_result sut_decoder::parse(const table_source& tables,
                                 const bitmap_decoder& bitmaps,
                                 parsed_brush_file& out,
                                 const decode_options& options) {
    out = {};
    if (!check(tables)) {
        return decode_result::failure(decode_error::malformed_header,
            "Database has no MaterialFile table");
    }

    parameter_map params;
    auto result = read_variant(tables, params);
    if (!result) return result;

    std::optional<std::string> brush_name;
    result = read_brush_name(tables, brush_name);
    if (!result) return result;
    if (brush_name) {
        params.insert_or_assign(std::string(BRUSH_NAME_KEY), *brush_name);
    }

    query_result materials;
    result = tables.query(MATERIAL_QUERY, materials);
    if (!result) return result;

    for (std::size_t i = 0; i < materials.rows.size(); ++i) {
        const auto& row = materials.rows[i];
        if (row.empty()) {
            continue;
        }

        brush_sample sample;
        result = decode_material(row.front(), i, bitmaps, sample.pixels);
        if (!result) {
            out.member_failures.push_back(std::move(result));
            continue;
        }

        sample.name = brush_name;
        sample.parameters = params;
        result = append_sample(out, std::move(sample), options);
        if (!result) return result;
    }

    if (out.samples.empty() && !out.member_failures.empty()) {
        return out.member_failures.front();
    }
    return decode_result::success();
}

} // namespace brushkit
