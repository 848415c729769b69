#pragma once

#include <brushkit/containers.hpp>
#include <lodepng.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace test_helpers {

// In-memory archive; members keep insertion order
class memory_archive : public brushkit::archive_source {
public:
    memory_archive& add(std::string name, std::vector<std::uint8_t> bytes) {
        names_.push_back(std::move(name));
        contents_.push_back(std::move(bytes));
        return *this;
    }

    memory_archive& add(std::string name, std::string_view text) {
        return add(std::move(name), std::vector<std::uint8_t>(text.begin(), text.end()));
    }

    [[nodiscard]] std::span<const std::string> member_names() const noexcept override {
        return names_;
    }

    [[nodiscard]] brushkit::decode_result read_member(std::string_view name,
                                                      std::vector<std::uint8_t>& bytes) const override {
        const auto it = std::find(names_.begin(), names_.end(), name);
        if (it == names_.end()) {
            return brushkit::decode_result::failure(brushkit::decode_error::io_error,
                "No member " + std::string(name));
        }
        bytes = contents_[static_cast<std::size_t>(it - names_.begin())];
        return brushkit::decode_result::success();
    }

private:
    std::vector<std::string> names_;
    std::vector<std::vector<std::uint8_t>> contents_;
};

// Property list reader that maps the member text to a prepared value tree
class canned_plist_reader : public brushkit::property_list_reader {
public:
    canned_plist_reader& add(std::string text, brushkit::parameter_value root) {
        entries_.emplace_back(std::move(text), std::move(root));
        return *this;
    }

    [[nodiscard]] brushkit::decode_result read(std::span<const std::uint8_t> bytes,
                                               brushkit::parameter_value& root) const override {
        const std::string text(bytes.begin(), bytes.end());
        for (const auto& [key, value] : entries_) {
            if (key == text) {
                root = value;
                return brushkit::decode_result::success();
            }
        }
        return brushkit::decode_result::failure(brushkit::decode_error::invalid_format,
            "Unreadable property list");
    }

private:
    std::vector<std::pair<std::string, brushkit::parameter_value>> entries_;
};

// In-memory tables answering "SELECT * FROM <table>" style statements by table name
class memory_tables : public brushkit::table_source {
public:
    memory_tables& add(std::string table, brushkit::query_result rows) {
        tables_.emplace_back(std::move(table), std::move(rows));
        return *this;
    }

    [[nodiscard]] bool has_table(std::string_view name) const noexcept override {
        return std::any_of(tables_.begin(), tables_.end(),
                           [name](const auto& t) { return t.first == name; });
    }

    [[nodiscard]] brushkit::decode_result query(std::string_view sql,
                                                brushkit::query_result& out) const override {
        for (const auto& [name, rows] : tables_) {
            if (sql.find("FROM " + name) != std::string_view::npos) {
                out = rows;
                return brushkit::decode_result::success();
            }
        }
        return brushkit::decode_result::failure(brushkit::decode_error::io_error,
            "No table for " + std::string(sql));
    }

private:
    std::vector<std::pair<std::string, brushkit::query_result>> tables_;
};

// Grayscale PNG filled with one value
inline std::vector<std::uint8_t> gray_png(unsigned width, unsigned height, std::uint8_t value) {
    const std::vector<std::uint8_t> raw(static_cast<std::size_t>(width) * height, value);
    std::vector<std::uint8_t> png;
    lodepng::encode(png, raw, width, height, LCT_GREY, 8);
    return png;
}

} // namespace test_helpers
