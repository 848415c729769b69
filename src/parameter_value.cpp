#include <brushkit/parameter_value.hpp>
#include <brushkit/types.hpp>

#include <algorithm>
#include <cstdio>

namespace brushkit {

const char* to_string(unit_kind unit) noexcept {
    switch (unit) {
        case unit_kind::none:         return "none";
        case unit_kind::angle:        return "angle";
        case unit_kind::density:      return "density";
        case unit_kind::distance:     return "distance";
        case unit_kind::percent:      return "percent";
        case unit_kind::pixels:       return "pixels";
        case unit_kind::unrecognized: return "unrecognized";
    }
    return "unknown";
}

// ============================================================================
// Parameter Map
// ============================================================================

parameter_map::parameter_map() = default;
parameter_map::~parameter_map() = default;
parameter_map::parameter_map(const parameter_map& other) = default;
parameter_map::parameter_map(parameter_map&& other) noexcept = default;
parameter_map& parameter_map::operator=(const parameter_map& other) = default;
parameter_map& parameter_map::operator=(parameter_map&& other) noexcept = default;

void parameter_map::insert_or_assign(std::string key, parameter_value value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const parameter_entry& e) { return e.key == key; });
    if (it != entries_.end()) {
        it->value = std::move(value);
        return;
    }
    entries_.push_back({std::move(key), std::move(value)});
}

const parameter_value* parameter_map::find(std::string_view key) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

bool parameter_map::contains(std::string_view key) const noexcept {
    return find(key) != nullptr;
}

std::size_t parameter_map::size() const noexcept {
    return entries_.size();
}

bool parameter_map::empty() const noexcept {
    return entries_.empty();
}

parameter_map::const_iterator parameter_map::begin() const noexcept {
    return entries_.begin();
}

parameter_map::const_iterator parameter_map::end() const noexcept {
    return entries_.end();
}

bool operator==(const parameter_map& a, const parameter_map& b) {
    return a.entries_ == b.entries_;
}

// ============================================================================
// Text Rendering
// ============================================================================

namespace {

void append_value(std::string& out, const parameter_value& value);

void append_quoted(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

void append_value(std::string& out, const parameter_value& value) {
    switch (value.kind()) {
        case value_kind::integer:
            out += std::to_string(*value.get_if<std::int64_t>());
            break;
        case value_kind::real: {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%g", *value.get_if<double>());
            out += buf;
            break;
        }
        case value_kind::boolean:
            out += *value.get_if<bool>() ? "true" : "false";
            break;
        case value_kind::string:
            append_quoted(out, *value.as_string());
            break;
        case value_kind::unit: {
            const auto& u = *value.get_if<unit_float>();
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%g", u.value);
            out += buf;
            out += ' ';
            out += u.unit == unit_kind::unrecognized ? tag_to_string(u.raw_unit) : to_string(u.unit);
            break;
        }
        case value_kind::list: {
            out += '[';
            bool first = true;
            for (const auto& item : *value.as_list()) {
                if (!first) out += ", ";
                append_value(out, item);
                first = false;
            }
            out += ']';
            break;
        }
        case value_kind::map: {
            out += '{';
            bool first = true;
            for (const auto& entry : *value.as_map()) {
                if (!first) out += ", ";
                append_quoted(out, entry.key);
                out += ": ";
                append_value(out, entry.value);
                first = false;
            }
            out += '}';
            break;
        }
    }
}

} // namespace

std::string to_string(const parameter_value& value) {
    std::string result;
    append_value(result, value);
    return result;
}

} // namespace brushkit
