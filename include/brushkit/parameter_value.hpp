#ifndef BRUSHKIT_PARAMETER_VALUE_HPP_
#define BRUSHKIT_PARAMETER_VALUE_HPP_

#include <brushkit/brushkit_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace brushkit {

// ============================================================================
// Unit Floats
// ============================================================================

enum class unit_kind {
    none,
    angle,
    density,
    distance,
    percent,
    pixels,
    unrecognized    // Raw tag kept in unit_float::raw_unit
};

[[nodiscard]] BRUSHKIT_EXPORT const char* to_string(unit_kind unit) noexcept;

struct unit_float {
    double value = 0.0;
    unit_kind unit = unit_kind::none;
    std::uint32_t raw_unit = 0;     // Original 4-byte unit tag

    friend bool operator==(const unit_float&, const unit_float&) = default;
};

// ============================================================================
// Parameter Values
// ============================================================================

class parameter_value;
struct parameter_entry;

using parameter_list = std::vector<parameter_value>;

/**
 * Ordered string-keyed map. Keys are unique; insertion order is preserved.
 */
class BRUSHKIT_EXPORT parameter_map {
public:
    using const_iterator = std::vector<parameter_entry>::const_iterator;

    parameter_map();
    ~parameter_map();
    parameter_map(const parameter_map& other);
    parameter_map(parameter_map&& other) noexcept;
    parameter_map& operator=(const parameter_map& other);
    parameter_map& operator=(parameter_map&& other) noexcept;

    /**
     * Insert a value, or replace the value of an existing key in place.
     */
    void insert_or_assign(std::string key, parameter_value value);

    [[nodiscard]] const parameter_value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    friend BRUSHKIT_EXPORT bool operator==(const parameter_map& a, const parameter_map& b);

private:
    std::vector<parameter_entry> entries_;
};

enum class value_kind {
    integer,
    real,
    boolean,
    string,
    unit,
    list,
    map
};

/**
 * Tagged union of the values brush formats store in their parameter records.
 */
class BRUSHKIT_EXPORT parameter_value {
public:
    using variant_type = std::variant<std::int64_t, double, bool, std::string,
                                      unit_float, parameter_list, parameter_map>;

    parameter_value() : value_(std::int64_t{0}) {}
    parameter_value(std::int64_t v) : value_(v) {}
    parameter_value(std::int32_t v) : value_(static_cast<std::int64_t>(v)) {}
    parameter_value(double v) : value_(v) {}
    parameter_value(bool v) : value_(v) {}
    parameter_value(std::string v) : value_(std::move(v)) {}
    parameter_value(const char* v) : value_(std::string(v)) {}
    parameter_value(unit_float v) : value_(v) {}
    parameter_value(parameter_list v) : value_(std::move(v)) {}
    parameter_value(parameter_map v) : value_(std::move(v)) {}

    [[nodiscard]] value_kind kind() const noexcept {
        return static_cast<value_kind>(value_.index());
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&value_);
    }

    [[nodiscard]] const std::string* as_string() const noexcept { return get_if<std::string>(); }
    [[nodiscard]] const parameter_map* as_map() const noexcept { return get_if<parameter_map>(); }
    [[nodiscard]] const parameter_list* as_list() const noexcept { return get_if<parameter_list>(); }

    [[nodiscard]] const variant_type& value() const noexcept { return value_; }

    friend bool operator==(const parameter_value& a, const parameter_value& b) {
        return a.value_ == b.value_;
    }

private:
    variant_type value_;
};

struct parameter_entry {
    std::string key;
    parameter_value value;

    friend bool operator==(const parameter_entry&, const parameter_entry&) = default;
};

/**
 * Render a value as compact single-line text, for diagnostics and dumps.
 */
[[nodiscard]] BRUSHKIT_EXPORT std::string to_string(const parameter_value& value);

} // namespace brushkit

#endif // BRUSHKIT_PARAMETER_VALUE_HPP_
