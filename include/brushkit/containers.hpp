#ifndef BRUSHKIT_CONTAINERS_HPP_
#define BRUSHKIT_CONTAINERS_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/parameter_value.hpp>
#include <brushkit/pixel_matrix.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace brushkit {

// ============================================================================
// Archive Source
// ============================================================================

/**
 * Read access to the members of a zip-like archive.
 * Implemented by the caller; the library never opens archives itself.
 */
class BRUSHKIT_EXPORT archive_source {
public:
    virtual ~archive_source() = default;

    /**
     * Member paths in archive order.
     */
    [[nodiscard]] virtual std::span<const std::string> member_names() const noexcept = 0;

    /**
     * Read one member fully into memory.
     * @param name Member path as listed by member_names()
     * @param bytes Receives the uncompressed member data
     * @return io_error (or another decode_error) on failure
     */
    [[nodiscard]] virtual decode_result read_member(std::string_view name,
                                                    std::vector<std::uint8_t>& bytes) const = 0;
};

// ============================================================================
// Property List Reader
// ============================================================================

/**
 * Deserializes a property list (binary or XML plist) into a value tree.
 */
class BRUSHKIT_EXPORT property_list_reader {
public:
    virtual ~property_list_reader() = default;

    /**
     * @param bytes Encoded property list
     * @param root Receives the root value; null entries are omitted from maps and lists
     */
    [[nodiscard]] virtual decode_result read(std::span<const std::uint8_t> bytes,
                                             parameter_value& root) const = 0;
};

// ============================================================================
// Table Source
// ============================================================================

/**
 * One cell of a query result: null, integer, real, text or blob.
 */
using table_cell = std::variant<std::monostate, std::int64_t, double, std::string,
                                std::vector<std::uint8_t>>;

struct query_result {
    std::vector<std::string> columns;
    std::vector<std::vector<table_cell>> rows;
};

/**
 * Query access to an embedded relational store.
 */
class BRUSHKIT_EXPORT table_source {
public:
    virtual ~table_source() = default;

    [[nodiscard]] virtual bool has_table(std::string_view name) const noexcept = 0;

    /**
     * Run a read-only statement.
     * @param sql Statement text
     * @param out Receives column names and all rows
     */
    [[nodiscard]] virtual decode_result query(std::string_view sql, query_result& out) const = 0;
};

// ============================================================================
// Bitmap Decoder
// ============================================================================

/**
 * Turns a complete encoded image (PNG) into pixels.
 */
class BRUSHKIT_EXPORT bitmap_decoder {
public:
    virtual ~bitmap_decoder() = default;

    /**
     * @param bytes Encoded image
     * @param pixels Receives a height x width x 4 matrix of 8-bit RGBA, top row first
     */
    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> bytes,
                                               pixel_matrix& pixels) const = 0;
};

} // namespace brushkit

#endif // BRUSHKIT_CONTAINERS_HPP_
