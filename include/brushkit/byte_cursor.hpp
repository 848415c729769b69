#ifndef BRUSHKIT_BYTE_CURSOR_HPP_
#define BRUSHKIT_BYTE_CURSOR_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace brushkit {

// ============================================================================
// Byte Cursor
// ============================================================================

/**
 * Position-tracked reader over an immutable byte buffer.
 *
 * Numeric reads are big-endian unless stated otherwise. A read that would run past
 * the end of the buffer returns false and leaves the offset unchanged; decoders turn
 * that into decode_error::out_of_bounds via out_of_bounds().
 */
class BRUSHKIT_EXPORT byte_cursor {
public:
    explicit byte_cursor(std::span<const std::uint8_t> data, std::size_t offset = 0) noexcept
        : data_(data), offset_(offset <= data.size() ? offset : data.size()) {}

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] bool at_end() const noexcept { return offset_ >= data_.size(); }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }

    /**
     * Read an integer of 1, 2, 4 or 8 bytes.
     * @param width Field width in bytes
     * @param is_signed Sign-extend the value
     * @param out Receives the value
     * @param big_endian Byte order of the field
     */
    [[nodiscard]] bool read_fixed(std::size_t width, bool is_signed, std::int64_t& out,
                                  bool big_endian = true) noexcept;

    [[nodiscard]] bool read_u8(std::uint8_t& out) noexcept;
    [[nodiscard]] bool read_u16(std::uint16_t& out) noexcept;
    [[nodiscard]] bool read_u32(std::uint32_t& out) noexcept;
    [[nodiscard]] bool read_i32(std::int32_t& out) noexcept;
    [[nodiscard]] bool read_f64(double& out) noexcept;

    /**
     * Read n bytes as a view into the underlying buffer and advance.
     */
    [[nodiscard]] bool read_bytes(std::size_t n, std::span<const std::uint8_t>& out) noexcept;

    /**
     * View the next n bytes without advancing.
     */
    [[nodiscard]] bool peek_bytes(std::size_t n, std::span<const std::uint8_t>& out) const noexcept;

    /**
     * True if the next bytes equal the given text. Never advances.
     */
    [[nodiscard]] bool peek_equals(std::string_view text) const noexcept;

    [[nodiscard]] bool skip(std::size_t n) noexcept;
    [[nodiscard]] bool seek(std::size_t offset) noexcept;

    /**
     * Failure result describing a read of `what` that ran past the buffer.
     */
    [[nodiscard]] decode_result out_of_bounds(std::string_view what) const;

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

// Big-endian helpers for raw pointers
inline std::uint16_t read_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) |
                                      static_cast<std::uint16_t>(p[1]));
}

inline std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

// Build a 4-byte tag constant from its text form, e.g. make_tag("8BIM")
constexpr std::uint32_t make_tag(const char (&s)[5]) noexcept {
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(s[0])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(s[1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(s[2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(s[3]));
}

} // namespace brushkit

#endif // BRUSHKIT_BYTE_CURSOR_HPP_
