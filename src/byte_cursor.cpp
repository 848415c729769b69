#include <brushkit/byte_cursor.hpp>

#include <bit>
#include <string>

namespace brushkit {

bool byte_cursor::read_fixed(std::size_t width, bool is_signed, std::int64_t& out,
                             bool big_endian) noexcept {
    if (width != 1 && width != 2 && width != 4 && width != 8) {
        return false;
    }
    if (width > remaining()) {
        return false;
    }

    const std::uint8_t* p = data_.data() + offset_;
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const std::size_t idx = big_endian ? i : width - 1 - i;
        v = (v << 8) | p[idx];
    }

    if (is_signed && width < 8) {
        const std::uint64_t sign_bit = 1ULL << (width * 8 - 1);
        if (v & sign_bit) {
            v |= ~((sign_bit << 1) - 1);
        }
    }

    out = static_cast<std::int64_t>(v);
    offset_ += width;
    return true;
}

bool byte_cursor::read_u8(std::uint8_t& out) noexcept {
    if (remaining() < 1) {
        return false;
    }
    out = data_[offset_++];
    return true;
}

bool byte_cursor::read_u16(std::uint16_t& out) noexcept {
    if (remaining() < 2) {
        return false;
    }
    out = read_be16(data_.data() + offset_);
    offset_ += 2;
    return true;
}

bool byte_cursor::read_u32(std::uint32_t& out) noexcept {
    if (remaining() < 4) {
        return false;
    }
    out = read_be32(data_.data() + offset_);
    offset_ += 4;
    return true;
}

bool byte_cursor::read_i32(std::int32_t& out) noexcept {
    std::uint32_t v = 0;
    if (!read_u32(v)) {
        return false;
    }
    out = static_cast<std::int32_t>(v);
    return true;
}

bool byte_cursor::read_f64(double& out) noexcept {
    std::int64_t bits = 0;
    if (!read_fixed(8, false, bits)) {
        return false;
    }
    out = std::bit_cast<double>(static_cast<std::uint64_t>(bits));
    return true;
}

bool byte_cursor::read_bytes(std::size_t n, std::span<const std::uint8_t>& out) noexcept {
    if (!peek_bytes(n, out)) {
        return false;
    }
    offset_ += n;
    return true;
}

bool byte_cursor::peek_bytes(std::size_t n, std::span<const std::uint8_t>& out) const noexcept {
    if (n > remaining()) {
        return false;
    }
    out = data_.subspan(offset_, n);
    return true;
}

bool byte_cursor::peek_equals(std::string_view text) const noexcept {
    std::span<const std::uint8_t> bytes;
    if (!peek_bytes(text.size(), bytes)) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (bytes[i] != static_cast<std::uint8_t>(text[i])) {
            return false;
        }
    }
    return true;
}

bool byte_cursor::skip(std::size_t n) noexcept {
    if (n > remaining()) {
        return false;
    }
    offset_ += n;
    return true;
}

bool byte_cursor::seek(std::size_t offset) noexcept {
    if (offset > data_.size()) {
        return false;
    }
    offset_ = offset;
    return true;
}

decode_result byte_cursor::out_of_bounds(std::string_view what) const {
    return decode_result::failure_at(decode_error::out_of_bounds, offset_,
        "Unexpected end of data reading " + std::string(what));
}

} // namespace brushkit
