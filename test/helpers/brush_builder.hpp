#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace test_helpers {

// Big-endian byte writer for building synthetic brush files
class be_writer {
public:
    be_writer& u8(std::uint8_t v) {
        bytes_.push_back(v);
        return *this;
    }

    be_writer& u16(std::uint16_t v) {
        bytes_.push_back(static_cast<std::uint8_t>(v >> 8));
        bytes_.push_back(static_cast<std::uint8_t>(v));
        return *this;
    }

    be_writer& u32(std::uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>(v >> shift));
        }
        return *this;
    }

    be_writer& i32(std::int32_t v) {
        return u32(static_cast<std::uint32_t>(v));
    }

    be_writer& f64(double v) {
        const auto bits = std::bit_cast<std::uint64_t>(v);
        for (int shift = 56; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>(bits >> shift));
        }
        return *this;
    }

    // Raw ASCII bytes, no length prefix
    be_writer& text(std::string_view s) {
        bytes_.insert(bytes_.end(), s.begin(), s.end());
        return *this;
    }

    be_writer& bytes(const std::vector<std::uint8_t>& b) {
        bytes_.insert(bytes_.end(), b.begin(), b.end());
        return *this;
    }

    be_writer& zeros(std::size_t n) {
        bytes_.insert(bytes_.end(), n, 0);
        return *this;
    }

    be_writer& pad4() {
        while (bytes_.size() % 4 != 0) {
            bytes_.push_back(0);
        }
        return *this;
    }

    // Length-prefixed ASCII string (compact string with a nonzero length)
    be_writer& compact(std::string_view s) {
        return u32(static_cast<std::uint32_t>(s.size())).text(s);
    }

    // Packed 4-character key (compact string with a zero length)
    be_writer& key(std::string_view code) {
        return u32(0).text(code);
    }

    // u32 count of UTF-16BE code units, ASCII input only
    be_writer& unicode(std::string_view s, bool nul_terminated = true) {
        u32(static_cast<std::uint32_t>(s.size() + (nul_terminated ? 1 : 0)));
        for (char c : s) {
            u16(static_cast<std::uint8_t>(c));
        }
        if (nul_terminated) {
            u16(0);
        }
        return *this;
    }

    // Overwrite a big-endian u32 written earlier, e.g. a length field
    void patch_u32(std::size_t pos, std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            bytes_[pos + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(v >> (24 - 8 * i));
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return bytes_; }

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace test_helpers
