#include <brushkit/types.hpp>

namespace brushkit {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                    return "none";
        case decode_error::out_of_bounds:           return "out_of_bounds";
        case decode_error::unsupported_version:     return "unsupported_version";
        case decode_error::malformed_header:        return "malformed_header";
        case decode_error::unrecognized_value_type: return "unrecognized_value_type";
        case decode_error::no_image_found:          return "no_image_found";
        case decode_error::invalid_format:          return "invalid_format";
        case decode_error::unsupported_encoding:    return "unsupported_encoding";
        case decode_error::unsupported_bit_depth:   return "unsupported_bit_depth";
        case decode_error::dimensions_exceeded:     return "dimensions_exceeded";
        case decode_error::limit_exceeded:          return "limit_exceeded";
        case decode_error::io_error:                return "io_error";
        case decode_error::internal_error:          return "internal_error";
    }
    return "unknown";
}

std::string tag_to_string(std::uint32_t tag) {
    std::string result(4, '?');
    for (int i = 0; i < 4; ++i) {
        const auto c = static_cast<char>((tag >> (24 - i * 8)) & 0xFF);
        if (c >= 0x20 && c < 0x7F) {
            result[static_cast<std::size_t>(i)] = c;
        }
    }
    return result;
}

} // namespace brushkit
