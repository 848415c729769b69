#include <brushkit/boundary_scan.hpp>

#include <algorithm>
#include <optional>

namespace brushkit {

namespace {

std::optional<std::size_t> find_last(std::span<const std::uint8_t> blob, std::string_view needle) {
    if (needle.empty() || needle.size() > blob.size()) {
        return std::nullopt;
    }
    const auto it = std::find_end(blob.begin(), blob.end(), needle.begin(), needle.end(),
        [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
    if (it == blob.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - blob.begin());
}

} // namespace

decode_result find_embedded_image(std::span<const std::uint8_t> blob,
                                  byte_range& range,
                                  const image_signature& signature) {
    const auto last_start = find_last(blob, signature.start);
    if (!last_start) {
        return decode_result::failure(decode_error::no_image_found,
            "No image start signature in " + std::to_string(blob.size()) + "-byte blob");
    }

    const auto last_end = find_last(blob, signature.end);
    if (!last_end) {
        return decode_result::failure(decode_error::no_image_found,
            "No image end signature in " + std::to_string(blob.size()) + "-byte blob");
    }

    const std::size_t begin = *last_start >= signature.bytes_before_start
        ? *last_start - signature.bytes_before_start
        : 0;
    const std::size_t end = std::min(*last_end + signature.bytes_after_end, blob.size());

    if (end <= begin) {
        return decode_result::failure_at(decode_error::no_image_found, *last_end,
            "Image end signature precedes start signature at " + std::to_string(*last_start));
    }

    range = {begin, end};
    return decode_result::success();
}

} // namespace brushkit
