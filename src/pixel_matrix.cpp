#include <brushkit/pixel_matrix.hpp>

#include <algorithm>
#include <limits>
#include <new>
#include <type_traits>

namespace brushkit {

namespace {

// Sanity limit on a single matrix (1GB)
constexpr std::size_t MAX_BUFFER_SIZE = 1024ULL * 1024ULL * 1024ULL;

} // namespace

bool pixel_matrix::reset(int height, int width, int channels, int sample_bytes) {
    if (height < 0 || width < 0 || channels < 1) {
        return false;
    }
    if (sample_bytes != 1 && sample_bytes != 2 && sample_bytes != 4) {
        return false;
    }

    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t c = static_cast<std::size_t>(channels);
    const std::size_t bytes = static_cast<std::size_t>(sample_bytes);

    // Check for overflow in the sample count (h * w * c)
    std::size_t count = h;
    if (w != 0 && count > std::numeric_limits<std::size_t>::max() / w) {
        return false;
    }
    count *= w;
    if (count > std::numeric_limits<std::size_t>::max() / c) {
        return false;
    }
    count *= c;
    if (count > MAX_BUFFER_SIZE / bytes) {
        return false;
    }

    try {
        switch (sample_bytes) {
            case 1: storage_ = std::vector<std::uint8_t>(count, 0); break;
            case 2: storage_ = std::vector<std::uint16_t>(count, 0); break;
            default: storage_ = std::vector<std::uint32_t>(count, 0); break;
        }
    } catch (const std::bad_alloc&) {
        return false;
    }

    height_ = height;
    width_ = width;
    channels_ = channels;
    sample_bytes_ = sample_bytes;
    return true;
}

std::uint32_t pixel_matrix::at(int y, int x, int c) const noexcept {
    if (y < 0 || y >= height_ || x < 0 || x >= width_ || c < 0 || c >= channels_) {
        return 0;
    }
    const std::size_t i = index_of(y, x, c);
    return std::visit([i](const auto& v) -> std::uint32_t {
        return i < v.size() ? static_cast<std::uint32_t>(v[i]) : 0;
    }, storage_);
}

void pixel_matrix::set(int y, int x, int c, std::uint32_t value) noexcept {
    if (y < 0 || y >= height_ || x < 0 || x >= width_ || c < 0 || c >= channels_) {
        return;
    }
    const std::size_t i = index_of(y, x, c);
    std::visit([i, value](auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        if (i < v.size()) {
            v[i] = static_cast<T>(value);
        }
    }, storage_);
}

pixel_matrix pixel_matrix::to_8bit() const {
    pixel_matrix result;
    if (!result.reset(height_, width_, channels_, 1)) {
        return result;
    }

    auto dst = result.mutable_samples<std::uint8_t>();
    const int shift = (sample_bytes_ - 1) * 8;
    std::visit([&dst, shift](const auto& v) {
        const std::size_t n = std::min(v.size(), dst.size());
        for (std::size_t i = 0; i < n; ++i) {
            dst[i] = static_cast<std::uint8_t>(static_cast<std::uint32_t>(v[i]) >> shift);
        }
    }, storage_);
    return result;
}

pixel_matrix pixel_matrix::channel(int c) const {
    pixel_matrix result;
    if (c < 0 || c >= channels_) {
        return result;
    }
    if (!result.reset(height_, width_, 1, sample_bytes_)) {
        return result;
    }

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            result.set(y, x, 0, at(y, x, c));
        }
    }
    return result;
}

} // namespace brushkit
