#ifndef BRUSHKIT_PIXEL_MATRIX_HPP_
#define BRUSHKIT_PIXEL_MATRIX_HPP_

#include <brushkit/brushkit_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace brushkit {

// ============================================================================
// Pixel Matrix
// ============================================================================

/**
 * Dense row-major matrix of unsigned samples.
 *
 * A matrix with one channel is a 2D (height x width) plane; with more channels it is
 * a 3D (height x width x channels) array with interleaved channels. Samples are stored
 * as the natural unsigned integer of their width (1, 2 or 4 bytes), in host byte order.
 *
 * A zero-area matrix is valid and denotes an empty sample.
 */
class BRUSHKIT_EXPORT pixel_matrix {
public:
    pixel_matrix() = default;

    /**
     * Set the dimensions and sample width. All samples are zeroed.
     * @param height Rows (>= 0)
     * @param width Columns (>= 0)
     * @param channels Samples per pixel (>= 1)
     * @param sample_bytes 1, 2 or 4
     * @return false if the arguments are invalid or allocation failed
     */
    [[nodiscard]] bool reset(int height, int width, int channels, int sample_bytes);

    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int channels() const noexcept { return channels_; }
    [[nodiscard]] int sample_bytes() const noexcept { return sample_bytes_; }
    [[nodiscard]] int bit_depth() const noexcept { return sample_bytes_ * 8; }
    [[nodiscard]] bool is_planar() const noexcept { return channels_ == 1; }
    [[nodiscard]] bool empty() const noexcept { return height_ == 0 || width_ == 0; }

    [[nodiscard]] std::size_t sample_count() const noexcept {
        return static_cast<std::size_t>(height_) * static_cast<std::size_t>(width_) *
               static_cast<std::size_t>(channels_);
    }

    /**
     * Read one sample. Out-of-range coordinates return 0.
     */
    [[nodiscard]] std::uint32_t at(int y, int x, int c = 0) const noexcept;

    /**
     * Write one sample, truncated to the sample width. Out-of-range coordinates are ignored.
     */
    void set(int y, int x, int c, std::uint32_t value) noexcept;

    /**
     * Typed view of the sample storage.
     * T must match the sample width (std::uint8_t, std::uint16_t or std::uint32_t);
     * a mismatch yields an empty span.
     */
    template <typename T>
    [[nodiscard]] std::span<const T> samples() const noexcept {
        if (const auto* v = std::get_if<std::vector<T>>(&storage_)) {
            return *v;
        }
        return {};
    }

    template <typename T>
    [[nodiscard]] std::span<T> mutable_samples() noexcept {
        if (auto* v = std::get_if<std::vector<T>>(&storage_)) {
            return *v;
        }
        return {};
    }

    /**
     * Copy of this matrix rescaled to 8-bit samples (high byte kept).
     */
    [[nodiscard]] pixel_matrix to_8bit() const;

    /**
     * Extract one channel as a planar matrix. Returns an empty matrix if c is out of range.
     */
    [[nodiscard]] pixel_matrix channel(int c) const;

    friend bool operator==(const pixel_matrix&, const pixel_matrix&) = default;

private:
    using storage = std::variant<std::vector<std::uint8_t>,
                                 std::vector<std::uint16_t>,
                                 std::vector<std::uint32_t>>;

    [[nodiscard]] std::size_t index_of(int y, int x, int c) const noexcept {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                static_cast<std::size_t>(x)) * static_cast<std::size_t>(channels_) +
               static_cast<std::size_t>(c);
    }

    storage storage_;
    int height_ = 0;
    int width_ = 0;
    int channels_ = 1;
    int sample_bytes_ = 1;
};

} // namespace brushkit

#endif // BRUSHKIT_PIXEL_MATRIX_HPP_
