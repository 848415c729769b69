#ifndef BRUSHKIT_CODEC_HPP_
#define BRUSHKIT_CODEC_HPP_

#include <brushkit/brushkit_export.h>
#include <brushkit/brush.hpp>
#include <brushkit/types.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace brushkit {

// ============================================================================
// Decoder Interface
// ============================================================================

/**
 * Abstract base class for byte-buffer brush decoders.
 * Used by the decoder registry for runtime polymorphism.
 */
class BRUSHKIT_EXPORT decoder {
public:
    virtual ~decoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool check(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual decode_result parse(std::span<const std::uint8_t> data,
                                              parsed_brush_file& out,
                                              const decode_options& options) const = 0;
};

// ============================================================================
// Decoder Registry
// ============================================================================

/**
 * Registry for brush decoders.
 * Built-in decoders are registered in sniff order: gbr, abr, abr_legacy, gih.
 * User code can add new decoders at runtime.
 */
class BRUSHKIT_EXPORT decoder_registry {
public:
    /**
     * Get the global decoder registry instance.
     */
    [[nodiscard]] static decoder_registry& instance();

    /**
     * Register a decoder.
     * @param dec Unique pointer to decoder (ownership transferred)
     */
    void register_decoder(std::unique_ptr<decoder> dec);

    /**
     * Find decoder by checking data.
     * @param data Raw file data
     * @return First decoder whose check() passes, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder(std::span<const std::uint8_t> data) const;

    /**
     * Find decoder by name.
     * @param name Decoder name (e.g., "gbr")
     * @return Pointer to decoder if found, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder(std::string_view name) const;

    /**
     * Find decoder for a file extension, confirmed by checking data.
     * Decoders listing the extension (case-insensitive) are tried first, then all
     * decoders in registration order.
     * @param extension File extension including the dot (e.g., ".abr")
     * @param data Raw file data
     * @return Pointer to decoder if found, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder_for_extension(std::string_view extension,
                                                            std::span<const std::uint8_t> data) const;

    /**
     * Get number of registered decoders.
     */
    [[nodiscard]] std::size_t decoder_count() const noexcept {
        return decoders_.size();
    }

    /**
     * Get decoder at index.
     * @param index Decoder index (0 to decoder_count()-1)
     * @return Pointer to decoder, or nullptr if index out of range
     */
    [[nodiscard]] const decoder* decoder_at(std::size_t index) const noexcept {
        return index < decoders_.size() ? decoders_[index].get() : nullptr;
    }

private:
    decoder_registry();
    ~decoder_registry();

    decoder_registry(const decoder_registry&) = delete;
    decoder_registry& operator=(const decoder_registry&) = delete;

    void register_builtin_decoders();

    std::vector<std::unique_ptr<decoder>> decoders_;
};

// ============================================================================
// Format Routing
// ============================================================================

enum class brush_format {
    unknown,
    gbr,
    gih,
    abr,        // Either ABR layout; resolved by check()
    brushset,   // Zip container, decoded with brushset_decoder
    sut         // SQL container, decoded with sut_decoder
};

[[nodiscard]] BRUSHKIT_EXPORT const char* to_string(brush_format format) noexcept;

/**
 * Map a file extension to a brush format.
 * @param extension Extension with or without the leading dot, any case
 * @return brush_format::unknown if not recognized
 */
[[nodiscard]] BRUSHKIT_EXPORT brush_format format_for_extension(std::string_view extension) noexcept;

// ============================================================================
// Convenience Parse Functions
// ============================================================================

/**
 * Parse a brush file (auto-detect format).
 * @param data Raw file data
 * @param out Receives version and samples; cleared first
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result parse(std::span<const std::uint8_t> data,
                                                   parsed_brush_file& out,
                                                   const decode_options& options = {});

/**
 * Parse a brush file (explicit decoder).
 * @param data Raw file data
 * @param out Receives version and samples; cleared first
 * @param decoder_name Name of decoder to use
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] BRUSHKIT_EXPORT decode_result parse(std::span<const std::uint8_t> data,
                                                   parsed_brush_file& out,
                                                   std::string_view decoder_name,
                                                   const decode_options& options = {});

} // namespace brushkit

#endif // BRUSHKIT_CODEC_HPP_
