//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file encoder.hpp
 * @brief Encoder interface and the per-image invocation boundary.
 */

#ifndef WEBPRESS_ENCODER_HPP
#define WEBPRESS_ENCODER_HPP

#include "image_format.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace webpress {

inline constexpr int kMinQuality = 10;
inline constexpr int kMaxQuality = 100;

[[nodiscard]] constexpr int clamp_quality(const int quality) noexcept {
    return std::clamp(quality, kMinQuality, kMaxQuality);
}

/**
 * @brief Everything needed to encode one image.
 */
struct EncodeRequest {
    std::filesystem::path source;                   ///< Image to encode
    std::filesystem::path target;                   ///< Where the WebP file must be written
    int quality = 80;                               ///< 10..100
    ImageFormat source_format = ImageFormat::Unknown; ///< Actual format of source
};

/**
 * @brief Result of encoding one image. Transient, never stored per image.
 */
struct ConversionOutcome {
    bool success = false;
    std::uintmax_t original_size = 0;
    std::uintmax_t converted_size = 0;           ///< 0 on failure
    std::optional<std::string> error_message;    ///< Starts with the source file name
};

/**
 * @brief Interface for an image encoder.
 *
 * Implementations wrap one encoding backend. encode() may report a
 * failure either through the returned outcome or by throwing; callers go
 * through invoke_encoder(), which turns both into an outcome.
 */
class IEncoder {
public:
    virtual ~IEncoder() = default;

    /// @return Human-readable name of the encoder (e.g. "cwebp").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Checks whether the encoder can be used at all.
     *
     * Called once per run, before any folder work.
     */
    [[nodiscard]] virtual bool is_available() = 0;

    /**
     * @brief Encodes request.source into request.target.
     *
     * Only success and error_message of the result are meaningful; the
     * sizes are filled in by invoke_encoder().
     */
    virtual ConversionOutcome encode(const EncodeRequest& request) = 0;
};

/**
 * @brief Runs one encoding and never lets a failure escape.
 *
 * Fills original_size from the source file and, on success,
 * converted_size from the produced file (0 if it is unexpectedly missing).
 * Exceptions thrown by the encoder become a failed outcome whose message
 * is scoped to the source file name.
 */
ConversionOutcome invoke_encoder(IEncoder& encoder, const EncodeRequest& request) noexcept;

} // namespace webpress

#endif // WEBPRESS_ENCODER_HPP
