/**
 * @file encoding_config.hpp
 * @brief Immutable description of one candidate encode.
 */

#ifndef ANVIL_ENCODING_CONFIG_HPP
#define ANVIL_ENCODING_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace anvil {

/**
 * @brief Resampling kernel applied when the frame is rescaled.
 */
enum class ScaleFilter {
    Neighbor,
    Bilinear,
    Bicubic,
    Spline,
    Lanczos
};

/**
 * @brief Dithering applied when the frames are mapped onto a palette.
 */
enum class DitherMethod {
    None,
    Bayer,          ///< Ordered dither, strength from bayer_scale
    FloydSteinberg  ///< Error diffusion
};

/**
 * @brief Chroma layout of the encoded frames.
 */
enum class PixelFormat {
    Yuv420p,  ///< Opaque
    Yuva420p  ///< With alpha plane
};

/**
 * @brief Family a configuration belongs to; selects the acceptance thresholds.
 */
enum class Strategy {
    PureLossless,
    NearLossless,
    Hybrid,
    OptimizedLossy
};

[[nodiscard]] std::string_view to_string(ScaleFilter f);
[[nodiscard]] std::string_view to_string(DitherMethod d);
[[nodiscard]] std::string_view to_string(PixelFormat p);
[[nodiscard]] std::string_view to_string(Strategy s);

/**
 * @brief One point of the encoding search space.
 *
 * Built once by the candidate generator and never modified afterwards.
 */
struct EncodingConfig {
    int quality = 75;                                  ///< 0..100
    int compression_effort = 4;                        ///< 0..6 (libwebp method)
    ScaleFilter scale_filter = ScaleFilter::Lanczos;
    DitherMethod dither = DitherMethod::None;
    int bayer_scale = 0;                               ///< 0..5, used by DitherMethod::Bayer
    PixelFormat pixel_format = PixelFormat::Yuv420p;
    bool use_palette = false;                          ///< Quantize to a generated palette first
    bool lossless = false;

    std::optional<int> near_lossless;                  ///< 0 = exact, larger = more permissive
    bool sharp_yuv = false;                            ///< Sharp RGB->YUV conversion
    std::optional<int> denoise;                        ///< Denoise strength, 0..100
    bool remove_duplicates = false;
    bool delta_encoding = false;                       ///< Sparse key frames

    Strategy strategy = Strategy::OptimizedLossy;

    /**
     * @brief Short one-line summary used in logs and reports.
     * e.g. "near-lossless q100 m6 nl20 lanczos yuva420p"
     */
    [[nodiscard]] std::string describe() const;
};

} // namespace anvil

#endif // ANVIL_ENCODING_CONFIG_HPP
