/**
 * @file codec_service.hpp
 * @brief Interface to the codec that turns source buffers into candidates.
 *
 * The optimizer only talks to the codec through named buffers in a scratch
 * space and declarative invocations (inputs + filter chain + output
 * parameters). This keeps the search logic independent of the encoder
 * and lets tests substitute a fake.
 */

#ifndef ANVIL_CODEC_SERVICE_HPP
#define ANVIL_CODEC_SERVICE_HPP

#include "encoding_config.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace anvil {

// --- Filter steps ---

/// Spatial smoothing before encoding.
struct DenoiseStep {
    int strength = 0; ///< 0..100
};

/// Drops duplicate frames; with an explicit list only those frames survive.
struct DecimateStep {
    std::vector<uint32_t> frames_to_keep; ///< Empty: detect duplicates on the fly
};

/// Resamples the timeline to a constant frame rate.
struct FpsStep {
    double fps = 10.0;
};

/// Rescales to a target width, height follows the aspect ratio.
struct ScaleStep {
    uint32_t width = 0;
    ScaleFilter filter = ScaleFilter::Lanczos;
};

/// Builds a palette image out of all frames.
struct PaletteGenStep {
    uint32_t max_colors = 256;
    bool diff_stats = true; ///< Count only pixels that changed since the previous frame
};

/// Maps frames onto the palette found in the named input.
struct PaletteUseStep {
    std::string palette;                    ///< Scratch name of the palette image
    DitherMethod dither = DitherMethod::None;
    int bayer_scale = 0;
};

/// Converts to the output pixel layout.
struct FormatStep {
    PixelFormat format = PixelFormat::Yuv420p;
};

/// Keeps a single frame (snapshot extraction).
struct SelectFrameStep {
    uint32_t index = 0;
};

using FilterStep = std::variant<DenoiseStep, DecimateStep, FpsStep, ScaleStep,
                                PaletteGenStep, PaletteUseStep, FormatStep, SelectFrameStep>;

/**
 * @brief Ordered list of filter steps applied to the primary input.
 */
class FilterChain {
public:
    FilterChain() = default;

    FilterChain& add(FilterStep step) {
        steps_.push_back(std::move(step));
        return *this;
    }

    [[nodiscard]] const std::vector<FilterStep>& steps() const noexcept { return steps_; }
    [[nodiscard]] bool empty() const noexcept { return steps_.empty(); }

    /**
     * @brief Renders the chain in ffmpeg filtergraph syntax, for logs.
     * e.g. "fps=10,scale=320:-1:flags=lanczos,format=yuva420p"
     */
    [[nodiscard]] std::string describe() const;

private:
    std::vector<FilterStep> steps_;
};

// --- Output ---

enum class OutputFormat {
    AnimatedWebp, ///< The candidate container
    Png,          ///< Lossless RGBA snapshot of a single frame
    PalettePng    ///< Palette image produced by PaletteGenStep
};

/**
 * @brief Encoder parameters of one invocation.
 */
struct OutputParams {
    OutputFormat format = OutputFormat::AnimatedWebp;
    int quality = 75;         ///< libwebp quality, 0..100
    int method = 4;           ///< libwebp method, 0..6
    bool lossless = false;
    int near_lossless = 100;  ///< libwebp scale: 100 = off (exact), 0 = strongest
    bool sharp_yuv = false;
    bool keep_alpha = false;  ///< yuva420p output
    bool allow_mixed = false; ///< Per-frame choice between lossy and lossless
    int kmin = 0;             ///< Minimum key-frame distance
    int kmax = 0;             ///< Maximum key-frame distance, 0 or 1 = all key frames
    int loop_count = 0;       ///< 0 = infinite

    /**
     * @brief Renders the parameters as encoder options, for logs.
     */
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief One request to the codec.
 */
struct CodecInvocation {
    std::vector<std::string> inputs; ///< Scratch names; the first is the primary input
    FilterChain filters;
    OutputParams params;
    std::string output;              ///< Scratch name receiving the result
};

/**
 * @brief Abstract codec with a named scratch space.
 *
 * Implementations must be safe to call from several threads at once, as
 * long as concurrent invocations use distinct output names.
 */
class ICodecService {
public:
    virtual ~ICodecService() = default;

    /**
     * @brief Store (or replace) a buffer under @p name.
     */
    virtual void write_buffer(const std::string& name, std::vector<uint8_t> data) = 0;

    /**
     * @brief Copy of the buffer stored under @p name.
     * @throws CodecError if no such buffer exists.
     */
    [[nodiscard]] virtual std::vector<uint8_t> read_buffer(const std::string& name) const = 0;

    /**
     * @brief Remove a buffer. Removing a missing name is not an error.
     */
    virtual void remove_buffer(const std::string& name) = 0;

    [[nodiscard]] virtual bool has_buffer(const std::string& name) const = 0;

    /**
     * @brief Execute an invocation, writing its output into the scratch space.
     * @param st Checked between frames; a stop request aborts with CodecError.
     * @throws CodecError on any failure; nothing is written in that case.
     */
    virtual void run(const CodecInvocation& invocation, std::stop_token st = {}) = 0;
};

/**
 * @brief Mutex-guarded name -> bytes map backing a codec scratch space.
 */
class ScratchSpace {
public:
    void put(const std::string& name, std::vector<uint8_t> data);

    /// @throws CodecError if @p name is unknown.
    [[nodiscard]] std::vector<uint8_t> get(const std::string& name) const;

    void erase(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<uint8_t>> buffers_;
};

} // namespace anvil

#endif // ANVIL_CODEC_SERVICE_HPP
