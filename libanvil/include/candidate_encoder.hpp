/**
 * @file candidate_encoder.hpp
 * @brief Turns encoding configurations into candidate buffers through the codec service.
 */

#ifndef ANVIL_CANDIDATE_ENCODER_HPP
#define ANVIL_CANDIDATE_ENCODER_HPP

#include "codec_service.hpp"
#include "encoding_config.hpp"
#include "event_bus.hpp"
#include "source_metadata.hpp"
#include "thread_pool.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief An encoded candidate.
 */
struct Candidate {
    std::size_t index = 0;       ///< Position of the configuration in the generated list
    EncodingConfig config;       ///< Configuration that produced the buffer
    std::vector<uint8_t> buffer; ///< Animated WebP bytes
    double size_kb = 0.0;        ///< buffer.size() / 1024
    std::string filter_chain;    ///< Rendered filter chain, for reports
};

/// Key-frame distances used with delta encoding.
inline constexpr int kDeltaKeyframeMin = 9;
inline constexpr int kDeltaKeyframeMax = 17;

/**
 * @brief Everything the encoder needs to know about the source of a run.
 */
struct EncodeSource {
    std::string scratch_name;                          ///< Scratch name of the source buffer
    SourceMetadata metadata;                           ///< Analyzer output
    std::optional<std::vector<uint32_t>> frames_to_keep; ///< Dedup output, if available
};

/**
 * @brief Candidate Encoder Adapter.
 *
 * @details One codec invocation per configuration (two with palette use),
 * run concurrently on a ThreadPool. A failing configuration is logged and
 * skipped without retry; every scratch buffer it created is released by a
 * ScratchGuard on every path out of the encode.
 */
class CandidateEncoder {
public:
    CandidateEncoder(ICodecService& codec, ThreadPool& pool) : codec_(codec), pool_(pool) {}

    /**
     * @brief Filter chain for a configuration, in the fixed order
     * denoise, duplicate removal, fps, scale, palette use, format.
     * @param palette Scratch name of the palette image (used when the config asks for one).
     */
    [[nodiscard]] static FilterChain build_filter_chain(const EncodingConfig& config,
                                                        const EncodeSource& source,
                                                        const std::string& palette = {});

    /**
     * @brief Encoder parameters for a configuration.
     */
    [[nodiscard]] static OutputParams build_output_params(const EncodingConfig& config);

    /**
     * @brief Encode a single configuration.
     * @return The candidate, or std::nullopt if the codec failed.
     */
    [[nodiscard]] std::optional<Candidate> encode_one(std::size_t index,
                                                      const EncodingConfig& config,
                                                      const EncodeSource& source,
                                                      EventBus* bus = nullptr,
                                                      std::stop_token st = {}) const;

    /**
     * @brief Encode every configuration concurrently.
     * @return Successful candidates in generation order.
     * @throws OptimizationFailed if no configuration produced a candidate.
     * @throws OptimizationCancelled if @p st was signalled.
     */
    [[nodiscard]] std::vector<Candidate> encode_all(const std::vector<EncodingConfig>& configs,
                                                    const EncodeSource& source,
                                                    EventBus* bus = nullptr,
                                                    std::stop_token st = {}) const;

private:
    ICodecService& codec_;
    ThreadPool& pool_;
};

} // namespace anvil

#endif // ANVIL_CANDIDATE_ENCODER_HPP
