/**
 * @file anvil.hpp
 * @brief Public API for the anvil library.
 */

#ifndef ANVIL_HPP
#define ANVIL_HPP

#include "optimizer.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace anvil {

/**
 * @brief Interface for receiving progress and status events during a run.
 */
struct AnvilObserver {
    virtual ~AnvilObserver() = default;

    virtual void onProgress(const std::string& phase, double percent, const std::string& message) {}

    virtual void onCandidate(std::size_t index, bool evaluated, bool qualified, double ssim, double score) {}

    virtual void onComplete(uintmax_t size_before, uintmax_t size_after, bool fallback) {}

    virtual void onError(const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the anvil library.
 *
 * @details Wraps the optimization pipeline into a simple, blocking API
 * backed by the libwebp codec service. Uses PIMPL idiom to hide internal
 * dependencies.
 */
class Anvil {
public:
    Anvil();
    ~Anvil();

    Anvil(const Anvil&) = delete;
    Anvil& operator=(const Anvil&) = delete;
    Anvil(Anvil&&) noexcept;
    Anvil& operator=(Anvil&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Quality-preserving search (true) or size-preserving search (false).
     * Default: true.
     */
    Anvil& losslessPreferred(bool val);

    /**
     * @brief Enable or disable the frame deduplication analyzer.
     * Default: true.
     */
    Anvil& frameDedup(bool val);

    /**
     * @brief Set the number of worker threads to use.
     * Default: hardware concurrency / 2.
     */
    Anvil& threads(unsigned val);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(AnvilObserver* observer);

    // --- Execution ---

    /**
     * @brief Optimizes a GIF held in memory. Blocks until completion.
     * @throws OptimizationFailed (or a subclass) if no WebP can be produced.
     */
    OptimizationResult optimize(std::span<const uint8_t> gif);

    /**
     * @brief Reads and optimizes a GIF file.
     * @throws InputError if the file cannot be read.
     */
    OptimizationResult optimize(const std::filesystem::path& path);

    /**
     * @brief Optimizes @p input and writes the winning WebP to @p output.
     */
    OptimizationResult optimize_to_file(const std::filesystem::path& input, const std::filesystem::path& output);

    // --- Control ---

    /**
     * @brief Requests cancellation of the running optimization. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace anvil

#endif // ANVIL_HPP
