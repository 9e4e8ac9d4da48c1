/**
 * @file errors.hpp
 * @brief Exception types raised by the anvil pipeline.
 *
 * Per-candidate errors (CodecError, DecodeError, DimensionMismatchError)
 * are recovered inside the pipeline. Only OptimizationFailed and its
 * subclasses ever reach the caller of Optimizer::optimize().
 */

#ifndef ANVIL_ERRORS_HPP
#define ANVIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace anvil {

/**
 * @brief Terminal failure of an optimization run.
 */
class OptimizationFailed : public std::runtime_error {
public:
    explicit OptimizationFailed(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The source is not a readable animation (bad signature, no frames).
 */
class InputError : public OptimizationFailed {
public:
    explicit InputError(const std::string& what) : OptimizationFailed(what) {}
};

/**
 * @brief The caller requested a stop before the run completed.
 */
class OptimizationCancelled : public OptimizationFailed {
public:
    OptimizationCancelled() : OptimizationFailed("optimization cancelled") {}
};

/**
 * @brief A codec invocation failed (one configuration, one snapshot).
 */
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief An encoded buffer could not be turned into pixels.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Two pixel grids handed to a metric do not have the same geometry.
 */
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace anvil

#endif // ANVIL_ERRORS_HPP
