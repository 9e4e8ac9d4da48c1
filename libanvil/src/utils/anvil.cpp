/**
 * @file anvil.cpp
 * @brief Implementation of the public Anvil API.
 */

#include "../../include/anvil.hpp"

#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_decoder.hpp"
#include "../../include/logger.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/webp_codec_service.hpp"

#include <mutex>
#include <thread>

namespace anvil {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    AnvilObserver* observer_;
public:
    explicit BridgeLogSink(AnvilObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

// removes the bridge sink when a run ends
class ScopedSink {
    const ILogSink* sink_ = nullptr;
public:
    explicit ScopedSink(AnvilObserver* observer) {
        if (!observer) return;
        auto sink = std::make_unique<BridgeLogSink>(observer);
        sink_ = sink.get();
        Logger::add_sink(std::move(sink));
    }
    ~ScopedSink() {
        if (sink_) Logger::remove_sink(sink_);
    }
    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;
};

struct Anvil::Impl {
    WebpCodecService codec;
    ImageDecoder decoder;

    bool losslessPreferred = true;
    bool frameDedup = true;
    unsigned numThreads = std::thread::hardware_concurrency() / 2;

    AnvilObserver* observer = nullptr;
    std::mutex currentMutex;                ///< Guards currentOptimizer against the end of a run
    Optimizer* currentOptimizer = nullptr;

    /// Publishes the running optimizer to stop() for the lifetime of the guard.
    class CurrentOptimizer {
    public:
        CurrentOptimizer(Impl& impl, Optimizer& optimizer) : impl_(impl) {
            std::lock_guard lock(impl_.currentMutex);
            impl_.currentOptimizer = &optimizer;
        }
        ~CurrentOptimizer() {
            std::lock_guard lock(impl_.currentMutex);
            impl_.currentOptimizer = nullptr;
        }
        CurrentOptimizer(const CurrentOptimizer&) = delete;
        CurrentOptimizer& operator=(const CurrentOptimizer&) = delete;

    private:
        Impl& impl_;
    };

    Impl() {
        if (numThreads == 0) numThreads = 1;
    }

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;

        bus.subscribe<ProgressEvent>([obs = observer](const ProgressEvent& e) {
            obs->onProgress(std::string(to_string(e.phase)), e.percent, e.message);
        });

        bus.subscribe<CandidateEvaluatedEvent>([obs = observer](const CandidateEvaluatedEvent& e) {
            obs->onCandidate(e.index, e.evaluated, e.qualified, e.ssim, e.score);
        });

        bus.subscribe<OptimizationCompleteEvent>([obs = observer](const OptimizationCompleteEvent& e) {
            obs->onComplete(e.original_size, e.new_size, e.fallback);
        });
    }
};

Anvil::Anvil() : impl_(std::make_unique<Impl>()) {}

Anvil::~Anvil() {
    if (impl_) stop();
}

Anvil::Anvil(Anvil&&) noexcept = default;
Anvil& Anvil::operator=(Anvil&&) noexcept = default;

Anvil& Anvil::losslessPreferred(const bool val) {
    impl_->losslessPreferred = val;
    return *this;
}

Anvil& Anvil::frameDedup(const bool val) {
    impl_->frameDedup = val;
    return *this;
}

Anvil& Anvil::threads(const unsigned val) {
    impl_->numThreads = val > 0 ? val : std::thread::hardware_concurrency() / 2;
    if (impl_->numThreads == 0) impl_->numThreads = 1;
    return *this;
}

void Anvil::setObserver(AnvilObserver* observer) {
    impl_->observer = observer;
}

OptimizationResult Anvil::optimize(const std::span<const uint8_t> gif) {
    EventBus bus;
    impl_->setupEventBridging(bus);
    const ScopedSink bridge(impl_->observer);

    OptimizerOptions options;
    options.threads = impl_->numThreads;
    options.enable_dedup = impl_->frameDedup;

    Optimizer optimizer(impl_->codec, impl_->decoder, options);
    const Impl::CurrentOptimizer current(*impl_, optimizer);

    const OptimizationMode mode = impl_->losslessPreferred ? OptimizationMode::QualityPreserving
                                                           : OptimizationMode::SizePreserving;
    try {
        return optimizer.optimize(gif, mode, &bus);
    } catch (const std::exception& e) {
        if (impl_->observer) impl_->observer->onError(e.what());
        throw;
    }
}

OptimizationResult Anvil::optimize(const std::filesystem::path& path) {
    std::vector<uint8_t> data;
    try {
        data = read_file(path);
    } catch (const std::runtime_error& e) {
        if (impl_->observer) impl_->observer->onError(e.what());
        throw InputError(e.what());
    }
    Logger::log(LogLevel::Info, "Optimizing " + path.string(), "anvil");
    return optimize(std::span<const uint8_t>(data));
}

OptimizationResult Anvil::optimize_to_file(const std::filesystem::path& input, const std::filesystem::path& output) {
    OptimizationResult result = optimize(input);
    write_file(output, result.buffer);
    Logger::log(LogLevel::Info, "Wrote " + output.string() + " (" + std::to_string(result.buffer.size()) + " bytes)",
                "anvil");
    return result;
}

void Anvil::stop() {
    std::lock_guard lock(impl_->currentMutex);
    if (impl_->currentOptimizer) {
        impl_->currentOptimizer->request_stop();
    }
}

} // namespace anvil
