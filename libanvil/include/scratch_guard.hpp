#ifndef ANVIL_SCRATCH_GUARD_HPP
#define ANVIL_SCRATCH_GUARD_HPP

#include "codec_service.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief Removes scratch buffers from a codec service when it goes out of scope.
 *
 * Names are registered before the invocation that creates them runs, so a
 * failed or cancelled invocation leaves nothing behind either.
 */
class ScratchGuard {
public:
    explicit ScratchGuard(ICodecService& codec) : codec_(codec) {}

    ~ScratchGuard() {
        for (const auto& name : names_) {
            try {
                codec_.remove_buffer(name);
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Warning, "Failed to release scratch buffer " + name + ": " + e.what(), "scratch");
            }
        }
    }

    ScratchGuard(const ScratchGuard&) = delete;
    ScratchGuard& operator=(const ScratchGuard&) = delete;

    /**
     * @brief Take ownership of @p name.
     * @return The name, for inline use.
     */
    std::string own(std::string name) {
        names_.push_back(name);
        return name;
    }

private:
    ICodecService& codec_;
    std::vector<std::string> names_;
};

} // namespace anvil

#endif // ANVIL_SCRATCH_GUARD_HPP
