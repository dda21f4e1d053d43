#include "efb/core/coordinator.hpp"
#include "efb/core/logger.hpp"

namespace efb {

void Coordinator::set_profile(std::string profile) {
    if (profile != profile_) {
        LOG_INFO("Switching profile: {} -> {}", profile_, profile);
    }
    profile_ = std::move(profile);
}

auto coordinator() -> Coordinator& {
    static Coordinator instance;
    return instance;
}

} // namespace efb
