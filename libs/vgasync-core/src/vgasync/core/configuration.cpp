#include <vgasync/core/configuration.hpp>

namespace vgasync::core {

void Configuration::NotifyObservers() {
    video.profileValidation.Notify();
    video.preset.Notify();
}

} // namespace vgasync::core
