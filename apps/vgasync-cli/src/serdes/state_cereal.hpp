#pragma once

#include <vgasync/state/state_timing.hpp>

#include <vgasync/core/types.hpp>

#include <cereal/cereal.hpp>

namespace vgasync::state {

// Current save state format version.
// Increment if there are any changes to the serializers.
inline constexpr uint32 kVersion = 1;

} // namespace vgasync::state

CEREAL_CLASS_VERSION(vgasync::state::TimingState, vgasync::state::kVersion);

namespace vgasync::state {

template <class Archive>
void serialize(Archive &ar, TimingState &s, [[maybe_unused]] const uint32 version) {
    ar(s.hPos, s.vPos);
    ar(s.active, s.hSync, s.vSync);
    ar(s.frameCount);
}

} // namespace vgasync::state
