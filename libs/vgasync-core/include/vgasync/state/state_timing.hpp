#pragma once

#include <vgasync/core/types.hpp>

namespace vgasync::state {

namespace v1 {

    struct TimingState {
        uint32 hPos;
        uint32 vPos;
        bool active;
        bool hSync;
        bool vSync;
        uint64 frameCount;
    };

} // namespace v1

using TimingState = v1::TimingState;

} // namespace vgasync::state
