#include <vgasync/hw/vga/timing_generator.hpp>

#include <vgasync/util/dev_log.hpp>

namespace vgasync::vga {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   state

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "TimingGen";
    };

    struct state : public base {
        static constexpr std::string_view name = "TimingGen-State";
    };

} // namespace grp

TimingGenerator::TimingGenerator(const TimingProfile &profile) {
    SetProfile(profile);
}

void TimingGenerator::SetProfile(const TimingProfile &profile) {
    m_profile = profile;
    if (auto result = ValidateProfile(m_profile); !result) {
        devlog::warn<grp::base>("Inconsistent timing profile: {}", result.string());
    }

    Reset();
}

void TimingGenerator::Reset() {
    m_state.Reset();
    devlog::info<grp::base>("Reset; {}x{} visible, {}x{} total", m_profile.hVisible, m_profile.vVisible,
                            m_profile.hTotal, m_profile.vTotal);
}

TimingOutputs TimingGenerator::Tick(const TimingInputs &inputs) {
    const TimingOutputs prevOutputs = GetOutputs();
    bool frameStarted = false;

    if (inputs.resetActive) {
        m_state.Clear();
    } else {
        if (inputs.enable) {
            frameStarted = Count();
        } else {
            // Counters hold their position while disabled
            m_state.active = false;
            m_state.hSync = false;
            m_state.vSync = false;
        }

        if (inputs.sync) {
            m_state.Clear();
            frameStarted = false;
        }
    }

    const TimingOutputs outputs = GetOutputs();

    if (outputs.hSync != prevOutputs.hSync) {
        devlog::trace<grp::base>("({:3d}, {:4d}) HSYNC {}", m_state.vPos, m_state.hPos, outputs.hSync ? "on" : "off");
        m_cbHSyncChange(outputs.hSync);
    }
    if (outputs.vSync != prevOutputs.vSync) {
        devlog::debug<grp::base>("({:3d}, {:4d}) VSYNC {}", m_state.vPos, m_state.hPos, outputs.vSync ? "on" : "off");
        m_cbVSyncChange(outputs.vSync);
    }
    if (frameStarted) {
        m_cbFrameStart(m_state.frameCount);
    }

    return outputs;
}

FORCE_INLINE bool TimingGenerator::Count() {
    // Every comparison below reads the counters as they entered the tick
    const uint32 hPos = m_state.hPos;
    const uint32 vPos = m_state.vPos;
    bool frameStarted = false;

    m_state.hPos = hPos + 1;

    m_state.hSync = hPos >= m_profile.HSyncStart() && hPos < m_profile.HSyncEnd();

    if (hPos == m_profile.hTotal) {
        // The line restarts at 1: the rollover tick itself is the first pixel of the new line
        m_state.hPos = 1;
        if (vPos == m_profile.vTotal - 1) {
            m_state.vPos = 0;
            ++m_state.frameCount;
            frameStarted = true;
            devlog::debug<grp::base>("Frame {} complete", m_state.frameCount);
        } else {
            m_state.vPos = vPos + 1;
        }
    }

    m_state.vSync = vPos >= m_profile.VSyncStart() && vPos < m_profile.VSyncEnd();

    m_state.active = hPos < m_profile.hVisible || hPos == m_profile.hTotal;

    return frameStarted;
}

// -----------------------------------------------------------------------------
// Save states

void TimingGenerator::SaveState(state::TimingState &state) const {
    m_state.SaveState(state);
}

bool TimingGenerator::ValidateState(const state::TimingState &state) const {
    if (state.hPos > m_profile.hTotal) {
        devlog::debug<grp::state>("Horizontal position {} is past the line total {}", state.hPos, m_profile.hTotal);
        return false;
    }
    if (state.vPos >= m_profile.vTotal) {
        devlog::debug<grp::state>("Vertical position {} is past the last line {}", state.vPos, m_profile.vTotal);
        return false;
    }
    return true;
}

void TimingGenerator::LoadState(const state::TimingState &state) {
    m_state.LoadState(state);
    devlog::debug<grp::state>("Loaded state at ({}, {}), frame {}", m_state.vPos, m_state.hPos, m_state.frameCount);
}

} // namespace vgasync::vga
