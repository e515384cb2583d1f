#include <vgasync/sys/display_system.hpp>

#include <vgasync/util/dev_log.hpp>

namespace vgasync {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // system

    struct system {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "System";
    };

} // namespace grp

DisplaySystem::DisplaySystem()
    : m_generator(vga::kDefaultProfile)
    , m_clock(m_generator)
    , m_pixelClockHz(40'000'000)
    , m_profileValidation(core::config::video::ProfileValidation::Warn) {

    configuration.video.profileValidation.Observe(m_profileValidation);
    configuration.video.preset.ObserveAndNotify([&](const std::string &name) { ApplyPreset(name); });

    PowerOn();
}

void DisplaySystem::PowerOn() {
    m_generator.Reset();
    m_clock.Reset();

    m_clock.SetInputs({.resetActive = true, .enable = false, .sync = false});
    m_clock.Run(configuration.powerOn.resetTicks);
    m_clock.SetInputs({.resetActive = false, .enable = false, .sync = false});
    m_clock.Run(configuration.powerOn.disableTicks);
    m_clock.SetInputs({.resetActive = false, .enable = true, .sync = false});

    m_monitor.Reset();

    devlog::debug<grp::system>("Power-on sequence complete after {} ticks", m_clock.GetTickCount());
}

vga::ProfileCheckResult DisplaySystem::SetProfile(const vga::TimingProfile &profile, uint64 pixelClockHz) {
    auto result = vga::ValidateProfile(profile);
    if (!result) {
        if (m_profileValidation == core::config::video::ProfileValidation::Reject) {
            devlog::warn<grp::system>("Rejected timing profile: {}", result.string());
            return result;
        }
        devlog::warn<grp::system>("Using inconsistent timing profile: {}", result.string());
    }

    m_generator.SetProfile(profile);
    m_pixelClockHz = pixelClockHz;

    PowerOn();
    return result;
}

void DisplaySystem::ApplyPreset(const std::string &name) {
    const vga::Preset *preset = vga::FindPreset(name);
    if (preset == nullptr) {
        devlog::warn<grp::system>("Unknown preset \"{}\"; keeping the current profile", name);
        return;
    }
    if (preset->profile == GetProfile() && preset->pixelClockHz == m_pixelClockHz) {
        return;
    }

    devlog::info<grp::system>("Switching to preset {}", preset->description);
    if (auto result = SetProfile(preset->profile, preset->pixelClockHz); !result) {
        devlog::error<grp::system>("Preset {} is inconsistent: {}", preset->name, result.string());
    }
}

void DisplaySystem::RunTicks(uint64 ticks) {
    for (uint64 i = 0; i < ticks;) {
        if (m_clock.HalfPeriod()) {
            m_monitor.Sample(m_clock.GetOutputs());
            ++i;
        }
    }
}

void DisplaySystem::RunFrames(uint64 frames) {
    RunTicks(frames * sys::TicksPerFrame(GetProfile()));
}

void DisplaySystem::RunToEndOfFrame() {
    const vga::TimingProfile &profile = GetProfile();
    if (profile.hTotal == 0 || profile.vTotal == 0) {
        return;
    }

    // The frame wraps on the tick that enters with hPos == hTotal on the last line
    const uint64 hPos = m_generator.GetHPos();
    const uint64 vPos = m_generator.GetVPos();
    RunTicks((profile.hTotal - hPos) + (profile.vTotal - 1 - vPos) * profile.hTotal);
}

// -----------------------------------------------------------------------------
// Save states

void DisplaySystem::SaveState(state::TimingState &state) const {
    m_generator.SaveState(state);
}

bool DisplaySystem::LoadState(const state::TimingState &state) {
    if (!m_generator.ValidateState(state)) {
        return false;
    }
    m_generator.LoadState(state);
    m_monitor.Reset();
    return true;
}

} // namespace vgasync
