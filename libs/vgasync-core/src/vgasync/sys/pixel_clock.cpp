#include <vgasync/sys/pixel_clock.hpp>

#include <vgasync/util/dev_log.hpp>

namespace vgasync::sys {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // clock

    struct clock {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "PixelClock";
    };

} // namespace grp

PixelClock::PixelClock(vga::TimingGenerator &generator)
    : m_generator(generator) {
    Reset();
}

void PixelClock::Reset() {
    m_level = false;
    m_ticks = 0;
    m_halfPeriods = 0;
}

bool PixelClock::HalfPeriod() {
    ++m_halfPeriods;
    m_level = !m_level;
    if (!m_level) {
        return false;
    }

    ++m_ticks;
    const vga::TimingOutputs outputs = m_generator.Tick(m_inputs);
    if constexpr (devlog::trace_enabled<grp::clock>) {
        devlog::trace<grp::clock>("Tick {}: active={} hsync={} vsync={}", m_ticks, outputs.active, outputs.hSync,
                                  outputs.vSync);
    }
    return true;
}

void PixelClock::Run(uint64 ticks) {
    for (uint64 i = 0; i < ticks;) {
        if (HalfPeriod()) {
            ++i;
        }
    }
}

} // namespace vgasync::sys
