#pragma once

/**
@file
@brief The pixel clock that drives the timing generator.
*/

#include <vgasync/hw/vga/timing_defs.hpp>
#include <vgasync/hw/vga/timing_generator.hpp>

#include <vgasync/core/types.hpp>

namespace vgasync::sys {

/// @brief A square-wave clock advanced one half period at a time, ticking the generator on every rising edge.
///
/// This is the single tick source of a generator: every rising edge delivers exactly one tick with the inputs held at
/// that moment, so ticks are never dropped, reordered or coalesced.
class PixelClock {
public:
    explicit PixelClock(vga::TimingGenerator &generator);

    /// @brief Brings the clock line low and clears the edge and tick counters.
    ///
    /// Does not reset the generator.
    void Reset();

    /// @brief Sets the inputs delivered to the generator on subsequent rising edges.
    void SetInputs(const vga::TimingInputs &inputs) {
        m_inputs = inputs;
    }

    const vga::TimingInputs &GetInputs() const {
        return m_inputs;
    }

    /// @brief Advances the clock by half a period.
    /// @return `true` if this was a rising edge and the generator was ticked
    bool HalfPeriod();

    /// @brief Advances the clock by the given number of full periods.
    /// @param[in] ticks the number of rising edges to deliver
    void Run(uint64 ticks);

    bool GetLevel() const {
        return m_level;
    }

    uint64 GetTickCount() const {
        return m_ticks;
    }

    uint64 GetHalfPeriodCount() const {
        return m_halfPeriods;
    }

    /// @brief Returns the generator outputs latched by the most recent rising edge.
    vga::TimingOutputs GetOutputs() const {
        return m_generator.GetOutputs();
    }

private:
    vga::TimingGenerator &m_generator;
    vga::TimingInputs m_inputs;

    bool m_level;
    uint64 m_ticks;
    uint64 m_halfPeriods;
};

} // namespace vgasync::sys
