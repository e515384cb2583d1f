#include <vgasync/hw/vga/signal_monitor.hpp>

namespace vgasync::vga {

void PulseTracker::Reset() {
    m_started = false;
    m_level = false;
    m_edgeSeen = false;
    m_riseSeen = false;

    m_currentRun = 0;
    m_sinceRise = 0;

    m_lastHighRun = 0;
    m_lastLowRun = 0;
    m_lastPeriod = 0;

    m_risingEdges = 0;
    m_fallingEdges = 0;
}

PulseTracker::Edge PulseTracker::Sample(bool level) {
    ++m_sinceRise;

    if (!m_started) {
        m_started = true;
        m_level = level;
        m_currentRun = 1;
        return Edge::None;
    }

    if (level == m_level) {
        ++m_currentRun;
        return Edge::None;
    }

    // The run that just ended only counts if it started on an observed edge
    if (m_edgeSeen) {
        if (m_level) {
            m_lastHighRun = m_currentRun;
        } else {
            m_lastLowRun = m_currentRun;
        }
    }
    m_edgeSeen = true;
    m_level = level;
    m_currentRun = 1;

    if (level) {
        if (m_riseSeen) {
            m_lastPeriod = m_sinceRise;
        }
        m_riseSeen = true;
        m_sinceRise = 0;
        ++m_risingEdges;
        return Edge::Rising;
    }

    ++m_fallingEdges;
    return Edge::Falling;
}

// -----------------------------------------------------------------------------

void SignalMonitor::Reset() {
    m_active.Reset();
    m_hSync.Reset();
    m_vSync.Reset();

    m_samples = 0;

    m_activeLines = 0;
    m_lastFrameActiveLines = 0;
}

void SignalMonitor::Sample(const TimingOutputs &outputs) {
    ++m_samples;

    if (m_active.Sample(outputs.active) == PulseTracker::Edge::Rising) {
        ++m_activeLines;
    }
    m_hSync.Sample(outputs.hSync);
    if (m_vSync.Sample(outputs.vSync) == PulseTracker::Edge::Rising) {
        if (m_vSync.GetRisingEdges() > 1) {
            m_lastFrameActiveLines = m_activeLines;
        }
        m_activeLines = 0;
    }
}

} // namespace vgasync::vga
