#include "splat/FrameMonitor.hpp"

namespace splat {

void FrameMonitor::frame_tick(Clock::time_point now) {
    if (m_has_last_frame) {
        const std::chrono::duration<double> interval = now - m_last_frame;
        m_stats.frame_time = interval.count();
        if (interval > FRAME_DROP_THRESHOLD) {
            ++m_stats.dropped_frames;
        }
    }
    m_last_frame = now;
    m_has_last_frame = true;
    ++m_stats.frames;
}

void FrameMonitor::end_render(Clock::time_point now) {
    m_stats.render_time = std::chrono::duration<double>(now - m_render_start).count();
}

} // namespace splat
