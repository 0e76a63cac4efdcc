#pragma once

#include <chrono>
#include <cstdint>

namespace splat {

struct FrameStats {
    double frame_time = 0.0;   ///< Seconds between the last two presented frames
    double render_time = 0.0;  ///< Seconds spent recording and submitting the last frame
    uint64_t frames = 0;
    uint64_t dropped_frames = 0;
};

/**
 * @brief Frame pacing and render timing of the host loop
 *
 * Time points are passed in by the caller. The host is demand driven, so it
 * calls resume() after sleeping for input; the gap to the next frame is then
 * not measured and cannot count as a drop.
 */
class FrameMonitor {
public:
    using Clock = std::chrono::steady_clock;

    /// Frames slower than 50 fps count as dropped
    static constexpr std::chrono::duration<double> FRAME_DROP_THRESHOLD{1.0 / 50.0};

    void frame_tick(Clock::time_point now);
    void begin_render(Clock::time_point now) { m_render_start = now; }
    void end_render(Clock::time_point now);
    void resume() { m_has_last_frame = false; }

    [[nodiscard]] const FrameStats& stats() const { return m_stats; }

private:
    FrameStats m_stats;
    Clock::time_point m_last_frame{};
    Clock::time_point m_render_start{};
    bool m_has_last_frame = false;
};

} // namespace splat
