#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

namespace vrmi::core {

// Sleeps the calling thread so that successive waitForNextFrame() calls are
// spaced by one frame interval. A non-positive rate disables pacing.
class FramePacer {
public:
    explicit FramePacer(double targetFps = 60.0)
        : m_targetFps(targetFps), m_nextFrameTime(std::chrono::steady_clock::now()) {}

    void setTargetFps(double targetFps) { m_targetFps = targetFps; }
    [[nodiscard]] double targetFps() const { return m_targetFps; }
    [[nodiscard]] uint64_t framesPaced() const { return m_frames; }

    void waitForNextFrame() {
        using namespace std::chrono;
        ++m_frames;

        if (m_targetFps <= 0.0) {
            m_nextFrameTime = steady_clock::now();
            return;
        }

        const auto interval = duration_cast<steady_clock::duration>(duration<double>(1.0 / m_targetFps));
        m_nextFrameTime += interval;

        const auto now = steady_clock::now();

        // More than 100ms behind: resynchronize instead of bursting frames.
        if (now > m_nextFrameTime + milliseconds(100)) {
            m_nextFrameTime = now;
            return;
        }

        if (m_nextFrameTime > now) {
            std::this_thread::sleep_until(m_nextFrameTime);
        }
    }

private:
    double m_targetFps;
    uint64_t m_frames = 0;
    std::chrono::steady_clock::time_point m_nextFrameTime;
};

} // namespace vrmi::core
