#pragma once

#include <chrono>

namespace vrmi::core {

    class Timer {
    public:
        Timer() { reset(); }

        void reset() {
            m_start = std::chrono::steady_clock::now();
        }

        [[nodiscard]] double elapsedMs() const {
            const auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - m_start).count();
        }

    private:
        std::chrono::steady_clock::time_point m_start;
    };

}
