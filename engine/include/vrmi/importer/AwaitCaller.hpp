#pragma once

#include "vrmi/core/FramePacer.hpp"

#include <cstdint>
#include <optional>

namespace vrmi::importer {

// Host side of a yield point. nextFrame() returns false to stop the import
// from being resumed.
class AwaitCaller {
public:
    virtual ~AwaitCaller() = default;
    virtual bool nextFrame() = 0;
};

// Resumes immediately. Counts yields; optionally stops after a number of them.
class ImmediateAwaitCaller : public AwaitCaller {
public:
    ImmediateAwaitCaller() = default;
    explicit ImmediateAwaitCaller(uint32_t stopAfter) : m_stopAfter(stopAfter) {}

    bool nextFrame() override {
        ++m_yieldCount;
        return !m_stopAfter || m_yieldCount < *m_stopAfter;
    }

    uint32_t yieldCount() const { return m_yieldCount; }

private:
    uint32_t m_yieldCount = 0;
    std::optional<uint32_t> m_stopAfter;
};

// Resumes once per frame of the target rate
class FramePacedAwaitCaller : public AwaitCaller {
public:
    explicit FramePacedAwaitCaller(double targetFps) : m_pacer(targetFps) {}

    bool nextFrame() override {
        m_pacer.waitForNextFrame();
        return true;
    }

    uint64_t framesWaited() const { return m_pacer.framesPaced(); }

private:
    core::FramePacer m_pacer;
};

} // namespace vrmi::importer
