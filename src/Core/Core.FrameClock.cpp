module;
#include <algorithm>
#include <chrono>

module Core:FrameClock.Impl;
import :FrameClock;

namespace Core
{
    void FrameClock::Start()
    {
        m_Previous = Clock::now();
        m_Last = {};
        m_FrameCount = 0;
        m_Started = true;
    }

    FrameTime FrameClock::Tick()
    {
        if (!m_Started)
        {
            Start();
            ++m_FrameCount;
            return m_Last;
        }

        const Clock::time_point now = Clock::now();
        const double delta = std::chrono::duration<double>(now - m_Previous).count();
        m_Previous = now;

        m_Last.Delta = std::clamp(delta, 0.0, m_MaxDelta);
        m_Last.Elapsed += m_Last.Delta;
        ++m_FrameCount;
        return m_Last;
    }
}
