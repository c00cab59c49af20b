module;
#include <chrono>

export module Core:FrameClock;

export namespace Core
{
    struct FrameTime
    {
        double Delta = 0.0;   // seconds since the previous tick
        double Elapsed = 0.0; // sum of all deltas
    };

    // Per-tick time source. A Tick() on a clock that was never started starts
    // it and yields Delta == 0.
    class FrameClock
    {
    public:
        explicit FrameClock(double maxDelta = 0.25) : m_MaxDelta(maxDelta) {}

        void Start();

        // Samples the clock. Delta is clamped to MaxDelta so a debugger break or
        // a window drag does not turn into one enormous step.
        FrameTime Tick();

        [[nodiscard]] const FrameTime& GetLast() const { return m_Last; }
        [[nodiscard]] uint64_t GetFrameCount() const { return m_FrameCount; }

    private:
        using Clock = std::chrono::steady_clock;

        Clock::time_point m_Previous{};
        FrameTime m_Last{};
        double m_MaxDelta;
        uint64_t m_FrameCount = 0;
        bool m_Started = false;
    };
}
