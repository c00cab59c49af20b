#pragma once

// =============================================================================
// Collects log lines for the lifetime of the object.
//
// Usage: #include "TestLogCapture.h" AFTER `import Core;`. Inline only.
// =============================================================================

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class LogCapture
{
public:
    struct Line
    {
        Core::Log::Level Level;
        std::string Text;
    };

    LogCapture()
    {
        m_Previous = Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
        {
            m_Lines.push_back({level, std::string(msg)});
        });
    }

    ~LogCapture() { Core::Log::SetSink(std::move(m_Previous)); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] const std::vector<Line>& Lines() const { return m_Lines; }

    [[nodiscard]] size_t Count(Core::Log::Level level) const
    {
        return static_cast<size_t>(std::count_if(m_Lines.begin(), m_Lines.end(),
                                                 [level](const Line& l) { return l.Level == level; }));
    }

    [[nodiscard]] bool Contains(Core::Log::Level level, std::string_view needle) const
    {
        return std::any_of(m_Lines.begin(), m_Lines.end(), [&](const Line& l)
        {
            return l.Level == level && l.Text.find(needle) != std::string::npos;
        });
    }

    void Clear() { m_Lines.clear(); }

private:
    std::vector<Line> m_Lines;
    Core::Log::Sink m_Previous;
};
