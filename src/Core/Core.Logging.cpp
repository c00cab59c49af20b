module;

#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;
        Sink s_Sink;

        void PrintColored(Level level, std::string_view msg)
        {
            // ANSI Color Codes
            const char* color = "\033[0m";
            const char* label = "[INFO]";

            switch (level)
            {
            case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
            case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
            case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
            case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
            }

            std::cout << color << label << msg << "\033[0m" << std::endl;
        }
    }

    Sink SetSink(Sink sink)
    {
        std::lock_guard lock(s_LogMutex);
        return std::exchange(s_Sink, std::move(sink));
    }

    void Write(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);
        if (s_Sink)
        {
            s_Sink(level, msg);
            return;
        }
        PrintColored(level, msg);
    }
}
