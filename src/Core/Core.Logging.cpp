module;

#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;

import :Logging;

namespace Core::Log
{
    namespace
    {
        // Global lock to prevent scrambled output from multiple threads
        std::mutex s_LogMutex;

#ifndef NDEBUG
        std::atomic<Level> s_MinimumLevel{Level::Debug};
#else
        std::atomic<Level> s_MinimumLevel{Level::Info};
#endif
    }

    void SetMinimumLevel(Level level)
    {
        s_MinimumLevel.store(level, std::memory_order_relaxed);
    }

    Level GetMinimumLevel()
    {
        return s_MinimumLevel.load(std::memory_order_relaxed);
    }

    bool IsEnabled(Level level)
    {
        return static_cast<int>(level) >= static_cast<int>(GetMinimumLevel());
    }

    void Write(Level level, std::string_view msg)
    {
        std::lock_guard lock(s_LogMutex);

        // ANSI Color Codes
        const char* color = "\033[0m";
        const char* label = "[INFO] ";

        switch (level) {
        case Level::Trace:   color = "\033[90m"; label = "[TRC]  "; break; // Grey
        case Level::Debug:   color = "\033[36m"; label = "[DBG]  "; break; // Cyan
        case Level::Info:    color = "\033[32m"; label = "[INFO] "; break; // Green
        case Level::Warning: color = "\033[33m"; label = "[WARN] "; break; // Yellow
        case Level::Error:   color = "\033[31m"; label = "[ERR]  "; break; // Red
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << label << msg << "\033[0m" << std::endl;
    }
}
