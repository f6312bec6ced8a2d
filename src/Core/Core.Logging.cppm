module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error
    };

    // Messages below the minimum level are dropped before formatting reaches the sink.
    void SetMinimumLevel(Level level);
    [[nodiscard]] Level GetMinimumLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Info))
            Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Warning))
            Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Error))
            Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Debug))
            Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }

    // Per-object lifecycle chatter (cache hits, fenced drops). Debug builds only.
    template<typename... Args>
    void Trace(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Trace))
            Write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
