#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

namespace Strata
{
    enum class LogLevel : std::uint8_t
    {
        Debug = 0,
        Info,
        Warn,
        Error,
        Fatal,
        Off
    };

    [[nodiscard]] constexpr const char* ToString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warn: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Fatal: return "FATAL";
            default: return "OFF";
        }
    }

    /**
     * @brief Sink for log messages
     *
     * Implementations must be thread-safe if the world is used from several threads.
     */
    class ILogger
    {
    public:
        virtual ~ILogger() = default;

        /**
         * @param level Severity
         * @param tag Subsystem tag ("World", "Archetype", ...)
         * @param message Message body
         */
        virtual void Write(LogLevel level, std::string_view tag, std::string_view message) = 0;
    };

    class StderrLogger final : public ILogger
    {
    public:
        void Write(LogLevel level, std::string_view tag, std::string_view message) override
        {
            std::lock_guard lock(m_mutex);
            std::fprintf(stderr, "[%s] [%.*s] %.*s\n",
                ToString(level),
                static_cast<int>(tag.size()), tag.data(),
                static_cast<int>(message.size()), message.data());
        }

    private:
        std::mutex m_mutex;
    };

    /**
     * @brief Static logging facade used by every Strata module
     *
     * The default sink writes to stderr with a minimum level of Warn.
     * SetLogger(nullptr) restores the default sink.
     */
    class Log final
    {
    public:
        Log() = delete;

        static void SetLogger(ILogger* logger) noexcept
        {
            State().logger.store(logger ? logger : &DefaultLogger(), std::memory_order_release);
        }

        static void SetMinLevel(LogLevel level) noexcept
        {
            State().minLevel.store(level, std::memory_order_relaxed);
        }

        [[nodiscard]] static LogLevel GetMinLevel() noexcept
        {
            return State().minLevel.load(std::memory_order_relaxed);
        }

        [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept
        {
            return level >= GetMinLevel() && level != LogLevel::Off;
        }

        static void Write(LogLevel level, std::string_view tag, std::string_view message)
        {
            if (!IsEnabled(level))
                return;
            State().logger.load(std::memory_order_acquire)->Write(level, tag, message);
        }

        static void Debug(std::string_view tag, std::string_view message) { Write(LogLevel::Debug, tag, message); }
        static void Info(std::string_view tag, std::string_view message) { Write(LogLevel::Info, tag, message); }
        static void Warn(std::string_view tag, std::string_view message) { Write(LogLevel::Warn, tag, message); }
        static void Error(std::string_view tag, std::string_view message) { Write(LogLevel::Error, tag, message); }
        static void Fatal(std::string_view tag, std::string_view message) { Write(LogLevel::Fatal, tag, message); }

    private:
        struct LogState
        {
            std::atomic<ILogger*> logger{&DefaultLogger()};
            std::atomic<LogLevel> minLevel{LogLevel::Warn};
        };

        static StderrLogger& DefaultLogger() noexcept
        {
            static StderrLogger s_logger;
            return s_logger;
        }

        static LogState& State() noexcept
        {
            static LogState s_state;
            return s_state;
        }
    };
}
