#include "Core/Logger.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace
{
    void SetEnv(const char* name, const char* value) noexcept
    {
#if defined(_WIN32) || defined(_WIN64)
        _putenv_s(name, value ? value : "");
#else
        if (value)
        {
            setenv(name, value, 1);
        }
        else
        {
            unsetenv(name);
        }
#endif
    }

    [[nodiscard]] std::optional<std::string> GetEnv(const char* name)
    {
        if (const char* value = std::getenv(name))
        {
            return std::string(value);
        }
        return std::nullopt;
    }

    [[nodiscard]] int CheckEnvironmentConfiguration()
    {
        using pvr::core::Logger;
        using pvr::core::LogLevel;

        Logger::SetMinLevel(LogLevel::Warn);
        Logger::SetCategoryEqualsFilter(nullptr);

        SetEnv("PVR_LOG_LEVEL", "error");
        SetEnv("PVR_LOG_CATEGORY", nullptr);
        Logger::ConfigureFromEnvironment();
        if (Logger::GetMinLevel() != LogLevel::Error ||
            Logger::IsEnabled(LogLevel::Warn, "Recorder") ||
            !Logger::IsEnabled(LogLevel::Error, "Recorder"))
        {
            return 1;
        }

        // Unknown names keep the current level, however often they are applied.
        SetEnv("PVR_LOG_LEVEL", "chatty");
        Logger::ConfigureFromEnvironment();
        Logger::ConfigureFromEnvironment();
        if (Logger::GetMinLevel() != LogLevel::Error)
        {
            return 2;
        }

        SetEnv("PVR_LOG_LEVEL", "verbose");
        SetEnv("PVR_LOG_CATEGORY", "Devices");
        Logger::ConfigureFromEnvironment();
        if (Logger::GetMinLevel() != LogLevel::Verbose ||
            !Logger::IsEnabled(LogLevel::Verbose, "Devices") ||
            Logger::IsEnabled(LogLevel::Error, "Loader") ||
            Logger::IsEnabled(LogLevel::Error, nullptr))
        {
            return 3;
        }

        // Fatal lines are never filtered.
        if (!Logger::IsEnabled(LogLevel::Fatal, "Loader"))
        {
            return 4;
        }

        // An empty category clears the filter.
        SetEnv("PVR_LOG_CATEGORY", "");
        Logger::ConfigureFromEnvironment();
#if defined(_WIN32) || defined(_WIN64)
        // _putenv_s with an empty value removes the variable, leaving the filter set.
        Logger::SetCategoryEqualsFilter(nullptr);
#endif
        if (!Logger::IsEnabled(LogLevel::Error, "Loader"))
        {
            return 5;
        }

        return 0;
    }
} // namespace

int RunLoggerSmoke()
{
    using pvr::core::Logger;

    const pvr::core::LogLevel previousLevel = Logger::GetMinLevel();
    const std::optional<std::string> previousLevelEnv = GetEnv("PVR_LOG_LEVEL");
    const std::optional<std::string> previousCategoryEnv = GetEnv("PVR_LOG_CATEGORY");

    const int result = CheckEnvironmentConfiguration();

    SetEnv("PVR_LOG_LEVEL", previousLevelEnv ? previousLevelEnv->c_str() : nullptr);
    SetEnv("PVR_LOG_CATEGORY", previousCategoryEnv ? previousCategoryEnv->c_str() : nullptr);
    Logger::SetMinLevel(previousLevel);
    Logger::SetCategoryEqualsFilter(nullptr);
    Logger::ConfigureFromEnvironment();

    return result;
}
