// Logger.h
#pragma once
#include <string>
#include <functional>

enum class LogLevel {
    Info,
    Warning,
    Error
};

// Messages are forwarded to the host-installed sink; without one they are dropped.
class Logger {
public:
    static void Log(const std::string& message);
    static void LogWarning(const std::string& message);
    static void LogError(const std::string& message);

    static void SetCallback(std::function<void(const std::string&, LogLevel)> cb) { s_Callback = std::move(cb); }
    static void ClearCallback() { s_Callback = nullptr; }

private:
    static std::function<void(const std::string&, LogLevel)> s_Callback;
};
