#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    INFO,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    bool Init(const std::string& LogDir);
    void Log(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs(const std::string& LogDir, unsigned short int MaxLogFiles);
    bool IsOpen();

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
