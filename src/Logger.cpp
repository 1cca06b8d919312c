#include "Logger.hpp"
#include "TimeUtils.hpp"
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

static const std::string LogFilePrefix = "CrossSave_Log";

bool Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    if (!FS::exists(LogDir, ec))
    {
        FS::create_directories(LogDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogDir << " - " << ec.message() << "\n";
            return false;
        }
    }

    CurrentLogFilePath = (FS::path(LogDir) / (LogFilePrefix + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("CrossSave Started at " + GetTimestamp());
    return IsOpen();
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("CrossSave Finished at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (LogFile.is_open())
    {
        LogFile.close();
    }

    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

bool Logger::IsOpen()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

void Logger::CleanupOldLogs(const std::string& LogDir, unsigned short int MaxLogFiles)
{
    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDir, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find(LogFilePrefix) == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if (ec)
    {
        Error("[Logger] Failed to list log directory " + LogDir + ": " + ec.message());
        return;
    }

    if (Logs.size() <= MaxLogFiles)
    {
        return;
    }

    // Filenames embed the timestamp, so name order is age order
    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while (Logs.size() > MaxLogFiles)
    {
        std::error_code RemoveError;
        if (Logs.front().path().string() != CurrentLogFilePath)
        {
            FS::remove(Logs.front(), RemoveError);
            if (RemoveError)
            {
                Error("[Logger] Failed to remove old log " + Logs.front().path().string() + ": " + RemoveError.message());
            }
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    return FormatLocalTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
}

std::string Logger::GetTimestamp() const
{
    return FormatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
