#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    NONE,
    INFO,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    bool Init(const std::string& logDir);
    void Close();

    void Log(LogLevel Level, const std::string& Message);
    void Write(const std::string& Message);
    void Info(const std::string& Message);
    void Error(const std::string& Message);

    // Deletes files in the log directory last modified more than RetentionDays ago.
    void CleanupOldLogs(unsigned short int RetentionDays);

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::string LogDir;
    std::mutex LogWriteMutex;

    std::string GetTimestamp() const;
    std::string LevelToTag(LogLevel Level) const;

    bool OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
