#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

bool Logger::Init(const std::string& logDir)
{
    Close();
    LogDir = logDir;

    std::error_code ec;
    FS::create_directories(LogDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory " << LogDir << ": " << ec.message() << "\n";
        return false;
    }

    CurrentLogFilePath = (FS::path(LogDir) / (GetTimestampForFilename() + ".log")).string();

    return OpenLogFile(CurrentLogFilePath);
}

Logger::~Logger()
{
    Close();
}

void Logger::Close()
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (LogFile.is_open())
    {
        LogFile.close();
    }
}

bool Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    LogFile.open(FilePath, std::ios::out | std::ios::app);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
        return false;
    }
    return true;
}

void Logger::CleanupOldLogs(unsigned short int RetentionDays)
{
    std::vector<FS::directory_entry> Logs;

    std::error_code ec;
    FS::directory_iterator It(LogDir, ec);
    for (; !ec && It != FS::directory_iterator(); It.increment(ec))
    {
        Logs.push_back(*It);
    }
    if (ec)
    {
        Error("Failed to read log directory " + LogDir + ": " + ec.message());
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    const auto Cutoff = FS::file_time_type::clock::now() - std::chrono::hours(24 * RetentionDays);

    for (const auto& Entry : Logs)
    {
        const std::string Name = Entry.path().filename().string();

        std::error_code StatError;
        if (Entry.is_directory(StatError))
        {
            continue;
        }

        FS::file_time_type MTime = FS::last_write_time(Entry.path(), StatError);
        if (StatError)
        {
            Error("Failed to get file info for " + Name + ": " + StatError.message());
            continue;
        }

        if (MTime < Cutoff)
        {
            std::error_code RemoveError;
            if (FS::remove(Entry.path(), RemoveError))
            {
                Write("Deleted old log file: " + Name);
            }
            else
            {
                Error("Failed to delete old log file " + Name + ": " + (RemoveError ? RemoveError.message() : std::string("file vanished")));
            }
        }
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    const std::string Line = GetTimestamp() + ": " + LevelToTag(Level) + Message;

    std::cout << Line << "\n";

    if (LogFile.is_open())
    {
        LogFile << Line << "\n";
        LogFile.flush();
    }
}

void Logger::Write(const std::string& Message)
{
    Log(LogLevel::NONE, Message);
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
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%d-%m-%Y"); // one log file per calendar day
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

#ifdef _WIN32
    localtime_s(&Local, &Time);
#else
    localtime_r(&Time, &Local);
#endif

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%d-%m-%Y %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToTag(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "[INFO] ";
    case LogLevel::ERROR: return "[ERROR] ";
    default:              return "";
    }
}
