#include "Logger.hpp"
#include "ConfigGlobal.hpp"
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

void Logger::Init(const std::string& logDir)
{
    std::error_code ec;
    if (!FS::exists(logDir, ec))
    {
        FS::create_directories(logDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << logDir << " - " << ec.message() << "\n";
        }
    }

    CurrentLogFilePath = (FS::path(logDir) / ("Ingest_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Ingest Server Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        LogFile << "[" << GetTimestamp() << "] [INFO] Ingest Server Stopped\n";
        LogFile.close();
    }
    for (auto& [Name, File] : DeviceLogFiles)
    {
        if (File && File->is_open())
        {
            File->close();
        }
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs()
{
    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(ConfigGlobal::LogDir, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("Ingest_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }
    if (ec)
    {
        Error("Logger: Failed to list log directory: " + ec.message());
        return;
    }

    if ((int)Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while ((int)Logs.size() > ConfigGlobal::MaxLogFiles)
    {
        std::error_code RemoveError;
        if (!FS::remove(Logs.front(), RemoveError) && RemoveError)
        {
            Warning("Logger: Failed to remove old log " + Logs.front().path().string() + " - " + RemoveError.message());
        }
        Logs.erase(Logs.begin());
    }
}

bool Logger::IsEnabled(LogLevel Level) const
{
    return Level != LogLevel::DEBUG || ConfigGlobal::LogLevel == "debug";
}

void Logger::Write(LogLevel Level, const std::string& DeviceName, const std::string& Message)
{
    if (!IsEnabled(Level))
    {
        return;
    }

    std::string Line = "[" + GetTimestamp() + "] [" + LevelToString(Level) + "] ";
    if (!DeviceName.empty())
    {
        Line += "[" + DeviceName + "] ";
    }
    Line += Message;

    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (ConfigGlobal::ConsoleOutput)
    {
        (Level == LogLevel::ERROR ? std::cerr : std::cout) << Line << "\n";
    }

    if (LogFile.is_open())
    {
        LogFile << Line << "\n";
        LogFile.flush();
    }

    if (!DeviceName.empty())
    {
        auto It = DeviceLogFiles.find(DeviceName);
        if (It != DeviceLogFiles.end() && It->second->is_open())
        {
            *It->second << Line << "\n";
            It->second->flush();
        }
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    Write(Level, std::string(), Message);
}

void Logger::Debug(const std::string& Message)
{
    Log(LogLevel::DEBUG, Message);
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Success(const std::string& Message)
{
    Log(LogLevel::SUCCESS, Message);
}

void Logger::Warning(const std::string& Message)
{
    Log(LogLevel::WARNING, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

bool Logger::CreateDeviceLog(const std::string& DeviceName, const std::string& MountPath)
{
    if (!ConfigGlobal::LogToDevice || MountPath.empty())
    {
        return true;
    }

    FS::path DeviceLogPath = FS::path(MountPath) / ("ingest_log_" + GetTimestampForFilename() + "_" + DeviceName + ".txt");
    auto File = std::make_unique<std::ofstream>(DeviceLogPath, std::ios::out | std::ios::app);
    if (!File->is_open())
    {
        return false;
    }

    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    DeviceLogFiles[DeviceName] = std::move(File);
    DeviceLogPaths[DeviceName] = DeviceLogPath.string();
    return true;
}

void Logger::CloseDeviceLog(const std::string& DeviceName)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    auto It = DeviceLogFiles.find(DeviceName);
    if (It != DeviceLogFiles.end())
    {
        It->second->close();
        DeviceLogFiles.erase(It);
    }
    DeviceLogPaths.erase(DeviceName);
}

std::string Logger::GetDeviceLogPath(const std::string& DeviceName)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    auto It = DeviceLogPaths.find(DeviceName);
    return It != DeviceLogPaths.end() ? It->second : CurrentLogFilePath;
}

void Logger::DeviceLog(LogLevel Level, const std::string& DeviceName, const std::string& Message)
{
    Write(Level, DeviceName, Message);
}

void Logger::DeviceInfo(const std::string& DeviceName, const std::string& Message)
{
    DeviceLog(LogLevel::INFO, DeviceName, Message);
}

void Logger::DeviceSuccess(const std::string& DeviceName, const std::string& Message)
{
    DeviceLog(LogLevel::SUCCESS, DeviceName, Message);
}

void Logger::DeviceWarning(const std::string& DeviceName, const std::string& Message)
{
    DeviceLog(LogLevel::WARNING, DeviceName, Message);
}

void Logger::DeviceError(const std::string& DeviceName, const std::string& Message)
{
    DeviceLog(LogLevel::ERROR, DeviceName, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};

    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S"); // human-readable timestamp for logs
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::SUCCESS: return "SUCCESS";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR:   return "ERROR";
    default:                return "UNKNOWN";
    }
}
