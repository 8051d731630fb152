#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <unordered_map>

enum class LogLevel
{
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    void Init(const std::string& logDir);
    void Log(LogLevel Level, const std::string& Message);
    void Debug(const std::string& Message);
    void Info(const std::string& Message);
    void Success(const std::string& Message);
    void Warning(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs();

    // Device scoped entries go to the server log and, when a device log is open, to the device as well.
    bool CreateDeviceLog(const std::string& DeviceName, const std::string& MountPath);
    void CloseDeviceLog(const std::string& DeviceName);
    std::string GetDeviceLogPath(const std::string& DeviceName);
    void DeviceLog(LogLevel Level, const std::string& DeviceName, const std::string& Message);
    void DeviceInfo(const std::string& DeviceName, const std::string& Message);
    void DeviceSuccess(const std::string& DeviceName, const std::string& Message);
    void DeviceWarning(const std::string& DeviceName, const std::string& Message);
    void DeviceError(const std::string& DeviceName, const std::string& Message);

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::unordered_map<std::string, std::unique_ptr<std::ofstream>> DeviceLogFiles;
    std::unordered_map<std::string, std::string> DeviceLogPaths;
    std::mutex LogWriteMutex;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;
    bool IsEnabled(LogLevel Level) const;
    void Write(LogLevel Level, const std::string& DeviceName, const std::string& Message);

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
