#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Reads Key=Value lines into ConfigGlobal. List keys (PriorityPrefix, AllowedFilesystem,
// DeviceExclude) may repeat. Errors are collected, Parse fails if any were found.
class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool IsAbsolutePath(const std::string& Path);
    bool ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out);
    bool ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, uint64_t Max, uint64_t& Out);
    void ValidatePattern();

    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
