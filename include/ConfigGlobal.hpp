#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string DestinationPath;
    extern std::string LogDir;
    extern std::string LogLevel;
    extern bool LogToDevice;
    extern bool ConsoleOutput;
    extern unsigned short int MaxLogFiles;

    //Classification
    extern std::string Pattern;
    extern std::string FolderStructure;
    extern std::string UnmatchedFolder;

    //Transfer
    extern unsigned short int MaxWorkers;
    extern size_t BufferSize;
    extern bool VerifyChecksums;
    extern unsigned short int MaxRetries;
    extern unsigned int RetryBackoffMs;
    extern std::vector<std::string> PriorityPrefixes;

    //Device Detection
    extern uint64_t MinDeviceSize;
    extern std::vector<std::string> AllowedFilesystems;
    extern std::vector<std::string> DeviceExcludes;
    extern bool AutoMount;
    extern std::string MountBase;
    extern unsigned short int PollIntervalSeconds;
    extern unsigned short int SettleDelaySeconds;

    void InitializeDefaults();
}
