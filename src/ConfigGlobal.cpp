#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string DestinationPath;
    std::string LogDir;
    std::string LogLevel;
    bool LogToDevice;
    bool ConsoleOutput;
    unsigned short int MaxLogFiles;

    std::string Pattern;
    std::string FolderStructure;
    std::string UnmatchedFolder;

    unsigned short int MaxWorkers;
    size_t BufferSize;
    bool VerifyChecksums;
    unsigned short int MaxRetries;
    unsigned int RetryBackoffMs;
    std::vector<std::string> PriorityPrefixes;

    uint64_t MinDeviceSize;
    std::vector<std::string> AllowedFilesystems;
    std::vector<std::string> DeviceExcludes;
    bool AutoMount;
    std::string MountBase;
    unsigned short int PollIntervalSeconds;
    unsigned short int SettleDelaySeconds;

    void InitializeDefaults()
    {
        ConfigFile = "Config.txt"; //Relative to working directory unless passed on the command line
        DestinationPath.clear();
        LogDir = "Ingest_Logs";
        LogLevel = "info";
        LogToDevice = false;
        ConsoleOutput = true;
        MaxLogFiles = 10;

        Pattern = "^([^_]+)_([^_]+)_(ACam|BCam|CCam)_(.+)$";
        FolderStructure = "{client}/{project}/{camera}";
        UnmatchedFolder = "Unsorted";

        MaxWorkers = 4;
        BufferSize = 1024 * 1024;
        VerifyChecksums = true;
        MaxRetries = 0; //0 = every I/O failure is terminal for that file
        RetryBackoffMs = 500;
        PriorityPrefixes.clear();

        MinDeviceSize = 0;
        AllowedFilesystems.clear();
        DeviceExcludes.clear();
        AutoMount = true;
        MountBase = "/mnt/ingest";
        PollIntervalSeconds = 2;
        SettleDelaySeconds = 2;
    }
}
