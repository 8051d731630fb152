#include "LinuxDeviceDetector.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/wait.h>

namespace FS = std::filesystem;

namespace
{
    const FS::path SysClassBlock = "/sys/class/block";

    // Escapes the characters still special inside double quotes
    std::string EscapeShellChars(const std::string& Input)
    {
        std::string Output;
        for (char Ch : Input)
        {
            if (Ch == '$' || Ch == '\\' || Ch == '"' || Ch == '`')
            {
                Output += '\\';
            }
            Output += Ch;
        }
        return Output;
    }

    std::string Trim(const std::string& Value)
    {
        size_t Start = Value.find_first_not_of(" \t\r\n");
        if (Start == std::string::npos)
        {
            return std::string();
        }
        size_t End = Value.find_last_not_of(" \t\r\n");
        return Value.substr(Start, End - Start + 1);
    }

    std::string ReadFirstLine(const FS::path& Path)
    {
        std::ifstream File(Path);
        std::string Line;
        std::getline(File, Line);
        return Trim(Line);
    }
}

std::unique_ptr<DeviceDetector> CreateDeviceDetector()
{
    return std::make_unique<LinuxDeviceDetector>();
}

LinuxDeviceDetector::LinuxDeviceDetector() = default;

LinuxDeviceDetector::~LinuxDeviceDetector()
{
    StopWatching();
}

std::string LinuxDeviceDetector::RunCommand(const std::string& Command, int& ExitCode)
{
    std::string Output;
    FILE* Pipe = popen(Command.c_str(), "r");
    if (!Pipe)
    {
        ExitCode = -1;
        return Output;
    }

    std::array<char, 256> Buffer{};
    while (fgets(Buffer.data(), static_cast<int>(Buffer.size()), Pipe) != nullptr)
    {
        Output += Buffer.data();
    }

    int Status = pclose(Pipe);
    ExitCode = (Status != -1 && WIFEXITED(Status)) ? WEXITSTATUS(Status) : -1;
    return Output;
}

bool LinuxDeviceDetector::IsRemovable(const std::string& BlockName)
{
    std::error_code ec;
    FS::path SysPath = FS::canonical(SysClassBlock / BlockName, ec);
    if (ec)
    {
        return false;
    }

    // Partitions carry no removable flag of their own, ask the parent disk
    FS::path DiskPath = FS::exists(SysPath / "partition", ec) ? SysPath.parent_path() : SysPath;

    if (ReadFirstLine(DiskPath / "removable") == "1")
    {
        return true;
    }
    // USB mass storage often reports removable=0
    return DiskPath.string().find("/usb") != std::string::npos;
}

std::string LinuxDeviceDetector::FindMountPoint(const std::string& DevicePath)
{
    std::ifstream Mounts("/proc/mounts");
    std::string Line;
    while (std::getline(Mounts, Line))
    {
        std::istringstream Fields(Line);
        std::string Source, Target;
        if (!(Fields >> Source >> Target))
        {
            continue;
        }
        if (Source == DevicePath)
        {
            return Target;
        }
    }
    return std::string();
}

bool LinuxDeviceDetector::GetDeviceInfo(const std::string& DevicePath, Device& Info)
{
    Info = Device{};
    Info.Path = DevicePath;
    Info.Name = FS::path(DevicePath).filename().string();

    std::error_code ec;
    if (!FS::exists(SysClassBlock / Info.Name, ec))
    {
        Log.Debug("No sysfs entry for " + DevicePath);
        return false;
    }

    std::string Sectors = ReadFirstLine(SysClassBlock / Info.Name / "size");
    try
    {
        Info.Size = Sectors.empty() ? 0 : std::stoull(Sectors) * 512;
    }
    catch (const std::exception& e)
    {
        Log.Warning("Unreadable size for " + DevicePath + ": " + e.what());
    }

    int ExitCode = 0;
    std::string Quoted = "\"" + EscapeShellChars(DevicePath) + "\"";
    Info.Filesystem = Trim(RunCommand("blkid -s TYPE -o value " + Quoted + " 2>/dev/null", ExitCode));
    Info.Label = Trim(RunCommand("blkid -s LABEL -o value " + Quoted + " 2>/dev/null", ExitCode));
    Info.MountPath = FindMountPoint(DevicePath);
    return true;
}

std::vector<Device> LinuxDeviceDetector::DetectDevices()
{
    std::vector<Device> Devices;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(SysClassBlock, ec))
    {
        const std::string Name = Entry.path().filename().string();
        if (Name.rfind("loop", 0) == 0 || Name.rfind("ram", 0) == 0 || !IsRemovable(Name))
        {
            continue;
        }

        // A disk that has partitions is represented by its partitions
        bool HasPartitions = false;
        std::error_code ChildError;
        for (const auto& Child : FS::directory_iterator(Entry.path(), ChildError))
        {
            if (Child.path().filename().string().rfind(Name, 0) == 0 && FS::exists(Child.path() / "partition", ChildError))
            {
                HasPartitions = true;
                break;
            }
        }
        if (HasPartitions)
        {
            continue;
        }

        Device Found;
        if (GetDeviceInfo("/dev/" + Name, Found) && !Found.Filesystem.empty())
        {
            Devices.push_back(std::move(Found));
        }
    }

    if (ec)
    {
        Log.Error("Failed to list block devices: " + ec.message());
    }
    Log.Debug("Detected " + std::to_string(Devices.size()) + " removable devices");
    return Devices;
}

bool LinuxDeviceDetector::Mount(Device& Target, std::string& Error)
{
    if (!ConfigGlobal::AutoMount)
    {
        Error = "auto-mount is disabled";
        return false;
    }

    FS::path MountPath = FS::path(ConfigGlobal::MountBase) / Target.Name;
    std::error_code ec;
    FS::create_directories(MountPath, ec);
    if (ec)
    {
        Error = "failed to create mount point " + MountPath.string() + ": " + ec.message();
        return false;
    }

    int ExitCode = 0;
    std::string Output = RunCommand("mount \"" + EscapeShellChars(Target.Path) + "\" \"" + EscapeShellChars(MountPath.string()) + "\" 2>&1", ExitCode);
    if (ExitCode != 0)
    {
        Error = "mount exited with code " + std::to_string(ExitCode) + ": " + Trim(Output);
        return false;
    }

    Target.MountPath = MountPath.string();
    Log.Success("Mounted device " + Target.Name + " at " + Target.MountPath);
    return true;
}

bool LinuxDeviceDetector::Unmount(Device& Target, std::string& Error)
{
    if (Target.MountPath.empty())
    {
        return true;
    }

    int ExitCode = 0;
    std::string Output = RunCommand("umount \"" + EscapeShellChars(Target.MountPath) + "\" 2>&1", ExitCode);
    if (ExitCode != 0)
    {
        Error = "umount exited with code " + std::to_string(ExitCode) + ": " + Trim(Output);
        return false;
    }

    Log.Info("Unmounted device " + Target.Name + " from " + Target.MountPath);
    Target.MountPath.clear();
    return true;
}

bool LinuxDeviceDetector::WatchForDevices(DeviceCallback Callback)
{
    std::lock_guard<std::mutex> Lock(WatchMutex);
    if (WatchThread.joinable())
    {
        return false;
    }

    // Devices present now are left to the start-up scan
    std::set<std::string> Known;
    for (const auto& Existing : DetectDevices())
    {
        Known.insert(Existing.Name);
    }

    Stopping = false;
    WatchThread = std::thread(&LinuxDeviceDetector::WatchLoop, this, std::move(Callback), std::move(Known));
    Log.Info("Started watching for block devices on Linux");
    return true;
}

void LinuxDeviceDetector::WatchLoop(DeviceCallback Callback, std::set<std::string> Known)
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> Lock(WatchMutex);
            if (Watch_CV.wait_for(Lock, std::chrono::seconds(ConfigGlobal::PollIntervalSeconds), [this] { return Stopping; }))
            {
                return;
            }
        }

        std::set<std::string> Current;
        for (const auto& Found : DetectDevices())
        {
            Current.insert(Found.Name);
            if (Known.count(Found.Name) == 0)
            {
                Log.Debug("New device detected: " + Found.Path);
                Callback(Found);
            }
        }
        Known.swap(Current); //Removed devices are forgotten so a re-insert is reported again
    }
}

void LinuxDeviceDetector::StopWatching()
{
    {
        std::lock_guard<std::mutex> Lock(WatchMutex);
        Stopping = true;
    }
    Watch_CV.notify_all();

    if (WatchThread.joinable())
    {
        WatchThread.join();
        Log.Info("Stopped watching for block devices");
    }
}
