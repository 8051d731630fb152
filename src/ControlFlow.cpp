#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"
#include "DeviceManager.hpp"
#include "Logger.hpp"
#include "Notifier.hpp"
#include "TimeUtils.hpp"

std::atomic<bool> ControlFlow::StopRequested{ false };

namespace
{
    void HandleStopSignal(int)
    {
        ControlFlow::RequestStop();
    }

    std::string JoinList(const std::vector<std::string>& Items)
    {
        std::string Joined;
        for (const auto& Item : Items)
        {
            Joined += (Joined.empty() ? "" : ", ") + Item;
        }
        return Joined.empty() ? "(any)" : Joined;
    }
}

void ControlFlow::RequestStop()
{
    StopRequested = true;
}

bool ControlFlow::LoadConfig()
{
    bool Parsed = Parser.Parse(ConfigGlobal::ConfigFile);

    Log.Init(ConfigGlobal::LogDir);

    for (const auto& Info : Parser.GetInfos())
    {
        Log.Info("Config Info: " + Info);
    }

    if (!Parsed)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            Log.Error("Config Error: " + Error);
        }
        Log.Error("Check Errors and Fix Them, Exiting");
        return false;
    }

    Log.Info("Config Parsed Successfully.");
    Log.CleanupOldLogs();
    LogSettings();
    return true;
}

void ControlFlow::LogSettings()
{
    Log.Info("Destination: " + ConfigGlobal::DestinationPath);
    Log.Info("Pattern: " + ConfigGlobal::Pattern);
    Log.Info("Folder Structure: " + ConfigGlobal::FolderStructure + " | Unmatched: " + ConfigGlobal::UnmatchedFolder);
    Log.Info("Workers: " + std::to_string(ConfigGlobal::MaxWorkers) + " | Verify: " + (ConfigGlobal::VerifyChecksums ? "YES" : "NO")
        + " | Max Retries: " + std::to_string(ConfigGlobal::MaxRetries));
    Log.Info("Priority Prefixes: " + JoinList(ConfigGlobal::PriorityPrefixes));
    Log.Info("Device Filter: min " + FormatSize(ConfigGlobal::MinDeviceSize) + " | filesystems " + JoinList(ConfigGlobal::AllowedFilesystems)
        + " | excludes " + (ConfigGlobal::DeviceExcludes.empty() ? std::string("(none)") : JoinList(ConfigGlobal::DeviceExcludes)));
}

void ControlFlow::ScanExistingDevices(DeviceManager& Manager)
{
    Log.Info("Scanning for existing devices...");

    for (const auto& Existing : Manager.GetDetector().DetectDevices())
    {
        if (Manager.Evaluate(Existing))
        {
            Log.Info("Found existing device: " + Existing.Name + " (" + Existing.Label + ")");
        }
        Manager.StartIngest(Existing, std::chrono::seconds(0));
    }
}

int ControlFlow::Run()
{
    if (!LoadConfig())
    {
        return 1;
    }

    try
    {
        DeviceManager Manager(CreateDeviceDetector(), std::make_unique<LogNotifier>());

        std::signal(SIGINT, HandleStopSignal);
        std::signal(SIGTERM, HandleStopSignal);

        const auto SettleDelay = std::chrono::seconds(ConfigGlobal::SettleDelaySeconds);
        if (!Manager.GetDetector().WatchForDevices([&Manager, SettleDelay](const Device& Arrived) { Manager.StartIngest(Arrived, SettleDelay); }))
        {
            Log.Error("Failed to start device watching");
            return 1;
        }
        Log.Info("Device monitoring started");

        ScanExistingDevices(Manager);

        while (!StopRequested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        Log.Info("Stop requested, shutting down...");
        Manager.GetDetector().StopWatching();

        size_t Active = Manager.GetActiveDevices().size();
        if (Active > 0)
        {
            Log.Info("Waiting for " + std::to_string(Active) + " device(s) still transferring");
        }
        Manager.WaitForActiveRuns();
    }
    catch (const std::exception& e)
    {
        Log.Error(std::string("Fatal: ") + e.what());
        return 1;
    }

    Log.Info("Device monitoring stopped");
    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    return 0;
}

int ControlFlow::RunSingleDevice(const std::string& DevicePath)
{
    if (!LoadConfig())
    {
        return 1;
    }

    try
    {
        DeviceManager Manager(CreateDeviceDetector(), std::make_unique<LogNotifier>());

        Device Target;
        if (!Manager.GetDetector().GetDeviceInfo(DevicePath, Target))
        {
            Log.Error("Unknown block device: " + DevicePath);
            return 1;
        }
        if (!Manager.Evaluate(Target))
        {
            Log.Info("Device " + Target.Name + " does not pass the device filter, nothing to do");
            return 0;
        }
        if (!Manager.Ingest(Target))
        {
            return 1;
        }
    }
    catch (const std::exception& e)
    {
        Log.Error(std::string("Fatal: ") + e.what());
        return 1;
    }

    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    return 0;
}
