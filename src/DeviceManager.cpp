#include "DeviceManager.hpp"
#include "ConfigGlobal.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"
#include "TransferEngine.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
    bool EqualsIgnoreCase(const std::string& A, const std::string& B)
    {
        return A.size() == B.size() && std::equal(A.begin(), A.end(), B.begin(), [](char X, char Y)
        {
            return std::tolower(static_cast<unsigned char>(X)) == std::tolower(static_cast<unsigned char>(Y));
        });
    }
}

DeviceManager::DeviceManager(std::unique_ptr<DeviceDetector> PlatformDetector, std::unique_ptr<Notifier> Notify)
    : Detector(std::move(PlatformDetector)),
      RunNotifier(std::move(Notify)),
      Classifier(ConfigGlobal::Pattern, ConfigGlobal::FolderStructure, ConfigGlobal::UnmatchedFolder, ConfigGlobal::DestinationPath),
      MinDeviceSize(ConfigGlobal::MinDeviceSize),
      AllowedFilesystems(ConfigGlobal::AllowedFilesystems),
      DeviceExcludes(ConfigGlobal::DeviceExcludes)
{
    if (!Detector)
    {
        throw std::invalid_argument("DeviceManager requires a device detector");
    }
}

DeviceManager::~DeviceManager()
{
    // The watch thread calls StartIngest, it must be gone before the runs are joined
    Detector->StopWatching();
    WaitForActiveRuns();
}

bool DeviceManager::Evaluate(const Device& Candidate) const
{
    if (Candidate.Size < MinDeviceSize)
    {
        return false;
    }

    if (!AllowedFilesystems.empty())
    {
        bool Allowed = std::any_of(AllowedFilesystems.begin(), AllowedFilesystems.end(), [&Candidate](const std::string& Filesystem)
        {
            return EqualsIgnoreCase(Candidate.Filesystem, Filesystem);
        });
        if (!Allowed)
        {
            return false;
        }
    }

    for (const auto& Pattern : DeviceExcludes)
    {
        if (Candidate.Path.find(Pattern) != std::string::npos)
        {
            return false;
        }
    }

    return true;
}

bool DeviceManager::Mount(Device& Target, std::string& Error)
{
    if (!Target.MountPath.empty())
    {
        Log.Debug("Device " + Target.Name + " already mounted at " + Target.MountPath);
        return true;
    }

    if (!Detector->Mount(Target, Error))
    {
        return false;
    }
    if (Target.MountPath.empty())
    {
        Error = "Detector reported success but no mount path was set";
        return false;
    }
    return true;
}

void DeviceManager::Register(const Device& Target)
{
    std::unique_lock<std::shared_mutex> Lock(ActiveMutex);
    ActiveDevices.push_back(Target);
}

void DeviceManager::Deregister(const std::string& DeviceName)
{
    std::unique_lock<std::shared_mutex> Lock(ActiveMutex);
    auto It = std::find_if(ActiveDevices.begin(), ActiveDevices.end(), [&DeviceName](const Device& Active) { return Active.Name == DeviceName; });
    if (It != ActiveDevices.end())
    {
        ActiveDevices.erase(It);
    }
}

bool DeviceManager::Process(Device& Target, std::string& Error)
{
    Register(Target);

    struct RunGuard
    {
        DeviceManager& Manager;
        const std::string Name;
        ~RunGuard()
        {
            Log.CloseDeviceLog(Name);
            Manager.Deregister(Name);
        }
    } Guard{ *this, Target.Name };

    Log.Info("Processing device: " + Target.Name + " (" + Target.Label + ")");

    // Scan before the device log exists so the log itself is never ingested
    FileScanner Scanner;
    if (!Scanner.Scan(Target.MountPath, Error))
    {
        Log.DeviceError(Target.Name, "Failed to scan files: " + Error);
        return false;
    }

    if (!Log.CreateDeviceLog(Target.Name, Target.MountPath))
    {
        Log.Warning("Failed to create device log on " + Target.MountPath);
    }

    const std::vector<std::string>& Files = Scanner.GetFiles();
    Log.DeviceInfo(Target.Name, "Found " + std::to_string(Files.size()) + " files to transfer");

    if (Files.empty())
    {
        Log.DeviceInfo(Target.Name, "No files to transfer");
        return true;
    }

    TransferEngine Engine(Classifier);
    if (!Engine.Transfer(Target.Name, Files))
    {
        Error = "Transfer could not be started for " + Target.Name;
        Log.DeviceError(Target.Name, Error);
        return false;
    }

    TransferStatsSnapshot Stats = Engine.GetStats();
    Log.DeviceSuccess(Target.Name, "Transfer complete: " + std::to_string(Stats.SucceededFiles()) + "/" + std::to_string(Stats.TotalFiles)
        + " files transferred, " + std::to_string(Stats.FailedFiles) + " failed, " + FormatSize(Stats.TransferredBytes));

    if (RunNotifier)
    {
        RunNotifier->NotifyTransferComplete(Target, Stats, Log.GetDeviceLogPath(Target.Name));
    }
    return true;
}

bool DeviceManager::Ingest(Device Target)
{
    if (!Evaluate(Target))
    {
        Log.Debug("Device " + Target.Name + " not allowed (size: " + std::to_string(Target.Size) + ", fs: " + Target.Filesystem + ")");
        return true;
    }

    Log.Info("New device detected: " + Target.Name + " (" + Target.Label + ", " + FormatSize(Target.Size) + ")");

    std::string Error;
    if (!Mount(Target, Error))
    {
        Log.Error("Failed to mount device " + Target.Name + ": " + Error);
        return false;
    }

    if (!Process(Target, Error))
    {
        Log.Error("Failed to process device " + Target.Name + ": " + Error);
        return false;
    }

    // Device stays mounted after processing
    return true;
}

void DeviceManager::StartIngest(const Device& Target, std::chrono::seconds SettleDelay)
{
    std::lock_guard<std::mutex> Lock(RunsMutex);

    // Reap finished runs so a long running watcher does not accumulate threads
    for (auto It = Runs.begin(); It != Runs.end();)
    {
        if (It->Done->load())
        {
            It->Worker.join();
            It = Runs.erase(It);
        }
        else
        {
            ++It;
        }
    }

    auto Done = std::make_shared<std::atomic<bool>>(false);
    std::thread Worker([this, Target, SettleDelay, Done]()
    {
        std::this_thread::sleep_for(SettleDelay);
        try
        {
            Ingest(Target);
        }
        catch (const std::exception& e)
        {
            Log.Error("Device run for " + Target.Name + " aborted: " + e.what());
        }
        Done->store(true);
    });
    Runs.push_back(IngestRun{ std::move(Worker), Done });
}

void DeviceManager::WaitForActiveRuns()
{
    std::vector<IngestRun> Pending;
    {
        std::lock_guard<std::mutex> Lock(RunsMutex);
        Pending.swap(Runs);
    }
    for (auto& Run : Pending)
    {
        if (Run.Worker.joinable())
        {
            Run.Worker.join();
        }
    }
}

std::vector<Device> DeviceManager::GetActiveDevices() const
{
    std::shared_lock<std::shared_mutex> Lock(ActiveMutex);
    return ActiveDevices;
}

bool DeviceManager::IsActive(const std::string& DeviceName) const
{
    std::shared_lock<std::shared_mutex> Lock(ActiveMutex);
    return std::any_of(ActiveDevices.begin(), ActiveDevices.end(), [&DeviceName](const Device& Active) { return Active.Name == DeviceName; });
}
