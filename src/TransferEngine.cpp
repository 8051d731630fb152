#include "TransferEngine.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"
#include "ThreadPool.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <thread>

namespace FS = std::filesystem;

TransferEngine::TransferEngine(const FilenameClassifier& FileClassifier)
    : Classifier(FileClassifier),
      DestinationRoot(FileClassifier.GetDestinationRoot().string()),
      WorkerCount(ConfigGlobal::MaxWorkers),
      BufferSize(ConfigGlobal::BufferSize < 1024 ? 1024 * 1024 : ConfigGlobal::BufferSize),
      VerifyChecksums(ConfigGlobal::VerifyChecksums),
      MaxRetries(ConfigGlobal::MaxRetries),
      RetryBackoffMs(ConfigGlobal::RetryBackoffMs),
      PriorityPrefixes(ConfigGlobal::PriorityPrefixes)
{
}

void TransferEngine::SetAfterWriteHook(FileCopier::AfterWriteHook Hook)
{
    AfterWrite = std::move(Hook);
}

void TransferEngine::SetDispatchObserver(DispatchObserver Observer)
{
    OnDispatch = std::move(Observer);
}

bool TransferEngine::IsPriorityFile(const std::string& FileName) const
{
    for (const auto& Prefix : PriorityPrefixes)
    {
        if (FileName.compare(0, Prefix.size(), Prefix) == 0)
        {
            return true;
        }
    }
    return false;
}

std::vector<TransferJob> TransferEngine::PrepareJobs(const std::string& DeviceName, const std::vector<std::string>& Files)
{
    std::vector<TransferJob> Jobs;
    Jobs.reserve(Files.size());

    for (const auto& FilePath : Files)
    {
        std::error_code ec;
        if (!FS::is_regular_file(FilePath, ec))
        {
            Log.DeviceError(DeviceName, "Not a regular file, skipping " + FilePath + (ec ? " - " + ec.message() : std::string()));
            Stats.RecordFailure();
            continue;
        }

        uintmax_t Size = FS::file_size(FilePath, ec);
        if (ec)
        {
            Log.DeviceError(DeviceName, "Failed to stat file " + FilePath + ": " + ec.message());
            Stats.RecordFailure();
            continue;
        }

        TransferJob Job;
        Job.SourcePath = FilePath;
        Job.File = Classifier.Classify(FilePath);
        Job.Size = Size;
        Job.Priority = IsPriorityFile(Job.File.FileName);

        FS::path Reserved;
        std::string Error;
        if (!Classifier.ReserveUniquePath(Classifier.DestinationPath(Job.File), Reserved, Error))
        {
            Log.DeviceError(DeviceName, "Failed to get destination path for " + FilePath + ": " + Error);
            Stats.RecordFailure();
            continue;
        }
        Job.DestinationPath = Reserved.string();

        Stats.AddQueuedBytes(Job.Size);
        Jobs.push_back(std::move(Job));
    }

    return Jobs;
}

std::vector<TransferJob> TransferEngine::OrderForDispatch(std::vector<TransferJob> Jobs)
{
    std::stable_partition(Jobs.begin(), Jobs.end(), [](const TransferJob& Job) { return Job.Priority; });
    return Jobs;
}

bool TransferEngine::Transfer(const std::string& DeviceName, const std::vector<std::string>& Files)
{
    if (WorkerCount == 0)
    {
        Log.DeviceError(DeviceName, "[TransferEngine] Worker count is zero, nothing can be dispatched");
        return false;
    }

    std::error_code ec;
    FS::create_directories(DestinationRoot, ec);
    if (ec || !FS::is_directory(DestinationRoot, ec))
    {
        Log.DeviceError(DeviceName, "[TransferEngine] Destination root unavailable: " + DestinationRoot + (ec ? " - " + ec.message() : std::string()));
        return false;
    }

    Stats.Begin(Files.size());

    std::vector<TransferJob> Jobs = OrderForDispatch(PrepareJobs(DeviceName, Files));
    size_t PriorityCount = std::count_if(Jobs.begin(), Jobs.end(), [](const TransferJob& Job) { return Job.Priority; });

    TransferStatsSnapshot Prepared = Stats.Snapshot();
    Log.DeviceInfo(DeviceName, "Found " + std::to_string(Prepared.TotalFiles) + " files (" + std::to_string(PriorityCount) + " priority, "
        + std::to_string(Jobs.size() - PriorityCount) + " normal, " + std::to_string(Prepared.FailedFiles) + " not queued), "
        + FormatSize(Prepared.TotalBytes) + " to copy with " + std::to_string(WorkerCount) + " workers");

    {
        ThreadPool Pool(WorkerCount, WorkerCount * 2);
        for (const auto& Job : Jobs)
        {
            if (OnDispatch)
            {
                OnDispatch(Job);
            }
            if (!Pool.Submit([this, DeviceName, Job]() { RunJob(DeviceName, Job); }))
            {
                Log.DeviceError(DeviceName, "[TransferEngine] Queue closed before " + Job.SourcePath + " was dispatched");
                Stats.RecordFailure();
            }
        }
        Pool.Join();
    }

    return true;
}

void TransferEngine::RunJob(const std::string& DeviceName, const TransferJob& Job)
{
    std::string Error;
    CopyResult Result = CopyResult::IOError;

    for (unsigned int Attempt = 0; ; ++Attempt)
    {
        Error.clear();
        try
        {
            Result = FileCopier::PerformFileCopy(Job.SourcePath, Job.DestinationPath, VerifyChecksums, BufferSize, Error, AfterWrite);
        }
        catch (const std::exception& e)
        {
            Result = CopyResult::IOError;
            Error = e.what();
        }

        if (Result == CopyResult::Success || Attempt >= MaxRetries)
        {
            break;
        }

        auto Backoff = std::chrono::milliseconds(static_cast<long long>(RetryBackoffMs) << std::min(Attempt, 10u));
        Log.DeviceWarning(DeviceName, "Retrying " + Job.SourcePath + " in " + std::to_string(Backoff.count()) + " ms (attempt "
            + std::to_string(Attempt + 2) + " of " + std::to_string(MaxRetries + 1) + "): " + Error);
        std::this_thread::sleep_for(Backoff);
    }

    if (Result == CopyResult::Success)
    {
        Stats.RecordSuccess(Job.Size);
        LogTransferred(DeviceName, Job);
        return;
    }

    if (Result == CopyResult::ChecksumMismatch)
    {
        Log.DeviceError(DeviceName, "Checksum mismatch for " + Job.SourcePath + ": " + Error);
    }
    else
    {
        Log.DeviceError(DeviceName, "Failed to transfer " + Job.SourcePath + ": " + Error);
    }

    // Only now is the claimed name released, once and after the last attempt
    std::error_code ec;
    FS::remove(Job.DestinationPath, ec);
    Stats.RecordFailure();
}

void TransferEngine::LogTransferred(const std::string& DeviceName, const TransferJob& Job) const
{
    if (!Job.File.Matched)
    {
        Log.DeviceInfo(DeviceName, "Transferred (unmatched): " + Job.File.FileName + " -> " + Job.DestinationPath);
        return;
    }
    Log.DeviceSuccess(DeviceName, "Transferred: " + Job.File.FileName + " -> " + Job.File.Client + "/" + Job.File.Project + "/" + Job.File.Camera
        + " (" + FS::path(Job.DestinationPath).filename().string() + ")");
}

TransferStatsSnapshot TransferEngine::GetStats() const
{
    return Stats.Snapshot();
}

double TransferEngine::GetProgress() const
{
    return Stats.Progress();
}

double TransferEngine::GetSpeed() const
{
    return Stats.Throughput();
}
