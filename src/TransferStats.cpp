#include "TransferStats.hpp"
#include "Logger.hpp"

#include <mutex>

TransferStats::TransferStats(): StartTime(std::chrono::system_clock::now()), StartTick(std::chrono::steady_clock::now())
{
}

void TransferStats::Begin(uint64_t Files)
{
    std::unique_lock<std::shared_mutex> Lock(StatsMutex);
    TotalFiles = Files;
    ProcessedFiles = 0;
    FailedFiles = 0;
    TotalBytes = 0;
    TransferredBytes = 0;
    StartTime = std::chrono::system_clock::now();
    StartTick = std::chrono::steady_clock::now();
}

void TransferStats::AddQueuedBytes(uint64_t Bytes)
{
    std::unique_lock<std::shared_mutex> Lock(StatsMutex);
    TotalBytes += Bytes;
}

bool TransferStats::CanRecord() const
{
    if (ProcessedFiles >= TotalFiles)
    {
        Log.Error("[TransferStats] Result recorded beyond total file count " + std::to_string(TotalFiles));
        return false;
    }
    return true;
}

void TransferStats::RecordSuccess(uint64_t Bytes)
{
    std::unique_lock<std::shared_mutex> Lock(StatsMutex);
    if (!CanRecord())
    {
        return;
    }
    ++ProcessedFiles;
    TransferredBytes += Bytes;
}

void TransferStats::RecordFailure()
{
    std::unique_lock<std::shared_mutex> Lock(StatsMutex);
    if (!CanRecord())
    {
        return;
    }
    ++ProcessedFiles;
    ++FailedFiles;
}

TransferStatsSnapshot TransferStats::Snapshot() const
{
    std::shared_lock<std::shared_mutex> Lock(StatsMutex);
    TransferStatsSnapshot Copy;
    Copy.TotalFiles = TotalFiles;
    Copy.ProcessedFiles = ProcessedFiles;
    Copy.FailedFiles = FailedFiles;
    Copy.TotalBytes = TotalBytes;
    Copy.TransferredBytes = TransferredBytes;
    Copy.StartTime = StartTime;
    Copy.Elapsed = std::chrono::steady_clock::now() - StartTick;
    return Copy;
}

double TransferStats::Progress() const
{
    std::shared_lock<std::shared_mutex> Lock(StatsMutex);
    if (TotalBytes == 0)
    {
        return 0.0;
    }
    return static_cast<double>(TransferredBytes) / static_cast<double>(TotalBytes) * 100.0;
}

double TransferStats::Throughput() const
{
    std::shared_lock<std::shared_mutex> Lock(StatsMutex);
    double Seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - StartTick).count();
    if (Seconds <= 0.0)
    {
        return 0.0;
    }
    return static_cast<double>(TransferredBytes) / Seconds;
}
