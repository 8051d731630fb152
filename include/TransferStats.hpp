#pragma once

#include <chrono>
#include <cstdint>
#include <shared_mutex>

struct TransferStatsSnapshot
{
    uint64_t TotalFiles = 0;
    uint64_t ProcessedFiles = 0;
    uint64_t FailedFiles = 0;
    uint64_t TotalBytes = 0;
    uint64_t TransferredBytes = 0;
    std::chrono::system_clock::time_point StartTime;
    std::chrono::steady_clock::duration Elapsed{};

    uint64_t SucceededFiles() const { return ProcessedFiles - FailedFiles; }
};

// Run counters shared by every worker of one transfer. All fields live behind one lock so
// readers never see a processed count that disagrees with the byte totals.
class TransferStats
{
public:
    TransferStats();

    TransferStats(const TransferStats&) = delete;
    TransferStats& operator=(const TransferStats&) = delete;

    void Begin(uint64_t TotalFiles);
    void AddQueuedBytes(uint64_t Bytes);
    void RecordSuccess(uint64_t Bytes);
    void RecordFailure();

    TransferStatsSnapshot Snapshot() const;
    double Progress() const;
    double Throughput() const;

private:
    mutable std::shared_mutex StatsMutex;

    uint64_t TotalFiles = 0;
    uint64_t ProcessedFiles = 0;
    uint64_t FailedFiles = 0;
    uint64_t TotalBytes = 0;
    uint64_t TransferredBytes = 0;
    std::chrono::system_clock::time_point StartTime;
    std::chrono::steady_clock::time_point StartTick;

    bool CanRecord() const;
};
