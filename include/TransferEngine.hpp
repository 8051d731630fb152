#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "FileCopier.hpp"
#include "FilenameClassifier.hpp"
#include "TransferStats.hpp"

struct TransferJob
{
    std::string SourcePath;
    std::string DestinationPath;
    uint64_t Size = 0;
    bool Priority = false;
    ClassifiedFile File;
};

// Copies one device's file list into the classifier's destination tree. Worker count,
// verification, retries and priority prefixes are taken from ConfigGlobal at construction.
class TransferEngine
{
public:
    using DispatchObserver = std::function<void(const TransferJob&)>;

    explicit TransferEngine(const FilenameClassifier& Classifier);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Blocks until every job has finished. Returns false only when nothing could be dispatched.
    bool Transfer(const std::string& DeviceName, const std::vector<std::string>& Files);

    std::vector<TransferJob> PrepareJobs(const std::string& DeviceName, const std::vector<std::string>& Files);
    static std::vector<TransferJob> OrderForDispatch(std::vector<TransferJob> Jobs);
    bool IsPriorityFile(const std::string& FileName) const;

    void SetAfterWriteHook(FileCopier::AfterWriteHook Hook);
    void SetDispatchObserver(DispatchObserver Observer);

    TransferStatsSnapshot GetStats() const;
    double GetProgress() const;
    double GetSpeed() const;

private:
    const FilenameClassifier& Classifier;
    TransferStats Stats;

    std::string DestinationRoot;
    size_t WorkerCount;
    size_t BufferSize;
    bool VerifyChecksums;
    unsigned int MaxRetries;
    unsigned int RetryBackoffMs;
    std::vector<std::string> PriorityPrefixes;

    FileCopier::AfterWriteHook AfterWrite;
    DispatchObserver OnDispatch;

    void RunJob(const std::string& DeviceName, const TransferJob& Job);
    void LogTransferred(const std::string& DeviceName, const TransferJob& Job) const;
};
