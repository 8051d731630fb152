#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "Device.hpp"
#include "FilenameClassifier.hpp"
#include "Notifier.hpp"

class DeviceManager
{
public:
    // Policy, destination and classification settings are read from ConfigGlobal here.
    DeviceManager(std::unique_ptr<DeviceDetector> Detector, std::unique_ptr<Notifier> RunNotifier);
    ~DeviceManager();

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    bool Evaluate(const Device& Candidate) const;
    bool Mount(Device& Target, std::string& Error);
    bool Process(Device& Target, std::string& Error);

    // Evaluate, Mount and Process in one go. A policy reject is not an error.
    bool Ingest(Device Target);

    // Runs Ingest on its own thread after SettleDelay; WaitForActiveRuns joins them all.
    void StartIngest(const Device& Target, std::chrono::seconds SettleDelay);
    void WaitForActiveRuns();

    std::vector<Device> GetActiveDevices() const;
    bool IsActive(const std::string& DeviceName) const;

    DeviceDetector& GetDetector() { return *Detector; }

private:
    struct IngestRun
    {
        std::thread Worker;
        std::shared_ptr<std::atomic<bool>> Done;
    };

    std::unique_ptr<DeviceDetector> Detector;
    std::unique_ptr<Notifier> RunNotifier;
    FilenameClassifier Classifier;

    uint64_t MinDeviceSize;
    std::vector<std::string> AllowedFilesystems;
    std::vector<std::string> DeviceExcludes;

    mutable std::shared_mutex ActiveMutex;
    std::vector<Device> ActiveDevices;

    std::mutex RunsMutex;
    std::vector<IngestRun> Runs;

    void Register(const Device& Target);
    void Deregister(const std::string& DeviceName);
};
