#pragma once

#include <atomic>
#include <string>

#include "ConfigParser.hpp"

class DeviceManager;

class ControlFlow
{
public:
    ControlFlow() = default;

    // Watches for devices until SIGINT/SIGTERM, then waits for in-flight runs.
    int Run();

    // Ingests a single device node and returns, for udev style triggers.
    int RunSingleDevice(const std::string& DevicePath);

    static void RequestStop();

private:
    ConfigParser Parser;

    static std::atomic<bool> StopRequested;

    bool LoadConfig();
    void LogSettings();
    void ScanExistingDevices(DeviceManager& Manager);
};
