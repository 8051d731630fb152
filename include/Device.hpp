#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct Device
{
    std::string Name;       //Identifier, e.g. "sdb1"
    std::string Path;       //Raw device node, e.g. "/dev/sdb1"
    std::string MountPath;  //Empty until mounted
    std::string Filesystem;
    uint64_t Size = 0;
    std::string Label;
};

// Platform capability for finding, mounting and watching removable volumes.
// One adapter per platform, picked once at start-up by CreateDeviceDetector().
class DeviceDetector
{
public:
    using DeviceCallback = std::function<void(const Device&)>;

    virtual ~DeviceDetector() = default;

    virtual std::vector<Device> DetectDevices() = 0;
    virtual bool Mount(Device& Target, std::string& Error) = 0;
    virtual bool Unmount(Device& Target, std::string& Error) = 0;
    virtual bool GetDeviceInfo(const std::string& DevicePath, Device& Info) = 0;

    // Returns once the watch is running; Callback fires on the watcher thread for each newly seen device.
    virtual bool WatchForDevices(DeviceCallback Callback) = 0;
    virtual void StopWatching() = 0;
};

std::unique_ptr<DeviceDetector> CreateDeviceDetector();
