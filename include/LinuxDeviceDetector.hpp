#pragma once

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "Device.hpp"

// sysfs + blkid based discovery, mount(8) for mounting, polling for arrival.
class LinuxDeviceDetector : public DeviceDetector
{
public:
    LinuxDeviceDetector();
    ~LinuxDeviceDetector() override;

    std::vector<Device> DetectDevices() override;
    bool Mount(Device& Target, std::string& Error) override;
    bool Unmount(Device& Target, std::string& Error) override;
    bool GetDeviceInfo(const std::string& DevicePath, Device& Info) override;

    bool WatchForDevices(DeviceCallback Callback) override;
    void StopWatching() override;

    static std::string FindMountPoint(const std::string& DevicePath);

private:
    std::thread WatchThread;
    std::mutex WatchMutex;
    std::condition_variable Watch_CV;
    bool Stopping = false;

    void WatchLoop(DeviceCallback Callback, std::set<std::string> Known);
    static bool IsRemovable(const std::string& BlockName);
    static std::string RunCommand(const std::string& Command, int& ExitCode);
};
