#pragma once

#include <string>

#include "Device.hpp"
#include "TransferStats.hpp"

// End of run report. Fire and forget, the ingest never waits on delivery.
class Notifier
{
public:
    virtual ~Notifier() = default;
    virtual void NotifyTransferComplete(const Device& Source, const TransferStatsSnapshot& Stats, const std::string& LogPath) = 0;
};

class LogNotifier : public Notifier
{
public:
    void NotifyTransferComplete(const Device& Source, const TransferStatsSnapshot& Stats, const std::string& LogPath) override;

    static std::string BuildSummary(const Device& Source, const TransferStatsSnapshot& Stats, const std::string& LogPath);
};
