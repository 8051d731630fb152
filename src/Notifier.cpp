#include "Notifier.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <chrono>
#include <sstream>

std::string LogNotifier::BuildSummary(const Device& Source, const TransferStatsSnapshot& Stats, const std::string& LogPath)
{
    auto Elapsed = std::chrono::duration_cast<std::chrono::seconds>(Stats.Elapsed);
    double Seconds = std::chrono::duration<double>(Stats.Elapsed).count();
    uint64_t Speed = Seconds > 0.0 ? static_cast<uint64_t>(static_cast<double>(Stats.TransferredBytes) / Seconds) : 0;

    std::ostringstream Body;
    Body << "Media Ingest Complete - " << Source.Name << "\n";
    Body << std::string(50, '=') << "\n";
    Body << "  Device: " << Source.Name;
    if (!Source.Label.empty())
    {
        Body << " (" << Source.Label << ")";
    }
    Body << "\n";
    Body << "  Total Files: " << Stats.TotalFiles << "\n";
    Body << "  Successfully Transferred: " << Stats.SucceededFiles() << "\n";
    Body << "  Failed: " << Stats.FailedFiles << "\n";
    Body << "  Total Size: " << FormatSize(Stats.TotalBytes) << "\n";
    Body << "  Transferred: " << FormatSize(Stats.TransferredBytes) << "\n";
    Body << "  Duration: " << FormatDuration(Elapsed) << "\n";
    Body << "  Average Speed: " << FormatSize(Speed) << "/s\n";
    Body << "  Log: " << LogPath;
    return Body.str();
}

void LogNotifier::NotifyTransferComplete(const Device& Source, const TransferStatsSnapshot& Stats, const std::string& LogPath)
{
    Log.Info(BuildSummary(Source, Stats, LogPath));
}
