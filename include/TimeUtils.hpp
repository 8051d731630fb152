#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

//1024 based, one decimal above bytes: "512 B", "1.5 MB"
inline std::string FormatSize(uint64_t Bytes)
{
    constexpr uint64_t Unit = 1024;
    if (Bytes < Unit)
    {
        return std::to_string(Bytes) + " B";
    }

    uint64_t Div = Unit;
    int Exp = 0;
    for (uint64_t N = Bytes / Unit; N >= Unit && Exp < 4; N /= Unit)
    {
        Div *= Unit;
        ++Exp;
    }

    static const char* Units[] = { "KB", "MB", "GB", "TB", "PB" };
    char Buffer[32];
    std::snprintf(Buffer, sizeof(Buffer), "%.1f %s", static_cast<double>(Bytes) / static_cast<double>(Div), Units[Exp]);
    return Buffer;
}

inline std::string FormatDuration(std::chrono::seconds Elapsed)
{
    long long Total = Elapsed.count();
    long long Hours = Total / 3600;
    long long Minutes = (Total % 3600) / 60;
    long long Seconds = Total % 60;

    std::string Result;
    if (Hours > 0)
    {
        Result += std::to_string(Hours) + "h";
    }
    if (Hours > 0 || Minutes > 0)
    {
        Result += std::to_string(Minutes) + "m";
    }
    Result += std::to_string(Seconds) + "s";
    return Result;
}
