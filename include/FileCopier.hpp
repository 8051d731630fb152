#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "FileHasher.hpp"

enum class CopyResult
{
    Success,
    IOError,
    ChecksumMismatch
};

class FileCopier
{
public:
    // Runs after the destination is written and closed, before it is re-read for verification.
    using AfterWriteHook = std::function<void(const std::string& DestinationPath)>;

    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();

    // DestinationPath is truncated and rewritten, never unlinked, so a reserved name stays claimed across retries.
    static CopyResult PerformFileCopy(const std::string& SourcePath, const std::string& DestinationPath, bool Verify, size_t BufferSize, std::string& Error, const AfterWriteHook& Hook = nullptr);

private:
    static bool StreamCopy(int SrcFd, int DestFd, size_t BufferSize, FileHasher* Hasher, std::string& Error);
    static bool RangeCopy(int SrcFd, int DestFd, bool& Unsupported, std::string& Error);
    static bool WriteAll(int Fd, const uint8_t* Data, size_t Size);
};
