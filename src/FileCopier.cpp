#include "FileCopier.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

bool FileCopier::CopyFileRangeSupported = true;

void FileCopier::CheckCopyFileRangeSupport()
{
    int srcFd = open("/dev/null", O_RDONLY);
    int destFd = open("/dev/null", O_WRONLY);
    if (srcFd < 0 || destFd < 0) {
        if (srcFd >= 0) close(srcFd);
        if (destFd >= 0) close(destFd);
        CopyFileRangeSupported = false;
        return;
    }

    ssize_t result = copy_file_range(srcFd, nullptr, destFd, nullptr, 1, 0);
    CopyFileRangeSupported = (result >= 0 || errno != ENOSYS);

    close(srcFd);
    close(destFd);
}

namespace {
    struct CopyFileRangeInit
    {
        CopyFileRangeInit()
        {
            FileCopier::CheckCopyFileRangeSupport();
        }
    };

    static CopyFileRangeInit InitCopyFileRangeSupport;
}

bool FileCopier::WriteAll(int Fd, const uint8_t* Data, size_t Size)
{
    while (Size > 0)
    {
        ssize_t Written = write(Fd, Data, Size);
        if (Written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        Data += Written;
        Size -= static_cast<size_t>(Written);
    }
    return true;
}

bool FileCopier::StreamCopy(int SrcFd, int DestFd, size_t BufferSize, FileHasher* Hasher, std::string& Error)
{
    std::vector<uint8_t> Buffer(BufferSize);
    while (true)
    {
        ssize_t Read = read(SrcFd, Buffer.data(), Buffer.size());
        if (Read < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            Error = std::string("Read failed: ") + std::strerror(errno);
            return false;
        }
        if (Read == 0)
        {
            return true;
        }
        if (Hasher)
        {
            Hasher->Update(Buffer.data(), static_cast<size_t>(Read));
        }
        if (!WriteAll(DestFd, Buffer.data(), static_cast<size_t>(Read)))
        {
            Error = std::string("Write failed: ") + std::strerror(errno);
            return false;
        }
    }
}

// Unsupported is set when the kernel refuses before any byte moved, so the caller can fall back
bool FileCopier::RangeCopy(int SrcFd, int DestFd, bool& Unsupported, std::string& Error)
{
    struct stat statBuf;
    if (fstat(SrcFd, &statBuf) != 0)
    {
        Error = std::string("fstat failed: ") + std::strerror(errno);
        return false;
    }

    off_t Remaining = statBuf.st_size;
    bool AnyCopied = false;
    while (Remaining > 0)
    {
        ssize_t copied = copy_file_range(SrcFd, nullptr, DestFd, nullptr, static_cast<size_t>(Remaining), 0);
        if (copied < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (!AnyCopied && (errno == EXDEV || errno == ENOSYS || errno == EINVAL || errno == EOPNOTSUPP))
            {
                Unsupported = true;
                return false;
            }
            Error = std::string("copy_file_range failed: ") + std::strerror(errno);
            return false;
        }
        if (copied == 0)
        {
            break; //Source shrank underneath us, copy what exists
        }
        AnyCopied = true;
        Remaining -= copied;
    }
    return true;
}

CopyResult FileCopier::PerformFileCopy(const std::string& SourcePath, const std::string& DestinationPath, bool Verify, size_t BufferSize, std::string& Error, const AfterWriteHook& Hook)
{
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(DestinationPath).parent_path(), ec);
    if (ec)
    {
        Error = "Failed to create destination directory: " + ec.message();
        return CopyResult::IOError;
    }

    int srcFd = open(SourcePath.c_str(), O_RDONLY);
    if (srcFd < 0)
    {
        Error = "Failed to open source file " + SourcePath + ": " + std::strerror(errno);
        return CopyResult::IOError;
    }

    int destFd = open(DestinationPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (destFd < 0)
    {
        Error = "Failed to create destination file " + DestinationPath + ": " + std::strerror(errno);
        close(srcFd);
        return CopyResult::IOError;
    }

    FileHasher SourceHasher;
    bool Copied = false;

    if (Verify)
    {
        Copied = StreamCopy(srcFd, destFd, BufferSize, &SourceHasher, Error);
    }
    else
    {
        bool Unsupported = !CopyFileRangeSupported;
        if (!Unsupported)
        {
            Copied = RangeCopy(srcFd, destFd, Unsupported, Error);
        }
        if (Unsupported)
        {
            Copied = StreamCopy(srcFd, destFd, BufferSize, nullptr, Error);
        }
    }

    close(srcFd);
    if (close(destFd) != 0 && Copied)
    {
        Error = std::string("Failed to close destination file: ") + std::strerror(errno);
        Copied = false;
    }

    if (!Copied)
    {
        return CopyResult::IOError;
    }

    if (Hook)
    {
        Hook(DestinationPath);
    }

    if (!Verify)
    {
        return CopyResult::Success;
    }

    FileDigest DestinationDigest{};
    if (!FileHasher::HashFile(DestinationPath, BufferSize, DestinationDigest, Error))
    {
        return CopyResult::IOError;
    }

    FileDigest SourceDigest = SourceHasher.Finalize();
    if (SourceDigest != DestinationDigest)
    {
        // The destination stays in place, the caller owns its reservation
        Error = "Checksum mismatch (source " + FileHasher::ToHex(SourceDigest) + ", destination " + FileHasher::ToHex(DestinationDigest) + ")";
        return CopyResult::ChecksumMismatch;
    }

    return CopyResult::Success;
}
