#include "FileHasher.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

FileHasher::FileHasher()
{
    blake3_hasher_init(&Hasher);
}

void FileHasher::Update(const void* Data, size_t Size)
{
    blake3_hasher_update(&Hasher, Data, Size);
}

FileDigest FileHasher::Finalize() const
{
    FileDigest Digest{};
    blake3_hasher_finalize(&Hasher, Digest.data(), Digest.size());
    return Digest;
}

bool FileHasher::HashFile(const std::string& Path, size_t BufferSize, FileDigest& Digest, std::string& Error)
{
    int Fd = open(Path.c_str(), O_RDONLY);
    if (Fd < 0)
    {
        Error = "Failed to open " + Path + " for hashing: " + std::strerror(errno);
        return false;
    }

    FileHasher Hasher;
    std::vector<uint8_t> Buffer(BufferSize);
    while (true)
    {
        ssize_t Read = read(Fd, Buffer.data(), Buffer.size());
        if (Read < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            Error = "Failed to read " + Path + " for hashing: " + std::strerror(errno);
            close(Fd);
            return false;
        }
        if (Read == 0)
        {
            break;
        }
        Hasher.Update(Buffer.data(), static_cast<size_t>(Read));
    }

    close(Fd);
    Digest = Hasher.Finalize();
    return true;
}

std::string FileHasher::ToHex(const FileDigest& Digest)
{
    static const char HexChars[] = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(Digest.size() * 2);
    for (uint8_t Byte : Digest)
    {
        Hex += HexChars[Byte >> 4];
        Hex += HexChars[Byte & 0x0F];
    }
    return Hex;
}
