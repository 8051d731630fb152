#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <blake3.h>

using FileDigest = std::array<uint8_t, BLAKE3_OUT_LEN>;

// Incremental BLAKE3 over a byte stream.
class FileHasher
{
public:
    FileHasher();

    void Update(const void* Data, size_t Size);
    FileDigest Finalize() const;

    static bool HashFile(const std::string& Path, size_t BufferSize, FileDigest& Digest, std::string& Error);
    static std::string ToHex(const FileDigest& Digest);

private:
    blake3_hasher Hasher;
};
