#pragma once

#include <string>
#include <vector>
#include <filesystem>

class FileScanner
{
public:
    FileScanner() = default;

    void Clear();

    // Collects every regular file below RootPath. Symlinks are skipped.
    // Returns false, with Error set, if the root or any directory below it cannot be read.
    bool Scan(const std::string& RootPath, std::string& Error);

    const std::vector<std::string>& GetFiles() const;

private:
    std::vector<std::string> Files;

    bool ScanDirectoryIterative(const std::filesystem::path& Root, std::string& Error);
};
