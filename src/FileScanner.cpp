#include <filesystem>
#include <stack>

#include "FileScanner.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& FileScanner::GetFiles() const
{
    return Files;
}

void FileScanner::Clear()
{
    Files.clear();
}

bool FileScanner::Scan(const std::string& RootPath, std::string& Error)
{
    FS::path Root(RootPath);
    std::error_code ec;

    if (RootPath.empty() || !FS::exists(Root, ec))
    {
        Error = "Scan path does not exist: " + RootPath;
        return false;
    }
    if (!FS::is_directory(Root, ec))
    {
        Error = "Scan path is not a directory: " + RootPath;
        return false;
    }
    return ScanDirectoryIterative(Root, Error);
}

bool FileScanner::ScanDirectoryIterative(const FS::path& Root, std::string& Error)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                // Skip symbolic links to avoid loops or unsupported files.
                if (FS::is_symlink(Entry.symlink_status()))
                {
                    Log.Debug(std::string("Skipping SymLink: ") + Entry.path().string());
                    continue;
                }
                if (Entry.is_directory())
                {
                    DirStack.push(Entry.path());
                }
                else if (Entry.is_regular_file())
                {
                    Files.push_back(Entry.path().string());
                }
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Error = std::string("Filesystem error iterating directory: ") + e.what() + " Path: " + Current.string();
            return false;
        }
    }
    return true;
}
