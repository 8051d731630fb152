#pragma once

#include <filesystem>
#include <regex>
#include <string>

struct ClassifiedFile
{
    std::string OriginalPath;
    std::string FileName;
    std::string Extension; //Includes the dot, empty when the name has none
    bool Matched = false;

    //Only populated when Matched
    std::string Project;
    std::string Client;
    std::string Camera;
    std::string Clip;
};

class FilenameClassifier
{
public:
    static constexpr int MaxVersionCandidates = 1000;

    // Throws std::invalid_argument if Pattern does not compile or does not have exactly 4 capture groups.
    FilenameClassifier(const std::string& Pattern, const std::string& FolderTemplate, const std::string& FallbackFolder, const std::string& DestinationRoot);

    ClassifiedFile Classify(const std::string& FilePath) const;

    std::filesystem::path DestinationDirectory(const ClassifiedFile& File) const;
    std::filesystem::path DestinationPath(const ClassifiedFile& File) const;

    static std::filesystem::path VersionedPath(const std::filesystem::path& Path, int Version);

    // Claims Desired, or the first free of Desired_v2, Desired_v3, ... by exclusive create.
    // The claimed name exists as an empty file on success; Error is set on failure.
    bool ReserveUniquePath(const std::filesystem::path& Desired, std::filesystem::path& Reserved, std::string& Error) const;

    const std::string& GetPattern() const { return PatternText; }
    const std::filesystem::path& GetDestinationRoot() const { return DestinationRoot; }

private:
    std::string PatternText;
    std::regex CompiledPattern;
    std::string FolderTemplate;
    std::string FallbackFolder;
    std::filesystem::path DestinationRoot;

    static void ReplaceAll(std::string& Text, const std::string& From, const std::string& To);
};
