#include "FilenameClassifier.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace FS = std::filesystem;

FilenameClassifier::FilenameClassifier(const std::string& Pattern, const std::string& Template, const std::string& Fallback, const std::string& Root)
    : PatternText(Pattern), FolderTemplate(Template), FallbackFolder(Fallback), DestinationRoot(Root)
{
    try
    {
        CompiledPattern = std::regex(Pattern, std::regex::ECMAScript);
    }
    catch (const std::regex_error& e)
    {
        throw std::invalid_argument("Invalid classification pattern '" + Pattern + "': " + e.what());
    }

    if (CompiledPattern.mark_count() != 4)
    {
        throw std::invalid_argument("Classification pattern must have exactly 4 capture groups, found " + std::to_string(CompiledPattern.mark_count()));
    }
}

ClassifiedFile FilenameClassifier::Classify(const std::string& FilePath) const
{
    ClassifiedFile File;
    File.OriginalPath = FilePath;
    File.FileName = FS::path(FilePath).filename().string();
    File.Extension = FS::path(File.FileName).extension().string();

    const std::string Stem = File.FileName.substr(0, File.FileName.size() - File.Extension.size());

    std::smatch Match;
    if (std::regex_search(Stem, Match, CompiledPattern) && Match.size() == 5)
    {
        File.Project = Match[1].str();
        File.Client = Match[2].str();
        File.Camera = Match[3].str();
        File.Clip = Match[4].str();
        File.Matched = true;
    }

    return File;
}

void FilenameClassifier::ReplaceAll(std::string& Text, const std::string& From, const std::string& To)
{
    size_t Pos = 0;
    while ((Pos = Text.find(From, Pos)) != std::string::npos)
    {
        Text.replace(Pos, From.size(), To);
        Pos += To.size();
    }
}

FS::path FilenameClassifier::DestinationDirectory(const ClassifiedFile& File) const
{
    if (!File.Matched)
    {
        return DestinationRoot / FallbackFolder;
    }

    // Tokens are substituted verbatim, templates come from the operator's config
    std::string Structure = FolderTemplate;
    ReplaceAll(Structure, "{client}", File.Client);
    ReplaceAll(Structure, "{project}", File.Project);
    ReplaceAll(Structure, "{camera}", File.Camera);

    return DestinationRoot / Structure;
}

FS::path FilenameClassifier::DestinationPath(const ClassifiedFile& File) const
{
    if (File.Matched)
    {
        return DestinationDirectory(File) / (File.Clip + File.Extension);
    }
    return DestinationDirectory(File) / File.FileName;
}

FS::path FilenameClassifier::VersionedPath(const FS::path& Path, int Version)
{
    const std::string Extension = Path.extension().string();
    const std::string Stem = Path.filename().string().substr(0, Path.filename().string().size() - Extension.size());
    return Path.parent_path() / (Stem + "_v" + std::to_string(Version) + Extension);
}

bool FilenameClassifier::ReserveUniquePath(const FS::path& Desired, FS::path& Reserved, std::string& Error) const
{
    std::error_code ec;
    FS::create_directories(Desired.parent_path(), ec);
    if (ec)
    {
        Error = "Failed to create directory " + Desired.parent_path().string() + ": " + ec.message();
        return false;
    }

    // Candidate 0 is the plain name, then _v2 .. _v(MaxVersionCandidates + 1)
    for (int Candidate = 0; Candidate <= MaxVersionCandidates; ++Candidate)
    {
        FS::path Path = (Candidate == 0) ? Desired : VersionedPath(Desired, Candidate + 1);

        int Fd = open(Path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (Fd >= 0)
        {
            close(Fd);
            Reserved = Path;
            return true;
        }
        if (errno != EEXIST)
        {
            Error = "Failed to claim " + Path.string() + ": " + std::strerror(errno);
            return false;
        }
    }

    Error = "Too many versions of file: " + Desired.string();
    return false;
}
