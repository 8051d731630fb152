#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>
#include <regex>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"

namespace FS = std::filesystem;

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
    return !Path.empty() && Path[0] == '/';
}

bool ConfigParser::ParseYesNo(const std::string& Key, const std::string& Value, int LineNumber, bool& Out)
{
    if (Value == "YES")
    {
        Out = true;
        return true;
    }
    if (Value == "NO")
    {
        Out = false;
        return true;
    }
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input for " + Key + ". Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::ParseNumber(const std::string& Key, const std::string& Value, int LineNumber, uint64_t Max, uint64_t& Out)
{
    if (Value.empty() || !std::all_of(Value.begin(), Value.end(), [](char Ch) { return std::isdigit(static_cast<unsigned char>(Ch)); }))
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
    try
    {
        uint64_t ValueNum = std::stoull(Value);
        if (ValueNum > Max)
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " must not exceed " + std::to_string(Max) + ".");
            return false;
        }
        Out = ValueNum;
        return true;
    }
    catch (const std::exception&)
    {
        AddError("Line " + std::to_string(LineNumber) + ": Invalid number for " + Key + ".");
        return false;
    }
}

void ConfigParser::ValidatePattern()
{
    try
    {
        std::regex Compiled(ConfigGlobal::Pattern, std::regex::ECMAScript);
        if (Compiled.mark_count() != 4)
        {
            AddError("Pattern must have exactly 4 capture groups (project, client, camera, clip), found " + std::to_string(Compiled.mark_count()) + ".");
        }
    }
    catch (const std::regex_error& e)
    {
        AddError("Invalid Pattern '" + ConfigGlobal::Pattern + "': " + e.what());
    }
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        // Trim leading whitespace
        Line.erase(Line.begin(), std::find_if(Line.begin(), Line.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        // Trim trailing whitespace
        Line.erase(std::find_if(Line.rbegin(), Line.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Line.end());

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(),[](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(),[](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());

        uint64_t ValueNum = 0;

        if (Key == "Destination")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Destination path is not absolute.");
                continue;
            }
            if (!ConfigGlobal::DestinationPath.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": Multiple destination entries found.");
                continue;
            }
            std::error_code ec;
            if (FS::exists(Value, ec) && !FS::is_directory(Value, ec))
            {
                AddError("Line " + std::to_string(LineNumber) + ": Destination path is not a directory.");
                continue;
            }
            ConfigGlobal::DestinationPath = Value;
        }

        else if (Key == "Pattern")
        {
            ConfigGlobal::Pattern = Value;
        }

        else if (Key == "FolderStructure")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": FolderStructure must not be empty.");
                continue;
            }
            if (Value.find("{client}") == std::string::npos && Value.find("{project}") == std::string::npos && Value.find("{camera}") == std::string::npos)
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": FolderStructure has no placeholders, every matched file lands in '" + Value + "'.");
            }
            ConfigGlobal::FolderStructure = Value;
        }

        else if (Key == "UnmatchedFolder")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": UnmatchedFolder must not be empty.");
                continue;
            }
            ConfigGlobal::UnmatchedFolder = Value;
        }

        else if (Key == "MaxWorkers")
        {
            if (!ParseNumber(Key, Value, LineNumber, std::numeric_limits<unsigned short int>::max(), ValueNum))
            {
                continue;
            }
            if (ValueNum == 0)
            {
                AddError("Line " + std::to_string(LineNumber) + ": MaxWorkers must be greater than zero.");
                continue;
            }
            ConfigGlobal::MaxWorkers = static_cast<unsigned short int>(ValueNum);
            AddInfo("MaxWorkers set to " + std::to_string(ValueNum));
        }

        else if (Key == "BufferSize")
        {
            if (!ParseNumber(Key, Value, LineNumber, 256ULL * 1024 * 1024, ValueNum))
            {
                continue;
            }
            if (ValueNum < 1024)
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": BufferSize below 1024 bytes, using 1 MB.");
                ValueNum = 1024 * 1024;
            }
            ConfigGlobal::BufferSize = static_cast<size_t>(ValueNum);
        }

        else if (Key == "VerifyChecksums")
        {
            if (ParseYesNo(Key, Value, LineNumber, ConfigGlobal::VerifyChecksums))
            {
                AddInfo(ConfigGlobal::VerifyChecksums ? "Checksum Verification Enabled" : "IMPORTANT - ! Checksum Verification Disabled !");
            }
        }

        else if (Key == "MaxRetries")
        {
            if (ParseNumber(Key, Value, LineNumber, 10, ValueNum))
            {
                ConfigGlobal::MaxRetries = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxRetries set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "RetryBackoffMs")
        {
            if (ParseNumber(Key, Value, LineNumber, 60000, ValueNum))
            {
                ConfigGlobal::RetryBackoffMs = static_cast<unsigned int>(ValueNum);
            }
        }

        else if (Key == "PriorityPrefix")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": PriorityPrefix must not be empty.");
                continue;
            }
            if (std::find(ConfigGlobal::PriorityPrefixes.begin(), ConfigGlobal::PriorityPrefixes.end(), Value) != ConfigGlobal::PriorityPrefixes.end())
            {
                AddInfo("Line " + std::to_string(LineNumber) + ": Duplicate priority prefix '" + Value + "'. Ignored.");
                continue;
            }
            ConfigGlobal::PriorityPrefixes.push_back(Value);
        }

        else if (Key == "MinDeviceSize")
        {
            if (ParseNumber(Key, Value, LineNumber, std::numeric_limits<uint64_t>::max(), ValueNum))
            {
                ConfigGlobal::MinDeviceSize = ValueNum;
            }
        }

        else if (Key == "AllowedFilesystem")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": AllowedFilesystem must not be empty.");
                continue;
            }
            ConfigGlobal::AllowedFilesystems.push_back(Value);
        }

        else if (Key == "DeviceExclude")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": DeviceExclude must not be empty.");
                continue;
            }
            ConfigGlobal::DeviceExcludes.push_back(Value);
        }

        else if (Key == "AutoMount")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::AutoMount);
        }

        else if (Key == "MountBase")
        {
            if (!IsAbsolutePath(Value))
            {
                AddError("Line " + std::to_string(LineNumber) + ": MountBase path is not absolute.");
                continue;
            }
            ConfigGlobal::MountBase = Value;
        }

        else if (Key == "PollIntervalSeconds")
        {
            if (!ParseNumber(Key, Value, LineNumber, 3600, ValueNum))
            {
                continue;
            }
            if (ValueNum == 0)
            {
                AddError("Line " + std::to_string(LineNumber) + ": PollIntervalSeconds must be greater than zero.");
                continue;
            }
            ConfigGlobal::PollIntervalSeconds = static_cast<unsigned short int>(ValueNum);
        }

        else if (Key == "SettleDelaySeconds")
        {
            if (ParseNumber(Key, Value, LineNumber, 600, ValueNum))
            {
                ConfigGlobal::SettleDelaySeconds = static_cast<unsigned short int>(ValueNum);
            }
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddError("Line " + std::to_string(LineNumber) + ": LogDir must not be empty.");
                continue;
            }
            ConfigGlobal::LogDir = Value;
        }

        else if (Key == "LogLevel")
        {
            if (Value != "info" && Value != "debug")
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid LogLevel. Use 'info' or 'debug'.");
                continue;
            }
            ConfigGlobal::LogLevel = Value;
        }

        else if (Key == "LogToDevice")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::LogToDevice);
        }

        else if (Key == "ConsoleOutput")
        {
            ParseYesNo(Key, Value, LineNumber, ConfigGlobal::ConsoleOutput);
        }

        else if (Key == "MaxLogFiles")
        {
            if (!ParseNumber(Key, Value, LineNumber, std::numeric_limits<unsigned short int>::max(), ValueNum))
            {
                continue;
            }
            if (ValueNum == 0)
            {
                AddError("Line " + std::to_string(LineNumber) + ": MaxLogFiles must be greater than zero.");
                continue;
            }
            ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(ValueNum);
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    if (ConfigGlobal::DestinationPath.empty())
    {
        AddError("No destination path provided.");
    }

    ValidatePattern();

    if (!ConfigGlobal::DestinationPath.empty() && IsAbsolutePath(ConfigGlobal::MountBase))
    {
        FS::path DestAbs = FS::path(ConfigGlobal::DestinationPath).lexically_normal();
        FS::path MountAbs = FS::path(ConfigGlobal::MountBase).lexically_normal();
        auto Mismatch = std::mismatch(MountAbs.begin(), MountAbs.end(), DestAbs.begin(), DestAbs.end());
        if (Mismatch.first == MountAbs.end())
        {
            AddError("Destination '" + DestAbs.string() + "' is inside the mount base '" + MountAbs.string() + "'. This is not allowed.");
        }
    }

    return Errors.empty();  // Return false only if fatal errors present
}
