#include <fstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"

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
    // "~" and "~/..." are expanded against the home folder later
    if (!Path.empty() && Path[0] == '~' && (Path.size() == 1 || Path[1] == '/' || Path[1] == '\\'))
    {
        return true;
    }

#ifdef _WIN32
    if (Path.size() >= 4 && Path.compare(0, 4, R"(\\.\)") == 0)
    {
        return false;
    }

    if (Path.size() >= 4 && Path.compare(0, 4, "\\\\?\\") == 0)
    {
        // After \\?\, check what comes next:
        if (Path.size() >= 8 && Path.compare(4, 4, "UNC\\") == 0)
        {
            return true;
        }
        return Path.size() >= 6 && Path[5] == ':';
    }

    if (Path.size() >= 3 && std::isalpha(static_cast<unsigned char>(Path[0])) && Path[1] == ':' && (Path[2] == '\\' || Path[2] == '/'))
    {
        return true;
    }

    return Path.size() >= 2 && Path[0] == '\\' && Path[1] == '\\';
#else
    return !Path.empty() && Path[0] == '/';
#endif
}

bool ConfigParser::ParseYesNo(const std::string& Value, int LineNumber, bool& Out)
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
    AddError("Line " + std::to_string(LineNumber) + ": Invalid Input. Use 'YES' or 'NO'.");
    return false;
}

bool ConfigParser::Parse(const std::string& FilePath, AppConfig& Config)
{
    if (!FS::exists(FilePath))
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

    Config.ConfigFile = FilePath;

    std::string Line;
    int LineNumber = 0;
    bool BackupRootSet = false;

    auto SetPath = [&](const std::string& Key, const std::string& Value, FS::path& Target)
    {
        if (!IsAbsolutePath(Value))
        {
            AddError("Line " + std::to_string(LineNumber) + ": " + Key + " path is not absolute.");
            return false;
        }
        if (!Target.empty())
        {
            AddError("Line " + std::to_string(LineNumber) + ": Multiple " + Key + " entries found.");
            return false;
        }
        Target = Value;
        return true;
    };

    // BackupRoot has a default that depends on AppName, track it separately
    Config.BackupRoot.clear();

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

        if (Value.empty())
        {
            AddError("Line " + std::to_string(LineNumber) + ": Empty value for '" + Key + "'.");
            continue;
        }

        if (Key == "SavePath")
        {
            SetPath(Key, Value, Config.SavePath);
        }

        else if (Key == "CloudRoot")
        {
            SetPath(Key, Value, Config.CloudRoot);
        }

        else if (Key == "BackupRoot")
        {
            if (SetPath(Key, Value, Config.BackupRoot))
            {
                BackupRootSet = true;
                AddInfo("Backups will be stored under " + Value);
            }
        }

        else if (Key == "BackupPath")
        {
            SetPath(Key, Value, Config.BackupPath);
        }

        else if (Key == "AppName")
        {
            if (Value.find_first_of("/\\:") != std::string::npos)
            {
                AddError("Line " + std::to_string(LineNumber) + ": AppName must not contain path separators.");
                continue;
            }
            Config.AppName = Value;
        }

        else if (Key == "LogDir")
        {
            Config.LogDir = Value;
        }

        else if (Key == "Mode")
        {
            if (Value == "Migrate" || Value == "Link" || Value == "Restore" || Value == "Status")
            {
                Config.Mode = Value;
                AddInfo("Mode set to '" + Value + "'.");
            }
            else
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid Mode. Use 'Migrate', 'Link', 'Restore' or 'Status'.");
            }
        }

        else if (Key == "MaxLogFiles")
        {
            try
            {
                int ValueNum = std::stoi(Value);
                if (ValueNum <= 0 || ValueNum > 65535)
                {
                    AddError("Line " + std::to_string(LineNumber) + ": MaxLogFiles must be between 1 and 65,535.");
                    continue;
                }
                Config.MaxLogFiles = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxLogFiles set to " + std::to_string(ValueNum));
            }
            catch (const std::exception&)
            {
                AddError("Line " + std::to_string(LineNumber) + ": Invalid number for MaxLogFiles. Select between 1 and 65,535");
            }
        }

        else if (Key == "OverwriteExisting")
        {
            bool Flag = true;
            if (ParseYesNo(Value, LineNumber, Flag))
            {
                Config.OverwriteExisting = Flag;
                if (!Flag)
                {
                    AddInfo("IMPORTANT - ! Existing cloud entries will be kept, Migrate skips them !");
                }
            }
        }

        else
        {
            AddError("Line " + std::to_string(LineNumber) + ": Unknown key '" + Key + "'.");
            continue;
        }
    }

    if (!BackupRootSet)
    {
        Config.BackupRoot = Config.GetDefaultBackupRoot();
    }

    if ((Config.Mode == "Migrate" || Config.Mode == "Link") && Config.CloudRoot.empty())
    {
        AddError("No CloudRoot provided, required for Mode '" + Config.Mode + "'.");
    }

    return Errors.empty();  // Return false only if fatal errors present
}
