#include "AppConfig.hpp"
#include <cstdlib>

namespace FS = std::filesystem;

AppConfig AppConfig::Defaults()
{
    AppConfig Config;
    Config.AppName = "StardewValleyCrossSaves";
    Config.ConfigFile = "CrossSave.cfg"; //Can be replaced by an absolute path
    Config.LogDir = "CrossSave_Logs";
    Config.Mode = "Status";
    Config.MaxLogFiles = 10;
    Config.OverwriteExisting = true;
    Config.BackupRoot = Config.GetDefaultBackupRoot();
    return Config;
}

FS::path AppConfig::GetCloudTarget() const
{
    if (CloudRoot.empty())
    {
        return FS::path();
    }
    return CloudRoot / "Saves";
}

FS::path AppConfig::GetDefaultBackupRoot() const
{
    return GetHomeDirectory() / (AppName + "_Backups");
}

FS::path GetHomeDirectory()
{
#ifdef _WIN32
    const char* Home = std::getenv("USERPROFILE");
    if (Home == nullptr || *Home == '\0')
    {
        const char* Drive = std::getenv("HOMEDRIVE");
        const char* Path = std::getenv("HOMEPATH");
        if (Drive != nullptr && Path != nullptr)
        {
            return FS::path(std::string(Drive) + Path);
        }
        return FS::current_path();
    }
    return FS::path(Home);
#else
    const char* Home = std::getenv("HOME");
    if (Home == nullptr || *Home == '\0')
    {
        return FS::current_path();
    }
    return FS::path(Home);
#endif
}
