#pragma once

#include <string>
#include <filesystem>

// Built once at startup (defaults, then the config file) and passed by reference.
struct AppConfig
{
    std::string AppName;
    std::string ConfigFile;
    std::string LogDir;
    std::string Mode;

    std::filesystem::path SavePath;
    std::filesystem::path CloudRoot;
    std::filesystem::path BackupRoot;
    std::filesystem::path BackupPath; // explicit backup to restore, optional

    unsigned short int MaxLogFiles = 10;
    bool OverwriteExisting = true;

    static AppConfig Defaults();

    std::filesystem::path GetCloudTarget() const;
    std::filesystem::path GetDefaultBackupRoot() const;
};

std::filesystem::path GetHomeDirectory();
