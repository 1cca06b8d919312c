#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct BackupRecord
{
    std::filesystem::path BackupPath;
    std::filesystem::path SavePath;
    std::filesystem::path CloudTarget;
    std::string Timestamp; // YYYY-MM-DD HH:MM:SS, local time
    std::string Platform;
};

// Each backup folder carries a small Key = Value manifest so a later session can find it again
namespace BackupManifest
{
    extern const std::string FileName;

    bool Write(const BackupRecord& Record);
    std::optional<BackupRecord> Read(const std::filesystem::path& BackupDir);

    std::vector<BackupRecord> ListAll(const std::filesystem::path& BackupRoot); // newest first
    std::optional<BackupRecord> FindLatest(const std::filesystem::path& BackupRoot, const std::filesystem::path& SavePath);
}
