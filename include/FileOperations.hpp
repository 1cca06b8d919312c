#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

struct CopyStats
{
    uintmax_t Files = 0;
    uintmax_t Directories = 0;
    uintmax_t Links = 0;
    uintmax_t Skipped = 0;
};

// Filesystem primitives shared by the Migrate, Link and Restore workflows.
// Failures are thrown as CopyError, BackupError, RemovalError or ValidationError.
class FileOperations
{
public:
    static std::filesystem::path Normalize(const std::filesystem::path& Path);
    static bool Exists(const std::filesystem::path& Path);
    static bool IsLinkEntry(const std::filesystem::path& Path);
    static bool IsInside(const std::filesystem::path& Parent, const std::filesystem::path& Child);
    // IsInside on the real folders: links resolved and same-folder aliases detected
    static bool IsPhysicallyInside(const std::filesystem::path& Parent, const std::filesystem::path& Child);

    static void EnsureDirectory(const std::filesystem::path& Path);
    static CopyStats CopyContents(const std::filesystem::path& Src, const std::filesystem::path& Dst, bool Overwrite);
    static std::filesystem::path BackupFolder(const std::filesystem::path& Src, const std::filesystem::path& BackupRoot);
    static void RemovePath(const std::filesystem::path& Path);

    static std::string MakeBackupFolderName(std::chrono::system_clock::time_point Time);

    static const std::string BackupFolderPrefix;

private:
    static void CopyEntry(const std::filesystem::path& Src, const std::filesystem::path& Dst, CopyStats& Stats);
    static void CopyTree(const std::filesystem::path& Src, const std::filesystem::path& Dst, CopyStats& Stats);
    static void CopyFileWithMetadata(const std::filesystem::path& Src, const std::filesystem::path& Dst);
    static void CopyLink(const std::filesystem::path& Src, const std::filesystem::path& Dst);
};
