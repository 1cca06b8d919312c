#include "FileOperations.hpp"
#include "AppConfig.hpp"
#include "CrossSaveErrors.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <stack>
#include <utility>

#ifdef _WIN32
#include <Windows.h>

inline std::filesystem::path NormalizeLongPath(const std::filesystem::path& path)
{
    std::wstring wpath = path.wstring();

    // Already normalized
    if (wpath.starts_with(L"\\\\?\\"))
        return path;

    constexpr size_t MAX_PATH_LIMIT = 260;

    if (wpath.size() >= MAX_PATH_LIMIT)
    {
        if (wpath.starts_with(L"\\\\"))
        {
            // UNC path: \\server\share -> \\?\UNC\server\share
            return std::filesystem::path(L"\\\\?\\UNC\\" + wpath.substr(2));
        }
        // Local drive path: C:\folder\file -> \\?\C:\folder\file
        return std::filesystem::path(L"\\\\?\\" + wpath);
    }

    return path;
}

inline std::string LastErrorMessage(DWORD Err)
{
    return std::error_code(static_cast<int>(Err), std::system_category()).message();
}

#else

inline std::filesystem::path NormalizeLongPath(const std::filesystem::path& path)
{
    return path;
}

#endif

namespace FS = std::filesystem;

const std::string FileOperations::BackupFolderPrefix = "Saves-backup-";

FS::path FileOperations::Normalize(const FS::path& Path)
{
    if (Path.empty())
    {
        return FS::path();
    }

    FS::path Expanded = Path;
    std::string Raw = Path.string();

    if (!Raw.empty() && Raw[0] == '~' && (Raw.size() == 1 || Raw[1] == '/' || Raw[1] == '\\'))
    {
        Expanded = GetHomeDirectory();
        if (Raw.size() > 2)
        {
            Expanded /= Raw.substr(2);
        }
    }

    std::error_code ec;
    FS::path Absolute = FS::absolute(Expanded, ec);
    if (ec)
    {
        throw ValidationError("Normalize", "Cannot make path absolute: " + Raw + ": " + ec.message());
    }

    Absolute = Absolute.lexically_normal();
    if (!Absolute.has_filename() && Absolute.has_relative_path())
    {
        Absolute = Absolute.parent_path();
    }

    // Only intermediate segments are resolved, the final entry may itself be the save link
    if (!Absolute.has_relative_path())
    {
        return Absolute;
    }

    FS::path Parent = FS::weakly_canonical(Absolute.parent_path(), ec);
    if (ec)
    {
        throw ValidationError("Normalize", "Cannot resolve path: " + Raw + ": " + ec.message());
    }
    return Parent / Absolute.filename();
}

bool FileOperations::Exists(const FS::path& Path)
{
    std::error_code ec;
    FS::file_status Status = FS::symlink_status(Path, ec);
    if (ec)
    {
        return false;
    }
    return FS::exists(Status);
}

bool FileOperations::IsLinkEntry(const FS::path& Path)
{
#ifdef _WIN32
    DWORD Attrs = GetFileAttributesW(Path.wstring().c_str());
    if (Attrs == INVALID_FILE_ATTRIBUTES)
    {
        return false;
    }
    return (Attrs & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
#else
    std::error_code ec;
    FS::file_status Status = FS::symlink_status(Path, ec);
    if (ec)
    {
        return false;
    }
    return FS::is_symlink(Status);
#endif
}

namespace
{
    bool SameComponent(const FS::path& A, const FS::path& B)
    {
#ifdef _WIN32
        // NTFS names are case-insensitive
        return CompareStringOrdinal(A.c_str(), -1, B.c_str(), -1, TRUE) == CSTR_EQUAL;
#else
        return A == B;
#endif
    }

    FS::path ResolveOrKeep(const FS::path& Path)
    {
        std::error_code ec;
        FS::path Resolved = FS::weakly_canonical(Path, ec);
        if (ec)
        {
            return Path.lexically_normal();
        }
        return Resolved;
    }
}

bool FileOperations::IsInside(const FS::path& Parent, const FS::path& Child)
{
    FS::path ParentNorm = Parent.lexically_normal();
    FS::path ChildNorm = Child.lexically_normal();

    if (!ParentNorm.has_filename() && ParentNorm.has_relative_path())
    {
        ParentNorm = ParentNorm.parent_path();
    }

    auto ParentIt = ParentNorm.begin();
    auto ChildIt = ChildNorm.begin();

    for (; ParentIt != ParentNorm.end(); ++ParentIt, ++ChildIt)
    {
        if (ChildIt == ChildNorm.end() || !SameComponent(*ParentIt, *ChildIt))
        {
            return false;
        }
    }
    return true;
}

bool FileOperations::IsPhysicallyInside(const FS::path& Parent, const FS::path& Child)
{
    if (IsInside(ResolveOrKeep(Parent), ResolveOrKeep(Child)))
    {
        return true;
    }

    // Aliases the resolved text cannot show (hard links, bind mounts, junctions): compare
    // every existing ancestor of Child, Child included, against Parent itself
    std::error_code ec;
    if (!FS::exists(Parent, ec))
    {
        return false;
    }

    FS::path Current = Child.lexically_normal();
    while (true)
    {
        std::error_code EquivalentError;
        if (FS::exists(Current, ec) && FS::equivalent(Parent, Current, EquivalentError))
        {
            return true;
        }
        if (!Current.has_relative_path())
        {
            return false;
        }
        Current = Current.parent_path();
    }
}

void FileOperations::EnsureDirectory(const FS::path& Path)
{
    std::error_code ec;
    if (FS::is_directory(Path, ec))
    {
        return;
    }

    FS::create_directories(Path, ec);
    if (ec)
    {
        throw CopyError("EnsureDirectory", "Failed to create directory " + Path.string() + ": " + ec.message());
    }
    if (!FS::is_directory(Path, ec))
    {
        throw CopyError("EnsureDirectory", "Path exists but is not a directory: " + Path.string());
    }
    Log.Info("[FileOperations] Created directory: " + Path.string());
}

CopyStats FileOperations::CopyContents(const FS::path& Src, const FS::path& Dst, bool Overwrite)
{
    std::error_code ec;
    if (!FS::is_directory(Src, ec))
    {
        throw CopyError("CopyContents", "Source is not a directory: " + Src.string());
    }

    EnsureDirectory(Dst);

    CopyStats Stats;
    FS::directory_iterator It(Src, ec);
    if (ec)
    {
        throw CopyError("CopyContents", "Failed to list " + Src.string() + ": " + ec.message());
    }

    for (const auto& Entry : It)
    {
        FS::path Target = Dst / Entry.path().filename();

        if (Exists(Target))
        {
            if (!Overwrite)
            {
                Log.Info("[FileOperations] Skipping existing destination entry: " + Target.string());
                Stats.Skipped++;
                continue;
            }

            try
            {
                RemovePath(Target);
            }
            catch (const RemovalError& e)
            {
                throw CopyError("CopyContents", std::string("Could not replace existing entry: ") + e.what());
            }
        }

        CopyEntry(Entry.path(), Target, Stats);
    }

    Log.Info("[FileOperations] Copied " + Src.string() + " -> " + Dst.string() + " | Files: " + std::to_string(Stats.Files) + " | Directories: " + std::to_string(Stats.Directories) + " | Links: " + std::to_string(Stats.Links) + " | Skipped: " + std::to_string(Stats.Skipped));
    return Stats;
}

std::string FileOperations::MakeBackupFolderName(std::chrono::system_clock::time_point Time)
{
    return BackupFolderPrefix + FormatLocalTime(Time, "%Y%m%d-%H%M%S");
}

FS::path FileOperations::BackupFolder(const FS::path& Src, const FS::path& BackupRoot)
{
    std::error_code ec;
    if (!FS::is_directory(Src, ec))
    {
        throw BackupError("BackupFolder", "Nothing to back up, not a directory: " + Src.string());
    }

    FS::create_directories(BackupRoot, ec);
    if (ec)
    {
        throw BackupError("BackupFolder", "Failed to create backup root " + BackupRoot.string() + ": " + ec.message());
    }

    // create_directory returns false when the name is taken, which makes the choice collision-free
    const std::string BaseName = MakeBackupFolderName(std::chrono::system_clock::now());
    FS::path BackupPath = BackupRoot / BaseName;
    unsigned int Suffix = 0;

    while (!FS::create_directory(BackupPath, ec))
    {
        if (ec)
        {
            throw BackupError("BackupFolder", "Failed to create backup folder " + BackupPath.string() + ": " + ec.message());
        }
        Suffix++;
        BackupPath = BackupRoot / (BaseName + "-" + std::to_string(Suffix));
    }

    try
    {
        CopyStats Stats;
        CopyTree(Src, BackupPath, Stats);
        Log.Info("[FileOperations] Backup created: " + BackupPath.string() + " | Files: " + std::to_string(Stats.Files));
    }
    catch (const CrossSaveError& e)
    {
        throw BackupError("BackupFolder", std::string("Backup of ") + Src.string() + " failed: " + e.what());
    }

    return BackupPath;
}

void FileOperations::RemovePath(const FS::path& Path)
{
    if (!Exists(Path))
    {
        return;
    }

    std::error_code ec;

    if (IsLinkEntry(Path))
    {
#ifdef _WIN32
        // Directory junctions and directory symlinks are removed as directories, the target is untouched
        DWORD Attrs = GetFileAttributesW(Path.wstring().c_str());
        if (Attrs != INVALID_FILE_ATTRIBUTES && (Attrs & FILE_ATTRIBUTE_DIRECTORY) != 0)
        {
            if (!RemoveDirectoryW(Path.wstring().c_str()))
            {
                throw RemovalError("RemovePath", "Failed to remove link " + Path.string() + ": " + LastErrorMessage(GetLastError()));
            }
            Log.Info("[FileOperations] Removed link: " + Path.string());
            return;
        }
#endif
        FS::remove(Path, ec);
        if (ec)
        {
            throw RemovalError("RemovePath", "Failed to remove link " + Path.string() + ": " + ec.message());
        }
        Log.Info("[FileOperations] Removed link: " + Path.string());
        return;
    }

    if (FS::is_directory(Path, ec))
    {
        FS::remove_all(NormalizeLongPath(Path), ec);
    }
    else
    {
        FS::remove(Path, ec);
    }

    if (ec)
    {
        throw RemovalError("RemovePath", "Failed to remove " + Path.string() + ": " + ec.message());
    }
    Log.Info("[FileOperations] Removed: " + Path.string());
}

void FileOperations::CopyEntry(const FS::path& Src, const FS::path& Dst, CopyStats& Stats)
{
    std::error_code ec;

    if (IsLinkEntry(Src))
    {
        CopyLink(Src, Dst);
        Stats.Links++;
        return;
    }

    FS::file_status Status = FS::status(Src, ec);
    if (ec)
    {
        throw CopyError("CopyEntry", "Cannot stat " + Src.string() + ": " + ec.message());
    }

    if (FS::is_directory(Status))
    {
        CopyTree(Src, Dst, Stats);
    }
    else if (FS::is_regular_file(Status))
    {
        CopyFileWithMetadata(Src, Dst);
        Stats.Files++;
    }
    else
    {
        Log.Info("[FileOperations] Skipping special file: " + Src.string());
        Stats.Skipped++;
    }
}

void FileOperations::CopyTree(const FS::path& Src, const FS::path& Dst, CopyStats& Stats)
{
    std::stack<std::pair<FS::path, FS::path>> DirStack;
    DirStack.push({ Src, Dst });

    while (!DirStack.empty())
    {
        auto [CurrentSrc, CurrentDst] = DirStack.top();
        DirStack.pop();

        std::error_code ec;
        FS::create_directories(CurrentDst, ec);
        if (ec)
        {
            throw CopyError("CopyTree", "Failed to create directory " + CurrentDst.string() + ": " + ec.message());
        }

        Stats.Directories++;

        FS::directory_iterator It(NormalizeLongPath(CurrentSrc), ec);
        if (ec)
        {
            throw CopyError("CopyTree", "Failed to list " + CurrentSrc.string() + ": " + ec.message());
        }

        for (const auto& Entry : It)
        {
            FS::path Target = CurrentDst / Entry.path().filename();

            if (IsLinkEntry(Entry.path()))
            {
                CopyLink(Entry.path(), Target);
                Stats.Links++;
            }
            else if (Entry.is_directory(ec))
            {
                DirStack.push({ Entry.path(), Target });
            }
            else if (Entry.is_regular_file(ec))
            {
                CopyFileWithMetadata(Entry.path(), Target);
                Stats.Files++;
            }
            else
            {
                Log.Info("[FileOperations] Skipping special file: " + Entry.path().string());
                Stats.Skipped++;
            }
        }
    }
}

void FileOperations::CopyFileWithMetadata(const FS::path& Src, const FS::path& Dst)
{
#ifdef _WIN32
    // CopyFileExW keeps timestamps and attributes
    std::wstring SrcW = NormalizeLongPath(Src).wstring();
    std::wstring DstW = NormalizeLongPath(Dst).wstring();

    BOOL Result = CopyFileExW(SrcW.c_str(), DstW.c_str(), nullptr, nullptr, nullptr, COPY_FILE_COPY_SYMLINK);
    if (!Result)
    {
        DWORD Err = GetLastError();
        throw CopyError("CopyFile", "CopyFileExW failed for " + Src.string() + " -> " + Dst.string() + ": " + LastErrorMessage(Err));
    }
#else
    std::error_code ec;
    FS::copy_file(Src, Dst, FS::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw CopyError("CopyFile", "Failed to copy " + Src.string() + " -> " + Dst.string() + ": " + ec.message());
    }

    FS::file_status SrcStatus = FS::status(Src, ec);
    if (!ec)
    {
        FS::permissions(Dst, SrcStatus.permissions(), FS::perm_options::replace, ec);
    }
    if (ec)
    {
        Log.Error("[FileOperations] Could not copy permissions to " + Dst.string() + ": " + ec.message());
    }

    FS::file_time_type MTime = FS::last_write_time(Src, ec);
    if (!ec)
    {
        FS::last_write_time(Dst, MTime, ec);
    }
    if (ec)
    {
        Log.Error("[FileOperations] Could not copy modification time to " + Dst.string() + ": " + ec.message());
    }
#endif
}

void FileOperations::CopyLink(const FS::path& Src, const FS::path& Dst)
{
    std::error_code ec;
    FS::copy_symlink(Src, Dst, ec);
    if (ec)
    {
        throw CopyError("CopyLink", "Failed to copy link " + Src.string() + " -> " + Dst.string() + ": " + ec.message());
    }
}
