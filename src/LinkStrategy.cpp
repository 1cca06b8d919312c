#include "LinkStrategy.hpp"
#include "CrossSaveErrors.hpp"
#include "Logger.hpp"

#include <system_error>

#ifdef _WIN32
#include <Windows.h>
#include <cstdio>
#include <sstream>
#endif

namespace FS = std::filesystem;

FS::path LinkStrategy::LinkTarget(const FS::path& Path) const
{
    if (!IsLink(Path))
    {
        return FS::path();
    }

    std::error_code ec;
    FS::path Target = FS::read_symlink(Path, ec);
    if (ec)
    {
        Log.Error("[LinkStrategy] Could not read link target of " + Path.string() + ": " + ec.message());
        return FS::path();
    }
    return Target;
}

void SymlinkStrategy::CreateLink(const FS::path& LinkPath, const FS::path& TargetPath)
{
    std::error_code ec;
    FS::create_directory_symlink(TargetPath, LinkPath, ec);
    if (ec)
    {
        throw LinkCreationError("CreateLink", "Failed to create symlink " + LinkPath.string() + " -> " + TargetPath.string() + ": " + ec.message());
    }
    Log.Info("[LinkStrategy] Created symlink " + LinkPath.string() + " -> " + TargetPath.string());
}

bool SymlinkStrategy::IsLink(const FS::path& Path) const
{
    std::error_code ec;
    FS::file_status Status = FS::symlink_status(Path, ec);
    if (ec)
    {
        return false;
    }
    return FS::is_symlink(Status);
}

void SymlinkStrategy::RemoveLink(const FS::path& Path)
{
    if (!IsLink(Path))
    {
        return;
    }

    std::error_code ec;
    FS::remove(Path, ec); // removes the link entry, never what it points to
    if (ec)
    {
        throw RemovalError("RemoveLink", "Failed to remove symlink " + Path.string() + ": " + ec.message());
    }
    Log.Info("[LinkStrategy] Removed symlink " + Path.string());
}

#ifdef _WIN32

namespace
{
    // _wpopen runs Command through cmd.exe, so builtins such as mklink work. Output receives stdout and stderr
    int RunCommandCaptured(const std::wstring& Command, std::string& Output)
    {
        std::wstring Full = Command + L" 2>&1";
        FILE* Pipe = _wpopen(Full.c_str(), L"r");
        if (Pipe == nullptr)
        {
            Output = "Could not start cmd: " + std::error_code(errno, std::generic_category()).message();
            return -1;
        }

        char Buffer[512];
        while (fgets(Buffer, sizeof(Buffer), Pipe) != nullptr)
        {
            Output += Buffer;
        }

        int Status = _pclose(Pipe);

        // Trim trailing newlines from the utility output
        while (!Output.empty() && (Output.back() == '\n' || Output.back() == '\r'))
        {
            Output.pop_back();
        }
        return Status;
    }
}

void JunctionStrategy::CreateLink(const FS::path& LinkPath, const FS::path& TargetPath)
{
    std::wstringstream Cmd;
    Cmd << L"mklink /J \"" << LinkPath.wstring() << L"\" \"" << TargetPath.wstring() << L"\"";

    std::string Output;
    int Status = RunCommandCaptured(Cmd.str(), Output);
    if (Status != 0)
    {
        if (Output.empty())
        {
            Output = "mklink failed with exit code " + std::to_string(Status);
        }
        throw LinkCreationError("CreateLink", "Failed to create junction " + LinkPath.string() + " -> " + TargetPath.string() + ": " + Output);
    }
    Log.Info("[LinkStrategy] Created junction " + LinkPath.string() + " -> " + TargetPath.string() + " (" + Output + ")");
}

bool JunctionStrategy::IsLink(const FS::path& Path) const
{
    // Junctions look like plain directories to exists/is_directory, only the reparse attribute tells them apart
    DWORD Attrs = GetFileAttributesW(Path.wstring().c_str());
    if (Attrs == INVALID_FILE_ATTRIBUTES)
    {
        return false;
    }
    return (Attrs & FILE_ATTRIBUTE_REPARSE_POINT) != 0;
}

void JunctionStrategy::RemoveLink(const FS::path& Path)
{
    if (!IsLink(Path))
    {
        return;
    }

    // RemoveDirectoryW on a junction deletes the reparse point only
    if (!RemoveDirectoryW(Path.wstring().c_str()))
    {
        DWORD Err = GetLastError();
        throw RemovalError("RemoveLink", "Failed to remove junction " + Path.string() + ": " + std::error_code(static_cast<int>(Err), std::system_category()).message());
    }
    Log.Info("[LinkStrategy] Removed junction " + Path.string());
}

#endif

std::unique_ptr<LinkStrategy> CreateLinkStrategy()
{
#ifdef _WIN32
    return std::make_unique<JunctionStrategy>();
#else
    return std::make_unique<SymlinkStrategy>();
#endif
}

std::string GetPlatformName()
{
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#else
    return "Linux";
#endif
}
