#pragma once

#include <filesystem>
#include <memory>
#include <string>

// Creates, detects and removes the directory link that replaces the game's save folder.
// Implementations throw LinkCreationError / RemovalError with the native diagnostic text.
class LinkStrategy
{
public:
    virtual ~LinkStrategy() = default;

    virtual void CreateLink(const std::filesystem::path& LinkPath, const std::filesystem::path& TargetPath) = 0;
    virtual bool IsLink(const std::filesystem::path& Path) const = 0;
    virtual void RemoveLink(const std::filesystem::path& Path) = 0;
    virtual std::string Name() const = 0;

    // Where the link at Path points, empty if Path is not a link
    std::filesystem::path LinkTarget(const std::filesystem::path& Path) const;
};

// POSIX: a directory symbolic link
class SymlinkStrategy : public LinkStrategy
{
public:
    void CreateLink(const std::filesystem::path& LinkPath, const std::filesystem::path& TargetPath) override;
    bool IsLink(const std::filesystem::path& Path) const override;
    void RemoveLink(const std::filesystem::path& Path) override;
    std::string Name() const override { return "Symlink"; }
};

#ifdef _WIN32
// Windows: an NTFS directory junction, which unlike a directory symlink needs no elevation
class JunctionStrategy : public LinkStrategy
{
public:
    void CreateLink(const std::filesystem::path& LinkPath, const std::filesystem::path& TargetPath) override;
    bool IsLink(const std::filesystem::path& Path) const override;
    void RemoveLink(const std::filesystem::path& Path) override;
    std::string Name() const override { return "Junction"; }
};
#endif

std::unique_ptr<LinkStrategy> CreateLinkStrategy();
std::string GetPlatformName();
