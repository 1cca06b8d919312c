#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>

#include "AppConfig.hpp"
#include "CrossSaveErrors.hpp"
#include "FileOperations.hpp"
#include "LinkStrategy.hpp"
#include "TestHelpers.hpp"

namespace FS = std::filesystem;

static void TestNormalize(const FS::path& Root)
{
    std::cout << "[Test] Normalize..." << std::endl;

    FS::create_directories(Root / "a" / "b");
    assert(FileOperations::Normalize(Root / "a" / "b" / ".." / "b") == Root / "a" / "b");
    assert(FileOperations::Normalize((Root / "a" / "b").string() + "/") == Root / "a" / "b");
    assert(FileOperations::Normalize("").empty());

    assert(FileOperations::Normalize("~") == FileOperations::Normalize(GetHomeDirectory()));
    assert(FileOperations::Normalize("~/Saves") == FS::weakly_canonical(GetHomeDirectory()) / "Saves");

    // The last segment is kept as-is even when it is a link
    auto Strategy = CreateLinkStrategy();
    FS::create_directories(Root / "target");
    Strategy->CreateLink(Root / "link", Root / "target");
    assert(FileOperations::Normalize(Root / "link") == Root / "link");
}

static void TestCopyContentsOverwrite(const FS::path& Root)
{
    std::cout << "[Test] CopyContents with overwrite..." << std::endl;

    FS::path Src = Root / "copy_src";
    FS::path Dst = Root / "copy_dst";
    WriteFile(Src / "save.txt", "new");
    WriteFile(Src / "Farm" / "Farm_1", "farm data");
    WriteFile(Src / "Farm" / "Deep" / "info", "deep");
    WriteFile(Dst / "save.txt", "old");
    WriteFile(Dst / "Farm" / "stale", "should be gone");
    WriteFile(Dst / "unrelated.txt", "kept");

    CopyStats Stats = FileOperations::CopyContents(Src, Dst, true);

    assert(ReadFile(Dst / "save.txt") == "new");
    assert(ReadFile(Dst / "Farm" / "Farm_1") == "farm data");
    assert(ReadFile(Dst / "Farm" / "Deep" / "info") == "deep");
    assert(!FS::exists(Dst / "Farm" / "stale") && "Overwritten folders are replaced, not merged");
    assert(ReadFile(Dst / "unrelated.txt") == "kept");
    assert(Stats.Files == 3);
    assert(Stats.Skipped == 0);
    assert(ReadFile(Src / "save.txt") == "new");
}

static void TestCopyContentsSkip(const FS::path& Root)
{
    std::cout << "[Test] CopyContents without overwrite..." << std::endl;

    FS::path Src = Root / "skip_src";
    FS::path Dst = Root / "skip_dst";
    WriteFile(Src / "save.txt", "new");
    WriteFile(Src / "other.txt", "other");
    WriteFile(Dst / "save.txt", "old");

    CopyStats Stats = FileOperations::CopyContents(Src, Dst, false);

    assert(ReadFile(Dst / "save.txt") == "old");
    assert(ReadFile(Dst / "other.txt") == "other");
    assert(Stats.Skipped == 1);
}

static void TestCopyKeepsMetadata(const FS::path& Root)
{
    std::cout << "[Test] CopyContents keeps modification time..." << std::endl;

    FS::path Src = Root / "meta_src";
    FS::path Dst = Root / "meta_dst";
    WriteFile(Src / "save.txt", "data");

    auto Old = FS::last_write_time(Src / "save.txt") - std::chrono::hours(48);
    FS::last_write_time(Src / "save.txt", Old);
#ifndef _WIN32
    FS::permissions(Src / "save.txt", FS::perms::owner_read | FS::perms::owner_write, FS::perm_options::replace);
#endif

    FileOperations::CopyContents(Src, Dst, true);

    assert(FS::last_write_time(Dst / "save.txt") == Old);
#ifndef _WIN32
    assert(FS::status(Dst / "save.txt").permissions() == (FS::perms::owner_read | FS::perms::owner_write));
#endif
}

static void TestCopyMissingSource(const FS::path& Root)
{
    std::cout << "[Test] CopyContents on a missing source..." << std::endl;

    bool Threw = false;
    try
    {
        FileOperations::CopyContents(Root / "does_not_exist", Root / "never", true);
    }
    catch (const CopyError& e)
    {
        Threw = true;
        assert(e.GetKind() == ErrorKind::Copy);
    }
    assert(Threw);
    assert(!FS::exists(Root / "never"));
}

static void TestBackupFolder(const FS::path& Root)
{
    std::cout << "[Test] BackupFolder..." << std::endl;

    FS::path Src = Root / "backup_src";
    FS::path BackupRoot = Root / "backups" / "nested";
    MakeScenarioSaves(Src);
    auto Before = SnapshotTree(Src);

    FS::path First = FileOperations::BackupFolder(Src, BackupRoot);
    FS::path Second = FileOperations::BackupFolder(Src, BackupRoot);

    assert(First != Second && "Backups taken within the same second must not collide");
    assert(First.parent_path() == BackupRoot);
    assert(First.filename().string().rfind(FileOperations::BackupFolderPrefix, 0) == 0);
    assert(SnapshotTree(First) == Before);
    assert(SnapshotTree(Second) == Before);
    assert(SnapshotTree(Src) == Before);
}

static void TestBackupFolderName()
{
    std::cout << "[Test] Backup folder name format..." << std::endl;

    std::string Name = FileOperations::MakeBackupFolderName(std::chrono::system_clock::now());
    // Saves-backup-YYYYMMDD-HHMMSS
    assert(Name.size() == FileOperations::BackupFolderPrefix.size() + 15);
    assert(Name[FileOperations::BackupFolderPrefix.size() + 8] == '-');
}

static void TestRemovePath(const FS::path& Root)
{
    std::cout << "[Test] RemovePath..." << std::endl;

    FS::path Target = Root / "rm_target";
    WriteFile(Target / "keep.txt", "keep me");

    auto Strategy = CreateLinkStrategy();
    Strategy->CreateLink(Root / "rm_link", Target);
    assert(FileOperations::IsLinkEntry(Root / "rm_link"));

    FileOperations::RemovePath(Root / "rm_link");
    assert(!FileOperations::Exists(Root / "rm_link"));
    assert(ReadFile(Target / "keep.txt") == "keep me" && "Removing a link never touches its target");

    FileOperations::RemovePath(Target);
    assert(!FS::exists(Target));

    // Absent path is a no-op
    FileOperations::RemovePath(Root / "rm_absent");
}

static void TestIsInside()
{
    std::cout << "[Test] IsInside..." << std::endl;

    assert(FileOperations::IsInside("/a/b", "/a/b/c"));
    assert(FileOperations::IsInside("/a/b", "/a/b"));
    assert(FileOperations::IsInside("/a/b/", "/a/b/c"));
    assert(!FileOperations::IsInside("/a/b/c", "/a/b"));
    assert(!FileOperations::IsInside("/a/b", "/a/bc"));
#ifdef _WIN32
    assert(FileOperations::IsInside("C:\\Saves", "c:\\saves\\Cloud"));
#endif
}

static void TestIsPhysicallyInside(const FS::path& Root)
{
    std::cout << "[Test] IsPhysicallyInside..." << std::endl;

    FS::path Game = Root / "phys" / "Game";
    FS::create_directories(Game / "Saves");
    auto Strategy = CreateLinkStrategy();
    FS::path Alias = Root / "phys" / "Alias";
    Strategy->CreateLink(Alias, Game);

    assert(FileOperations::IsPhysicallyInside(Game / "Saves", Game / "Saves"));
    assert(FileOperations::IsPhysicallyInside(Game / "Saves", Alias / "Saves"));
    assert(FileOperations::IsPhysicallyInside(Game / "Saves", Alias / "Saves" / "NotYetCreated"));
    assert(FileOperations::IsPhysicallyInside(Alias, Game / "Saves"));
    assert(!FileOperations::IsInside(Game / "Saves", Alias / "Saves"));
    assert(!FileOperations::IsPhysicallyInside(Game / "Saves", Root / "phys" / "Cloud" / "Saves"));
    assert(!FileOperations::IsPhysicallyInside(Game / "Saves", Game));

    Strategy->RemoveLink(Alias);
}

static void TestEnsureDirectory(const FS::path& Root)
{
    std::cout << "[Test] EnsureDirectory..." << std::endl;

    FileOperations::EnsureDirectory(Root / "x" / "y" / "z");
    FileOperations::EnsureDirectory(Root / "x" / "y" / "z");
    assert(FS::is_directory(Root / "x" / "y" / "z"));

    WriteFile(Root / "plain_file", "not a folder");
    bool Threw = false;
    try
    {
        FileOperations::EnsureDirectory(Root / "plain_file");
    }
    catch (const CrossSaveError&)
    {
        Threw = true;
    }
    assert(Threw);
}

static void TestExistsDanglingLink(const FS::path& Root)
{
    std::cout << "[Test] Exists on a dangling link..." << std::endl;

    FS::create_directories(Root / "dangling_target");
    auto Strategy = CreateLinkStrategy();
    Strategy->CreateLink(Root / "dangling", Root / "dangling_target");
    FS::remove(Root / "dangling_target");

    assert(FileOperations::Exists(Root / "dangling"));
    assert(!FileOperations::Exists(Root / "nothing_here"));
    FileOperations::RemovePath(Root / "dangling");
    assert(!FileOperations::Exists(Root / "dangling"));
}

int main()
{
    std::cout << "[Test] Starting FileOperations Test..." << std::endl;

    FS::path Root = MakeTestRoot("file_operations");

    TestNormalize(Root);
    TestCopyContentsOverwrite(Root);
    TestCopyContentsSkip(Root);
    TestCopyKeepsMetadata(Root);
    TestCopyMissingSource(Root);
    TestBackupFolder(Root);
    TestBackupFolderName();
    TestRemovePath(Root);
    TestIsInside();
    TestIsPhysicallyInside(Root);
    TestEnsureDirectory(Root);
    TestExistsDanglingLink(Root);

    FS::remove_all(Root);
    std::cout << "[PASS] FileOperations Test." << std::endl;
    return 0;
}
