#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "BackupManifest.hpp"
#include "FileOperations.hpp"

// Fresh, empty folder under the system temp directory, resolved so that /tmp style aliases compare equal
inline std::filesystem::path MakeTestRoot(const std::string& Name)
{
    std::filesystem::path Root = std::filesystem::temp_directory_path() / ("crosssave_test_" + Name);
    std::filesystem::remove_all(Root);
    std::filesystem::create_directories(Root);
    return FileOperations::Normalize(Root);
}

inline void WriteFile(const std::filesystem::path& Path, const std::string& Content)
{
    std::filesystem::create_directories(Path.parent_path());
    std::ofstream Out(Path, std::ios::binary | std::ios::trunc);
    Out << Content;
}

inline std::string ReadFile(const std::filesystem::path& Path)
{
    std::ifstream In(Path, std::ios::binary);
    std::ostringstream Buffer;
    Buffer << In.rdbuf();
    return Buffer.str();
}

// Relative path -> file bytes ("<dir>" for folders). Backup manifests are left out.
inline std::map<std::string, std::string> SnapshotTree(const std::filesystem::path& Root)
{
    std::map<std::string, std::string> Snapshot;
    for (const auto& Entry : std::filesystem::recursive_directory_iterator(Root))
    {
        if (Entry.path().filename() == BackupManifest::FileName)
        {
            continue;
        }

        std::string Relative = std::filesystem::relative(Entry.path(), Root).generic_string();
        if (Entry.is_directory())
        {
            Snapshot[Relative] = "<dir>";
        }
        else
        {
            Snapshot[Relative] = ReadFile(Entry.path());
        }
    }
    return Snapshot;
}

// Save folder used by the scenario tests: A.txt and B/C.txt
inline void MakeScenarioSaves(const std::filesystem::path& SaveDir)
{
    WriteFile(SaveDir / "A.txt", "farm A");
    WriteFile(SaveDir / "B" / "C.txt", "farm B, file C");
}
