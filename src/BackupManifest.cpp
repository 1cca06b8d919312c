#include "BackupManifest.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace FS = std::filesystem;

namespace
{
    std::string Trim(const std::string& Text)
    {
        auto Begin = std::find_if(Text.begin(), Text.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); });
        auto End = std::find_if(Text.rbegin(), Text.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base();
        return Begin < End ? std::string(Begin, End) : std::string();
    }

    bool IsNewer(const BackupRecord& A, const BackupRecord& B)
    {
        if (A.Timestamp != B.Timestamp)
        {
            return A.Timestamp > B.Timestamp;
        }

        // Same second: collision suffixes (-1, -2, ...) make the name longer
        std::string NameA = A.BackupPath.filename().string();
        std::string NameB = B.BackupPath.filename().string();
        if (NameA.size() != NameB.size())
        {
            return NameA.size() > NameB.size();
        }
        return NameA > NameB;
    }
}

namespace BackupManifest
{
    const std::string FileName = ".CrossSaveManifest";

    bool Write(const BackupRecord& Record)
    {
        FS::path ManifestPath = Record.BackupPath / FileName;

        {
            std::ofstream Ofs(ManifestPath, std::ios::trunc);
            if (!Ofs.good())
            {
                Log.Error("[BackupManifest] Failed to open manifest for writing: " + ManifestPath.string());
                return false;
            }

            Ofs << "BackupPath = " << Record.BackupPath.string() << "\n";
            Ofs << "SavePath = " << Record.SavePath.string() << "\n";
            Ofs << "CloudTarget = " << Record.CloudTarget.string() << "\n";
            Ofs << "Timestamp = " << Record.Timestamp << "\n";
            Ofs << "Platform = " << Record.Platform << "\n";

            if (!Ofs.good())
            {
                Log.Error("[BackupManifest] Failed to write manifest: " + ManifestPath.string());
                return false;
            }
        }

#ifdef _WIN32
        DWORD attrs = GetFileAttributesW(ManifestPath.wstring().c_str());
        if (attrs == INVALID_FILE_ATTRIBUTES)
            return false;
        //Mark as Hidden File for Windows
        attrs |= FILE_ATTRIBUTE_HIDDEN;
        if (!SetFileAttributesW(ManifestPath.wstring().c_str(), attrs))
            return false;
#endif

        Log.Info("[BackupManifest] Manifest written: " + ManifestPath.string());
        return true;
    }

    std::optional<BackupRecord> Read(const FS::path& BackupDir)
    {
        FS::path ManifestPath = BackupDir / FileName;
        std::ifstream File(ManifestPath);
        if (!File.is_open())
        {
            return std::nullopt;
        }

        BackupRecord Record;
        std::string Line;
        int LineNumber = 0;

        while (std::getline(File, Line))
        {
            LineNumber++;
            Line = Trim(Line);
            if (Line.empty())
            {
                continue;
            }

            size_t EqualPos = Line.find('=');
            if (EqualPos == std::string::npos)
            {
                Log.Error("[BackupManifest] " + ManifestPath.string() + " line " + std::to_string(LineNumber) + ": No '=' found.");
                return std::nullopt;
            }

            std::string Key = Trim(Line.substr(0, EqualPos));
            std::string Value = Trim(Line.substr(EqualPos + 1));

            if (Key == "BackupPath")
            {
                Record.BackupPath = Value;
            }
            else if (Key == "SavePath")
            {
                Record.SavePath = Value;
            }
            else if (Key == "CloudTarget")
            {
                Record.CloudTarget = Value;
            }
            else if (Key == "Timestamp")
            {
                Record.Timestamp = Value;
            }
            else if (Key == "Platform")
            {
                Record.Platform = Value;
            }
            else
            {
                Log.Info("[BackupManifest] " + ManifestPath.string() + ": ignoring unknown key '" + Key + "'");
            }
        }

        if (Record.SavePath.empty() || Record.Timestamp.empty())
        {
            Log.Error("[BackupManifest] Incomplete manifest: " + ManifestPath.string());
            return std::nullopt;
        }

        std::chrono::system_clock::time_point Parsed;
        if (!ParseLocalTime(Record.Timestamp, "%Y-%m-%d %H:%M:%S", Parsed))
        {
            Log.Error("[BackupManifest] Bad Timestamp '" + Record.Timestamp + "' in " + ManifestPath.string());
            return std::nullopt;
        }

        // The folder may have been moved since it was written, where it is now wins
        Record.BackupPath = BackupDir;
        return Record;
    }

    std::vector<BackupRecord> ListAll(const FS::path& BackupRoot)
    {
        std::vector<BackupRecord> Records;
        std::error_code ec;

        if (!FS::is_directory(BackupRoot, ec))
        {
            return Records;
        }

        for (const auto& Entry : FS::directory_iterator(BackupRoot, ec))
        {
            if (!Entry.is_directory(ec))
            {
                continue;
            }

            std::optional<BackupRecord> Record = Read(Entry.path());
            if (Record)
            {
                Records.push_back(std::move(*Record));
            }
        }

        if (ec)
        {
            Log.Error("[BackupManifest] Failed to scan backup root " + BackupRoot.string() + ": " + ec.message());
        }

        std::sort(Records.begin(), Records.end(), IsNewer);
        return Records;
    }

    std::optional<BackupRecord> FindLatest(const FS::path& BackupRoot, const FS::path& SavePath)
    {
        const FS::path Wanted = SavePath.lexically_normal();

        for (const auto& Record : ListAll(BackupRoot))
        {
            if (Record.SavePath.lexically_normal() == Wanted)
            {
                return Record;
            }
        }
        return std::nullopt;
    }
}
