#include "SavePathDetector.hpp"
#include "AppConfig.hpp"

#include <cstdlib>

namespace FS = std::filesystem;

namespace SavePathDetector
{
    std::vector<FS::path> GetCandidateSavePaths()
    {
        std::vector<FS::path> Candidates;

#if defined(_WIN32)
        const char* AppData = std::getenv("APPDATA");
        if (AppData != nullptr && *AppData != '\0')
        {
            Candidates.push_back(FS::path(AppData) / "StardewValley" / "Saves");
        }
#elif defined(__APPLE__)
        Candidates.push_back(GetHomeDirectory() / "Library" / "Application Support" / "StardewValley" / "Saves");
        Candidates.push_back(GetHomeDirectory() / ".config" / "StardewValley" / "Saves");
#else
        Candidates.push_back(GetHomeDirectory() / ".config" / "StardewValley" / "Saves");
#endif

        return Candidates;
    }

    std::optional<FS::path> FindSavePath()
    {
        for (const auto& Candidate : GetCandidateSavePaths())
        {
            std::error_code ec;
            if (FS::is_directory(Candidate, ec))
            {
                return Candidate;
            }
        }
        return std::nullopt;
    }

    std::string GetPlatformHint()
    {
#if defined(_WIN32)
        return "Windows: typical Saves = %AppData%\\StardewValley\\Saves";
#elif defined(__APPLE__)
        return "macOS: typical Saves = ~/Library/Application Support/StardewValley/Saves";
#else
        return "Linux: typical Saves = ~/.config/StardewValley/Saves";
#endif
    }
}
