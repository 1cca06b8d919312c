#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Where the game keeps its Saves folder on each platform
namespace SavePathDetector
{
    std::vector<std::filesystem::path> GetCandidateSavePaths();
    std::optional<std::filesystem::path> FindSavePath();
    std::string GetPlatformHint();
}
