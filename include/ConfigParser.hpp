#pragma once

#include <string>
#include <vector>

#include "AppConfig.hpp"

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath, AppConfig& Config);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    void Reset();

    static bool IsAbsolutePath(const std::string& Path);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);

    bool ParseYesNo(const std::string& Value, int LineNumber, bool& Out);

    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
