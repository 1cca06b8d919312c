#pragma once

#include <string>

#include "AppConfig.hpp"
#include "ConfigParser.hpp"
#include "Commands.hpp"

// One invocation of the console tool: read the config, run exactly one Mode, report.
class ControlFlow
{
public:
    explicit ControlFlow(std::string ConfigFile);

    int Run();

private:
    std::string ConfigFile;
    AppConfig Config;
    ConfigParser Parser;

    bool ResolvePaths();
    int RunStatus(LinkStrategy& Strategy);
    int Report(const OperationResult& Result);
    void LogConfiguration();
};
