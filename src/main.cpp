#include <exception>
#include <iostream>

#include "ControlFlow.hpp"
#include "Logger.hpp"

int main(int argc, char* argv[])
{
    std::string ConfigFile = AppConfig::Defaults().ConfigFile;
    if (argc > 1)
    {
        ConfigFile = argv[1];
    }

    try
    {
        ControlFlow Flow(ConfigFile);
        return Flow.Run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "[EXCEPTION] " << e.what() << "\n";
        Log.Error(std::string("[EXCEPTION] ") + e.what());
        return 1;
    }
}
