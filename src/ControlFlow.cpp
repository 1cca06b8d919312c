#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "ControlFlow.hpp"
#include "BackupManifest.hpp"
#include "FileOperations.hpp"
#include "Logger.hpp"
#include "SavePathDetector.hpp"

namespace FS = std::filesystem;

ControlFlow::ControlFlow(std::string ConfigFile)
    : ConfigFile(std::move(ConfigFile)), Config(AppConfig::Defaults())
{
}

int ControlFlow::Run()
{
    std::cout << "Starting CrossSave \n";

    bool Parsed = Parser.Parse(ConfigFile, Config);

    if (!Log.Init(Config.LogDir))
    {
        std::cerr << "Logging disabled, could not open a log file in " << Config.LogDir << "\n";
    }

    if (!Parsed)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Config Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        Log.Error("Check Errors and Fix Them, Exiting");
        return 1;
    }
    Log.Info("Config Parsed Successfully.");
    std::cout << "Config Parsed Successfully.\n";

    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Config Info: " << Info << "\n";
        Log.Info(Info);
    }

    Log.CleanupOldLogs(Config.LogDir, Config.MaxLogFiles);

    if (!ResolvePaths())
    {
        return 1;
    }
    LogConfiguration();

    std::unique_ptr<LinkStrategy> Strategy = CreateLinkStrategy();
    Log.Info("Platform: " + GetPlatformName() + " | Link type: " + Strategy->Name());

    if (Config.Mode == "Status")
    {
        return RunStatus(*Strategy);
    }

    CommandSession Session(Config, *Strategy, [](const std::string& Line)
    {
        std::cout << Line << "\n";
    });

    OperationResult Result;
    if (Config.Mode == "Migrate")
    {
        Result = Session.Migrate(Config.SavePath, Config.GetCloudTarget());
    }
    else if (Config.Mode == "Link")
    {
        Result = Session.Link(Config.SavePath, Config.GetCloudTarget());
    }
    else
    {
        std::optional<FS::path> Backup;
        if (!Config.BackupPath.empty())
        {
            Backup = Config.BackupPath;
        }
        Result = Session.Restore(Config.SavePath, Backup);
    }

    return Report(Result);
}

bool ControlFlow::ResolvePaths()
{
    if (Config.SavePath.empty())
    {
        std::optional<FS::path> Detected = SavePathDetector::FindSavePath();
        if (!Detected)
        {
            std::cerr << "Config Error: No SavePath provided and none detected.\n" << SavePathDetector::GetPlatformHint() << "\n";
            Log.Error("No SavePath provided and none detected. " + SavePathDetector::GetPlatformHint());
            return false;
        }
        Config.SavePath = *Detected;
        std::cout << "Detected Saves folder: " << Config.SavePath.string() << "\n";
        Log.Info("Detected Saves folder: " + Config.SavePath.string());
    }

    // CloudRoot and BackupRoot only hold the real folders, so they are resolved fully
    auto Resolve = [](const FS::path& Path)
    {
        FS::path Normal = FileOperations::Normalize(Path);
        if (Normal.empty())
        {
            return Normal;
        }
        std::error_code ec;
        FS::path Resolved = FS::weakly_canonical(Normal, ec);
        if (ec)
        {
            throw ValidationError("ResolvePaths", "Cannot resolve path: " + Normal.string() + ": " + ec.message());
        }
        return Resolved;
    };

    try
    {
        Config.SavePath = FileOperations::Normalize(Config.SavePath);
        Config.CloudRoot = Resolve(Config.CloudRoot);
        Config.BackupRoot = Resolve(Config.BackupRoot);
        Config.BackupPath = FileOperations::Normalize(Config.BackupPath);
    }
    catch (const ValidationError& e)
    {
        std::cerr << "Config Error: " << e.what() << "\n";
        Log.Error(std::string("[ControlFlow] ") + e.what());
        return false;
    }
    return true;
}

int ControlFlow::RunStatus(LinkStrategy& Strategy)
{
    std::cout << "Platform: " << GetPlatformName() << " (" << Strategy.Name() << ")\n";
    std::cout << "Game Saves: " << Config.SavePath.string() << "\n";

    if (Strategy.IsLink(Config.SavePath))
    {
        std::cout << "  State: linked -> " << Strategy.LinkTarget(Config.SavePath).string() << "\n";
    }
    else if (FileOperations::Exists(Config.SavePath))
    {
        std::cout << "  State: real folder\n";
    }
    else
    {
        std::cout << "  State: missing\n";
    }

    if (!Config.CloudRoot.empty())
    {
        std::cout << "Cloud Saves: " << Config.GetCloudTarget().string() << (FileOperations::Exists(Config.GetCloudTarget()) ? "" : " (not created yet)") << "\n";
    }

    std::cout << "Backups in " << Config.BackupRoot.string() << ":\n";
    int Count = 0;
    for (const auto& Record : BackupManifest::ListAll(Config.BackupRoot))
    {
        if (Record.SavePath.lexically_normal() != Config.SavePath.lexically_normal())
        {
            continue;
        }
        std::cout << "  " << Record.Timestamp << "  " << Record.BackupPath.string() << "\n";
        Count++;
    }
    if (Count == 0)
    {
        std::cout << "  (none)\n";
    }

    Log.Info("[Status] Reported state for " + Config.SavePath.string());
    return 0;
}

int ControlFlow::Report(const OperationResult& Result)
{
    if (Result.Success)
    {
        std::cout << Result.Message << "\n";
        if (Result.BackupPath)
        {
            std::cout << "Backup: " << Result.BackupPath->string() << "\n";
        }
        Log.Info(Config.Mode + " finished: " + Result.Message);
    }
    else
    {
        std::cerr << "[" << ErrorKindToString(Result.Error) << "] " << Result.Message << "\n";
        if (Result.BackupPath)
        {
            std::cerr << "Your saves are safe in the backup: " << Result.BackupPath->string() << "\n";
        }
        Log.Error(Config.Mode + " failed at " + Result.Stage + ": " + Result.Message);
    }

    if (!Log.CurrentLogFilePath.empty())
    {
        std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    }
    return Result.Success ? 0 : 1;
}

void ControlFlow::LogConfiguration()
{
    Log.Info("Mode: " + Config.Mode);
    Log.Info("Game Saves:");
    Log.Info("  " + Config.SavePath.string());
    if (!Config.CloudRoot.empty())
    {
        Log.Info("Cloud Saves:");
        Log.Info("  " + Config.GetCloudTarget().string());
    }
    Log.Info("Backup Root:");
    Log.Info("  " + Config.BackupRoot.string());
    if (!Config.BackupPath.empty())
    {
        Log.Info("Backup To Restore:");
        Log.Info("  " + Config.BackupPath.string());
    }
}
