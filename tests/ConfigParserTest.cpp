#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "AppConfig.hpp"
#include "ConfigParser.hpp"
#include "TestHelpers.hpp"

namespace FS = std::filesystem;

static bool HasMessage(const std::vector<std::string>& Messages, const std::string& Needle)
{
    for (const auto& Message : Messages)
    {
        if (Message.find(Needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

int main()
{
    std::cout << "[Test] Starting ConfigParser Test..." << std::endl;

    FS::path Root = MakeTestRoot("config_parser");
    const std::string Abs = Root.string();

    std::cout << "[Test] Valid config..." << std::endl;
    {
        FS::path File = Root / "valid.cfg";
        WriteFile(File,
            "# CrossSave settings\n"
            "\n"
            "  Mode = Link  \n"
            "SavePath = " + Abs + "/Game/Saves\n"
            "CloudRoot=" + Abs + "/Cloud\n"
            "AppName = MyFarm\n"
            "MaxLogFiles = 3\n"
            "OverwriteExisting = NO\n"
            "LogDir = " + Abs + "/logs\n");

        AppConfig Config = AppConfig::Defaults();
        ConfigParser Parser;
        bool Ok = Parser.Parse(File.string(), Config);
        assert(Ok);
        assert(Parser.GetErrors().empty());
        assert(Config.Mode == "Link");
        assert(Config.SavePath == FS::path(Abs + "/Game/Saves"));
        assert(Config.CloudRoot == FS::path(Abs + "/Cloud"));
        assert(Config.GetCloudTarget() == FS::path(Abs + "/Cloud") / "Saves");
        assert(Config.AppName == "MyFarm");
        assert(Config.BackupRoot == GetHomeDirectory() / "MyFarm_Backups");
        assert(Config.MaxLogFiles == 3);
        assert(!Config.OverwriteExisting);
        assert(Config.LogDir == Abs + "/logs");
        assert(HasMessage(Parser.GetInfos(), "Mode set to 'Link'"));
    }

    std::cout << "[Test] Defaults..." << std::endl;
    {
        AppConfig Config = AppConfig::Defaults();
        assert(Config.Mode == "Status");
        assert(Config.BackupRoot == GetHomeDirectory() / "StardewValleyCrossSaves_Backups");
        assert(Config.GetCloudTarget().empty());
        assert(Config.OverwriteExisting);
    }

    std::cout << "[Test] Explicit BackupRoot and home shorthand..." << std::endl;
    {
        FS::path File = Root / "backup_root.cfg";
        WriteFile(File, "Mode = Restore\nSavePath = ~/Saves\nBackupRoot = " + Abs + "/MyBackups\nAppName = Other\n");

        AppConfig Config = AppConfig::Defaults();
        ConfigParser Parser;
        assert(Parser.Parse(File.string(), Config));
        assert(Config.BackupRoot == FS::path(Abs + "/MyBackups"));
        assert(Config.SavePath == FS::path("~/Saves"));
    }

    std::cout << "[Test] Invalid entries..." << std::endl;
    {
        FS::path File = Root / "invalid.cfg";
        WriteFile(File,
            "Mode = Teleport\n"
            "SavePath = relative/Saves\n"
            "Colour = Green\n"
            "MaxLogFiles = lots\n"
            "MaxLogFiles = 0\n"
            "OverwriteExisting = maybe\n"
            "just some words\n"
            "CloudRoot = " + Abs + "/a\n"
            "CloudRoot = " + Abs + "/b\n"
            "AppName = bad/name\n");

        AppConfig Config = AppConfig::Defaults();
        ConfigParser Parser;
        assert(!Parser.Parse(File.string(), Config));

        const auto& Errors = Parser.GetErrors();
        assert(HasMessage(Errors, "Invalid Mode"));
        assert(HasMessage(Errors, "SavePath path is not absolute"));
        assert(HasMessage(Errors, "Unknown key 'Colour'"));
        assert(HasMessage(Errors, "Invalid number for MaxLogFiles"));
        assert(HasMessage(Errors, "MaxLogFiles must be between"));
        assert(HasMessage(Errors, "Use 'YES' or 'NO'"));
        assert(HasMessage(Errors, "No '=' found"));
        assert(HasMessage(Errors, "Multiple CloudRoot entries"));
        assert(HasMessage(Errors, "AppName must not contain"));
        assert(Config.CloudRoot == FS::path(Abs + "/a"));

        Parser.Reset();
        assert(Parser.GetErrors().empty());
    }

    std::cout << "[Test] Link needs a CloudRoot..." << std::endl;
    {
        FS::path File = Root / "no_cloud.cfg";
        WriteFile(File, "Mode = Link\n");

        AppConfig Config = AppConfig::Defaults();
        ConfigParser Parser;
        assert(!Parser.Parse(File.string(), Config));
        assert(HasMessage(Parser.GetErrors(), "No CloudRoot provided"));
    }

    std::cout << "[Test] Missing config file..." << std::endl;
    {
        AppConfig Config = AppConfig::Defaults();
        ConfigParser Parser;
        assert(!Parser.Parse((Root / "missing.cfg").string(), Config));
        assert(HasMessage(Parser.GetErrors(), "does not exist"));
    }

    FS::remove_all(Root);
    std::cout << "[PASS] ConfigParser Test." << std::endl;
    return 0;
}
