#include "Commands.hpp"
#include "FileOperations.hpp"
#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <utility>

namespace FS = std::filesystem;

namespace
{
    // Kind reported for errors that did not come from our own taxonomy
    ErrorKind StageErrorKind(const std::string& Stage)
    {
        if (Stage == "EnsureCloudDir" || Stage == "CopyContents" || Stage == "CopyToCloud" || Stage == "CopyBackupBack")
            return ErrorKind::Copy;
        if (Stage == "BackupLocal")
            return ErrorKind::Backup;
        if (Stage == "RemoveLocal" || Stage == "RemoveCurrent")
            return ErrorKind::Removal;
        if (Stage == "CreateLink")
            return ErrorKind::LinkCreation;
        if (Stage == "ValidateBackupPresent")
            return ErrorKind::NoBackupAvailable;
        return ErrorKind::Unknown;
    }

    void ValidateSaveDir(const FS::path& SaveDir)
    {
        if (SaveDir.empty())
        {
            throw ValidationError("Start", "No game Saves folder given.");
        }

        std::error_code ec;
        if (!FS::exists(SaveDir, ec))
        {
            throw ValidationError("Start", "The game Saves folder does not exist: " + SaveDir.string());
        }
        if (!FS::is_directory(SaveDir, ec))
        {
            throw ValidationError("Start", "The game Saves folder is not a directory: " + SaveDir.string());
        }
    }

    void ValidateCloudTarget(const FS::path& SaveDir, const FS::path& CloudTarget)
    {
        if (CloudTarget.empty())
        {
            throw ValidationError("Start", "No cloud target given.");
        }

        std::error_code ec;
        if (!FS::is_directory(CloudTarget.parent_path(), ec))
        {
            throw ValidationError("Start", "The cloud folder does not exist: " + CloudTarget.parent_path().string());
        }
        // Compared on the real folders, a linked cloud root may point back into the game folder
        if (FileOperations::IsPhysicallyInside(SaveDir, CloudTarget))
        {
            throw ValidationError("Start", "The cloud target " + CloudTarget.string() + " is the game Saves folder or inside it.");
        }
        if (FileOperations::IsPhysicallyInside(CloudTarget, SaveDir))
        {
            throw ValidationError("Start", "The game Saves folder " + SaveDir.string() + " is inside the cloud target.");
        }
    }

    // The backup must survive RemoveLocal and must not grow inside the folder it copies
    void ValidateBackupRoot(const FS::path& SaveDir, const FS::path& BackupRoot)
    {
        if (BackupRoot.empty())
        {
            throw ValidationError("Start", "No backup folder given.");
        }
        if (FileOperations::IsPhysicallyInside(SaveDir, BackupRoot))
        {
            throw ValidationError("Start", "The backup folder " + BackupRoot.string() + " is the game Saves folder or inside it.");
        }
    }
}

OperationResult OperationResult::Ok(const std::string& Message, std::optional<FS::path> BackupPath)
{
    OperationResult Result;
    Result.Success = true;
    Result.Message = Message;
    Result.BackupPath = std::move(BackupPath);
    Result.Stage = "Done";
    return Result;
}

OperationResult OperationResult::Fail(ErrorKind Error, const std::string& Stage, const std::string& Message)
{
    OperationResult Result;
    Result.Success = false;
    Result.Message = Message;
    Result.Error = Error;
    Result.Stage = Stage;
    return Result;
}

Command::Command(LogSink Sink)
    : Sink(std::move(Sink))
{
}

bool Command::CanUndo() const
{
    return false;
}

OperationResult Command::Undo()
{
    return OperationResult::Fail(ErrorKind::NoBackupAvailable, "Undo", "This operation cannot be undone.");
}

void Command::Emit(const std::string& Tag, const std::string& Message)
{
    std::string Line = "[" + Tag + "] " + Message;

    if (Tag == "ERROR")
    {
        Log.Error(Line);
    }
    else
    {
        Log.Info(Line);
    }

    if (Sink)
    {
        Sink(Line);
    }
}

void Command::EnterStage(const std::string& Stage)
{
    CurrentStage = Stage;
}

OperationResult Command::FailFromException(ErrorKind Kind, const std::string& What)
{
    std::string Message = CurrentStage + " failed: " + What;
    Emit("ERROR", Message);
    return OperationResult::Fail(Kind, CurrentStage, Message);
}

OperationResult Command::Guard(const std::function<OperationResult()>& Body)
{
    CurrentStage = "Start";
    try
    {
        return Body();
    }
    catch (const CrossSaveError& e)
    {
        Log.Error("[Command] " + ErrorKindToString(e.GetKind()) + " raised by " + e.GetStage());
        return FailFromException(e.GetKind(), e.what());
    }
    catch (const FS::filesystem_error& e)
    {
        return FailFromException(StageErrorKind(CurrentStage), e.what());
    }
    catch (const std::exception& e)
    {
        return FailFromException(StageErrorKind(CurrentStage), e.what());
    }
}

MigrateCommand::MigrateCommand(FS::path SaveDir, FS::path CloudTarget, LogSink Sink, bool Overwrite)
    : Command(std::move(Sink)), SaveDir(std::move(SaveDir)), CloudTarget(std::move(CloudTarget)), Overwrite(Overwrite)
{
}

OperationResult MigrateCommand::Execute()
{
    return Guard([this]()
    {
        Emit("MIGRATE", "Starting migration to cloud...");
        Emit("MIGRATE", "Game Saves: " + SaveDir.string());
        Emit("MIGRATE", "Cloud Saves: " + CloudTarget.string());
        ValidateSaveDir(SaveDir);
        ValidateCloudTarget(SaveDir, CloudTarget);

        EnterStage("EnsureCloudDir");
        FileOperations::EnsureDirectory(CloudTarget);

        EnterStage("CopyContents");
        CopyStats Stats = FileOperations::CopyContents(SaveDir, CloudTarget, Overwrite);
        Emit("INFO", "Copied " + std::to_string(Stats.Files) + " file(s) and " + std::to_string(Stats.Directories) + " folder(s).");
        if (Stats.Skipped > 0)
        {
            Emit("INFO", "Kept " + std::to_string(Stats.Skipped) + " existing cloud entr(ies) untouched.");
        }

        EnterStage("Done");
        Emit("OK", "Migration complete! Saves copied to cloud.");
        return OperationResult::Ok("Saves migrated to cloud successfully!");
    });
}

LinkCommand::LinkCommand(FS::path SaveDir, FS::path CloudTarget, FS::path BackupRoot, LinkStrategy& Strategy, LogSink Sink)
    : Command(std::move(Sink)), SaveDir(std::move(SaveDir)), CloudTarget(std::move(CloudTarget)), BackupRoot(std::move(BackupRoot)), Strategy(Strategy)
{
}

OperationResult LinkCommand::Execute()
{
    OperationResult Result = Guard([this]()
    {
        Emit("LINK", "Starting link setup...");
        Emit("LINK", "Game Saves: " + SaveDir.string());
        Emit("LINK", "Cloud Saves: " + CloudTarget.string());
        if (SaveDir.empty())
        {
            throw ValidationError("Start", "No game Saves folder given.");
        }

        // A second link would point at a link, or at itself
        EnterStage("CheckNotAlreadyLinked");
        if (Strategy.IsLink(SaveDir))
        {
            throw AlreadyLinkedError("CheckNotAlreadyLinked", "The game Saves folder is already a link/junction (" + SaveDir.string() + "). Use Restore first.");
        }

        EnterStage("Start");
        ValidateSaveDir(SaveDir);
        ValidateCloudTarget(SaveDir, CloudTarget);
        ValidateBackupRoot(SaveDir, BackupRoot);

        EnterStage("EnsureCloudDir");
        Emit("INFO", "Preparing cloud Saves folder.");
        FileOperations::EnsureDirectory(CloudTarget);

        EnterStage("CopyToCloud");
        Emit("LINK", "Copying saves to cloud folder...");
        CopyStats Stats = FileOperations::CopyContents(SaveDir, CloudTarget, true);
        Emit("OK", "Saves copied to cloud (" + std::to_string(Stats.Files) + " file(s)).");

        EnterStage("BackupLocal");
        Emit("LINK", "Creating backup...");
        FS::path NewBackup = FileOperations::BackupFolder(SaveDir, BackupRoot);
        BackupPath = NewBackup;
        Emit("BACKUP", "Created: " + NewBackup.string());

        BackupRecord Record;
        Record.BackupPath = NewBackup;
        Record.SavePath = SaveDir;
        Record.CloudTarget = CloudTarget;
        Record.Timestamp = FormatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
        Record.Platform = GetPlatformName();
        if (!BackupManifest::Write(Record))
        {
            // The backup itself is complete, only later sessions lose the ability to find it
            Emit("BACKUP", "Could not write backup manifest, restore this backup manually if the session ends: " + NewBackup.string());
        }

        // Only now does the data exist in two other places
        EnterStage("RemoveLocal");
        Emit("LINK", "Removing original saves folder...");
        FileOperations::RemovePath(SaveDir);
        Emit("INFO", "Removed original Saves folder (after backup and migration).");

        EnterStage("CreateLink");
        Emit("LINK", "Creating " + Strategy.Name() + "...");
        Strategy.CreateLink(SaveDir, CloudTarget);

        EnterStage("Done");
        Emit("OK", "Link created successfully! Saves are now synced via cloud.");
        return OperationResult::Ok("Link created successfully!", BackupPath);
    });

    // A failure after BackupLocal still reports where the backup went
    if (!Result.Success && BackupPath)
    {
        Result.BackupPath = BackupPath;
    }
    return Result;
}

bool LinkCommand::CanUndo() const
{
    std::error_code ec;
    return BackupPath.has_value() && FS::is_directory(*BackupPath, ec);
}

OperationResult LinkCommand::Undo()
{
    if (!CanUndo())
    {
        return OperationResult::Fail(ErrorKind::NoBackupAvailable, "Undo", "No backup available to undo the link.");
    }

    Emit("UNDO", "Restoring from backup: " + BackupPath->string());
    RestoreCommand Restore(SaveDir, BackupPath, Strategy, Sink);
    return Restore.Execute();
}

RestoreCommand::RestoreCommand(FS::path SaveDir, std::optional<FS::path> BackupPath, LinkStrategy& Strategy, LogSink Sink)
    : Command(std::move(Sink)), SaveDir(std::move(SaveDir)), BackupPath(std::move(BackupPath)), Strategy(Strategy)
{
}

OperationResult RestoreCommand::Execute()
{
    return Guard([this]()
    {
        if (SaveDir.empty())
        {
            throw ValidationError("Start", "No game Saves folder given.");
        }

        EnterStage("ValidateBackupPresent");
        std::error_code ec;
        if (!BackupPath || BackupPath->empty())
        {
            throw NoBackupAvailableError("ValidateBackupPresent", "No backup available. Backup path not set.");
        }
        if (!FS::is_directory(*BackupPath, ec))
        {
            throw NoBackupAvailableError("ValidateBackupPresent", "No backup available. Backup folder does not exist: " + BackupPath->string());
        }
        // A linked SaveDir is removed as a link, only a real folder takes its contents with it
        bool BackupInside = Strategy.IsLink(SaveDir) ? FileOperations::IsInside(SaveDir, *BackupPath) : FileOperations::IsPhysicallyInside(SaveDir, *BackupPath);
        if (BackupInside)
        {
            throw ValidationError("ValidateBackupPresent", "The backup " + BackupPath->string() + " is inside the game Saves folder.");
        }

        EnterStage("RemoveCurrent");
        if (Strategy.IsLink(SaveDir))
        {
            Emit("RESTORE", "Removing link/junction...");
            Strategy.RemoveLink(SaveDir);
        }
        else if (FileOperations::Exists(SaveDir))
        {
            Emit("RESTORE", "Removing current Saves folder...");
            FileOperations::RemovePath(SaveDir);
        }

        EnterStage("CopyBackupBack");
        Emit("RESTORE", "Restoring from " + BackupPath->string() + "...");
        FileOperations::CopyContents(*BackupPath, SaveDir, true);

        FS::path CopiedManifest = SaveDir / BackupManifest::FileName;
        if (FileOperations::Exists(CopiedManifest))
        {
            FileOperations::RemovePath(CopiedManifest);
        }

        EnterStage("Done");
        Emit("OK", "Restore complete!");
        return OperationResult::Ok("Backup restored successfully!", BackupPath);
    });
}

CommandSession::CommandSession(const AppConfig& Config, LinkStrategy& Strategy, LogSink Sink)
    : Config(Config), Strategy(Strategy), Sink(std::move(Sink))
{
}

OperationResult CommandSession::Migrate(const FS::path& SaveDir, const FS::path& CloudTarget)
{
    MigrateCommand Cmd(SaveDir, CloudTarget, Sink, Config.OverwriteExisting);
    return Cmd.Execute();
}

OperationResult CommandSession::Link(const FS::path& SaveDir, const FS::path& CloudTarget)
{
    LinkCommand Cmd(SaveDir, CloudTarget, Config.BackupRoot, Strategy, Sink);
    OperationResult Result = Cmd.Execute();
    if (Result.Success && Result.BackupPath)
    {
        LastBackup = Result.BackupPath;
    }
    return Result;
}

OperationResult CommandSession::Restore(const FS::path& SaveDir, std::optional<FS::path> Backup)
{
    if (!Backup)
    {
        Backup = LastBackup;
    }

    if (!Backup)
    {
        std::optional<BackupRecord> Record = ReconstructBackup(SaveDir);
        if (Record)
        {
            Backup = Record->BackupPath;
            if (Sink)
            {
                Sink("[INFO] Found backup from " + Record->Timestamp + ": " + Record->BackupPath.string());
            }
            Log.Info("[CommandSession] Backup reconstructed from manifest: " + Record->BackupPath.string());
        }
    }

    RestoreCommand Cmd(SaveDir, Backup, Strategy, Sink);
    return Cmd.Execute();
}

std::optional<BackupRecord> CommandSession::ReconstructBackup(const FS::path& SaveDir) const
{
    try
    {
        return BackupManifest::FindLatest(Config.BackupRoot, SaveDir);
    }
    catch (const FS::filesystem_error& e)
    {
        Log.Error(std::string("[CommandSession] Failed to scan backups: ") + e.what());
        return std::nullopt;
    }
}
