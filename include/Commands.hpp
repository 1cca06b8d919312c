#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "AppConfig.hpp"
#include "BackupManifest.hpp"
#include "CrossSaveErrors.hpp"
#include "LinkStrategy.hpp"

// Receives one human-readable, tagged line per workflow step ("[LINK] ...", "[OK] ...")
using LogSink = std::function<void(const std::string&)>;

struct OperationResult
{
    bool Success = false;
    std::string Message;
    std::optional<std::filesystem::path> BackupPath;
    ErrorKind Error = ErrorKind::None;
    std::string Stage;

    static OperationResult Ok(const std::string& Message, std::optional<std::filesystem::path> BackupPath = std::nullopt);
    static OperationResult Fail(ErrorKind Error, const std::string& Stage, const std::string& Message);
};

// One user action. Execute() never throws: every failure becomes a failed OperationResult.
// Steps already completed are never rolled back, the step order keeps the data recoverable.
class Command
{
public:
    explicit Command(LogSink Sink);
    virtual ~Command() = default;

    virtual OperationResult Execute() = 0;
    virtual bool CanUndo() const;
    virtual OperationResult Undo();

protected:
    void Emit(const std::string& Tag, const std::string& Message);
    void EnterStage(const std::string& Stage);
    OperationResult Guard(const std::function<OperationResult()>& Body);

    LogSink Sink;
    std::string CurrentStage;

private:
    OperationResult FailFromException(ErrorKind Kind, const std::string& What);
};

// Start -> EnsureCloudDir -> CopyContents -> Done
class MigrateCommand : public Command
{
public:
    MigrateCommand(std::filesystem::path SaveDir, std::filesystem::path CloudTarget, LogSink Sink, bool Overwrite = true);

    OperationResult Execute() override;

private:
    std::filesystem::path SaveDir;
    std::filesystem::path CloudTarget;
    bool Overwrite;
};

// Start -> CheckNotAlreadyLinked -> EnsureCloudDir -> CopyToCloud -> BackupLocal -> RemoveLocal -> CreateLink -> Done
// The local folder is only removed once its contents exist both in the cloud and in a backup.
class LinkCommand : public Command
{
public:
    LinkCommand(std::filesystem::path SaveDir, std::filesystem::path CloudTarget, std::filesystem::path BackupRoot, LinkStrategy& Strategy, LogSink Sink);

    OperationResult Execute() override;
    bool CanUndo() const override;
    OperationResult Undo() override;

    const std::optional<std::filesystem::path>& GetBackupPath() const { return BackupPath; }

private:
    std::filesystem::path SaveDir;
    std::filesystem::path CloudTarget;
    std::filesystem::path BackupRoot;
    LinkStrategy& Strategy;
    std::optional<std::filesystem::path> BackupPath;
};

// Start -> ValidateBackupPresent -> RemoveCurrent -> CopyBackupBack -> Done
class RestoreCommand : public Command
{
public:
    RestoreCommand(std::filesystem::path SaveDir, std::optional<std::filesystem::path> BackupPath, LinkStrategy& Strategy, LogSink Sink);

    OperationResult Execute() override;

private:
    std::filesystem::path SaveDir;
    std::optional<std::filesystem::path> BackupPath;
    LinkStrategy& Strategy;
};

// Runs workflows for one process lifetime and remembers the most recent backup.
// Not thread safe: the caller must serialize actions on the same save folder.
class CommandSession
{
public:
    CommandSession(const AppConfig& Config, LinkStrategy& Strategy, LogSink Sink);

    OperationResult Migrate(const std::filesystem::path& SaveDir, const std::filesystem::path& CloudTarget);
    OperationResult Link(const std::filesystem::path& SaveDir, const std::filesystem::path& CloudTarget);
    OperationResult Restore(const std::filesystem::path& SaveDir, std::optional<std::filesystem::path> Backup = std::nullopt);

    std::optional<BackupRecord> ReconstructBackup(const std::filesystem::path& SaveDir) const;
    const std::optional<std::filesystem::path>& GetLastBackup() const { return LastBackup; }

private:
    const AppConfig& Config;
    LinkStrategy& Strategy;
    LogSink Sink;
    std::optional<std::filesystem::path> LastBackup;
};
