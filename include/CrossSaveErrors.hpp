#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind
{
    None,
    Validation,
    AlreadyLinked,
    Copy,
    Backup,
    Removal,
    LinkCreation,
    NoBackupAvailable,
    Unknown
};

std::string ErrorKindToString(ErrorKind Kind);

// Base of every failure raised by the facade, the link strategies and the workflows.
// Stage names the workflow step ("CopyToCloud", "CreateLink", ...) that was running.
class CrossSaveError : public std::runtime_error
{
public:
    CrossSaveError(ErrorKind Kind, const std::string& Stage, const std::string& Message);

    ErrorKind GetKind() const { return Kind; }
    const std::string& GetStage() const { return Stage; }

private:
    ErrorKind Kind;
    std::string Stage;
};

class ValidationError : public CrossSaveError
{
public:
    ValidationError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::Validation, Stage, Message) {}
};

class AlreadyLinkedError : public CrossSaveError
{
public:
    AlreadyLinkedError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::AlreadyLinked, Stage, Message) {}
};

class CopyError : public CrossSaveError
{
public:
    CopyError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::Copy, Stage, Message) {}
};

class BackupError : public CrossSaveError
{
public:
    BackupError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::Backup, Stage, Message) {}
};

class RemovalError : public CrossSaveError
{
public:
    RemovalError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::Removal, Stage, Message) {}
};

class LinkCreationError : public CrossSaveError
{
public:
    LinkCreationError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::LinkCreation, Stage, Message) {}
};

class NoBackupAvailableError : public CrossSaveError
{
public:
    NoBackupAvailableError(const std::string& Stage, const std::string& Message)
        : CrossSaveError(ErrorKind::NoBackupAvailable, Stage, Message) {}
};
