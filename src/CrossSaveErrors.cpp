#include "CrossSaveErrors.hpp"

CrossSaveError::CrossSaveError(ErrorKind Kind, const std::string& Stage, const std::string& Message)
    : std::runtime_error(Message), Kind(Kind), Stage(Stage)
{
}

std::string ErrorKindToString(ErrorKind Kind)
{
    switch (Kind)
    {
    case ErrorKind::None:              return "None";
    case ErrorKind::Validation:        return "ValidationError";
    case ErrorKind::AlreadyLinked:     return "AlreadyLinkedError";
    case ErrorKind::Copy:              return "CopyError";
    case ErrorKind::Backup:            return "BackupError";
    case ErrorKind::Removal:           return "RemovalError";
    case ErrorKind::LinkCreation:      return "LinkCreationError";
    case ErrorKind::NoBackupAvailable: return "NoBackupAvailableError";
    default:                           return "UnknownError";
    }
}
