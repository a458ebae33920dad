#include "InstallTypes.hpp"

namespace installer
{

std::string toString(OsKind os)
{
    switch (os)
    {
    case OsKind::Linux:
        return "linux";
    case OsKind::MacOS:
        return "macos";
    case OsKind::Windows:
        return "windows";
    }
    return "unknown";
}

std::string toString(ArchKind arch)
{
    switch (arch)
    {
    case ArchKind::X86_64:
        return "x86_64";
    case ArchKind::Arm64:
        return "arm64";
    }
    return "unknown";
}

const char* toString(SourceKind kind)
{
    switch (kind)
    {
    case SourceKind::Primary:
        return "primary";
    case SourceKind::Mirror:
        return "mirror";
    }
    return "unknown";
}

const char* toString(AttemptOutcome outcome)
{
    switch (outcome)
    {
    case AttemptOutcome::Success:
        return "success";
    case AttemptOutcome::TransientFailure:
        return "transient failure";
    case AttemptOutcome::RejectedSmallFile:
        return "rejected (file too small)";
    case AttemptOutcome::LocalFailure:
        return "local file error";
    }
    return "unknown";
}

const char* toString(DownloadState state)
{
    switch (state)
    {
    case DownloadState::Idle:
        return "idle";
    case DownloadState::Attempting:
        return "attempting";
    case DownloadState::Retrying:
        return "retrying";
    case DownloadState::Success:
        return "success";
    case DownloadState::ExhaustedPrimary:
        return "exhausted primary";
    case DownloadState::ExhaustedAll:
        return "exhausted all sources";
    case DownloadState::LocalFailure:
        return "local filesystem failure";
    }
    return "unknown";
}

} // namespace installer
