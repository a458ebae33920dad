#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace installer
{

enum class OsKind
{
    Linux,
    MacOS,
    Windows
};

enum class ArchKind
{
    X86_64,
    Arm64
};

// Canonical (OS, architecture) pair selecting the artifact variant
struct PlatformKey
{
    OsKind os = OsKind::Linux;
    ArchKind arch = ArchKind::X86_64;

    bool operator==(const PlatformKey&) const = default;
};

std::string toString(OsKind os);
std::string toString(ArchKind arch);

enum class SourceKind
{
    Primary, // Release host, addressed by exact tag
    Mirror // Branch-addressed static copy
};

struct SourceCandidate
{
    std::string url;
    SourceKind kind = SourceKind::Primary;
};

enum class AttemptOutcome
{
    Success,
    TransientFailure,
    RejectedSmallFile,
    LocalFailure // staging file could not be written; retrying cannot help
};

struct DownloadAttempt
{
    SourceCandidate candidate;
    int attemptNumber = 0; // 1-based, per candidate
    AttemptOutcome outcome = AttemptOutcome::TransientFailure;
    std::uintmax_t sizeBytes = 0;
    std::string detail; // HTTP status or transport error
};

// Downloader state machine
enum class DownloadState
{
    Idle,
    Attempting,
    Retrying,
    Success,
    ExhaustedPrimary,
    ExhaustedAll,
    LocalFailure
};

const char* toString(SourceKind kind);
const char* toString(AttemptOutcome outcome);
const char* toString(DownloadState state);

enum class ExitCode : int
{
    Success = 0,
    UnsupportedPlatform = 1,
    ManualCompletionRequired = 2,
    FilesystemError = 3,
    UsageError = 64
};

// Everything the pipeline reports back to the caller
struct InstallOutcome
{
    ExitCode code = ExitCode::Success;
    std::string message;
    std::string artifactName;
    std::string resolvedVersion; // empty when metadata could not be resolved
    std::filesystem::path installedPath;
    std::vector<DownloadAttempt> attempts;
    std::vector<std::filesystem::path> updatedStartupFiles;
};

} // namespace installer
