#include "InstallPipeline.hpp"
#include "ArtifactNameResolver.hpp"
#include "Installer.hpp"
#include "PathRegistrar.hpp"
#include "SourceUrlBuilder.hpp"
#include "VersionResolver.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <optional>
#include <utility>

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace installer
{

InstallPipeline::InstallPipeline(const InstallerConfig& config, IHttpClient& http, ManualFallback& fallback,
                                 SleepFunction sleep)
    : config_(config)
    , http_(http)
    , fallback_(fallback)
    , sleep_(std::move(sleep))
{
}

InstallOutcome InstallPipeline::fail(InstallOutcome outcome, ExitCode code, const std::string& message)
{
    outcome.code = code;
    outcome.message = message;
    return outcome;
}

InstallOutcome InstallPipeline::run(const platform::HostInfo& host)
{
    InstallOutcome outcome;

    // Platform problems end the run before any network activity
    std::string error;
    auto key = platform::PlatformDetector::detect(host, error);
    if (!key)
    {
        ErrorReporter::ReportFatal(ErrorCategory::Platform, error);
        return fail(std::move(outcome), ExitCode::UnsupportedPlatform, error);
    }

    ArtifactNameResolver names(config_.release.product);
    outcome.artifactName = names.artifactName(*key);
    PLOG_INFO << "Artifact: " << outcome.artifactName;

    MetadataEndpoint endpoint;
    endpoint.url = config_.metadataUrl();
    endpoint.userAgent = config_.download.user_agent;
    endpoint.timeoutMs = config_.download.metadata_timeout_ms;

    VersionResolver versions(http_, endpoint);
    ReleaseVersion requested =
        config_.release.version.empty() ? ReleaseVersion::Latest() : ReleaseVersion::Pinned(config_.release.version);
    VersionResolution resolution = versions.resolve(requested);

    std::optional<std::string> tag;
    if (resolution.resolved)
    {
        tag = resolution.tag;
        outcome.resolvedVersion = resolution.tag;
    }
    else
    {
        ErrorReporter::ReportWarning(ErrorCategory::VersionMetadata,
                                     "Could not determine the latest release, using the " +
                                         std::string(toString(config_.mirror.scheme)) + " mirror on branch '" +
                                         config_.mirror.branch + "'",
                                     resolution.error);
    }

    SourceUrlBuilder sources(config_.sourceLayout());
    std::vector<SourceCandidate> candidates = sources.build(outcome.artifactName, tag);

    RetryPolicy policy;
    policy.primaryAttempts = config_.download.primary_attempts;
    policy.mirrorAttempts = config_.download.mirror_attempts;
    policy.backoff = std::chrono::milliseconds(config_.download.backoff_ms);
    policy.minArtifactBytes = static_cast<std::uintmax_t>(config_.download.min_artifact_bytes);

    // Without a tag only the mirror is left, and it may be switched off
    int attemptBudget = 0;
    for (const auto& candidate : candidates)
    {
        attemptBudget += candidate.kind == SourceKind::Primary ? policy.primaryAttempts : policy.mirrorAttempts;
    }
    if (attemptBudget == 0)
    {
        error = "No download source left: the release version is unknown and download.mirror_attempts is 0";
        ErrorReporter::ReportFatal(ErrorCategory::Configuration, error, resolution.error);
        return fail(std::move(outcome), ExitCode::UsageError, error);
    }

    Installer installer(config_.install.directory, names.binaryName(*key));
    if (!installer.prepareDirectory(error))
    {
        ErrorReporter::ReportFatal(ErrorCategory::Filesystem, error);
        return fail(std::move(outcome), ExitCode::FilesystemError, error);
    }

    SessionConfig session;
    session.connect_timeout_ms = config_.download.connect_timeout_ms;
    session.timeout_ms = config_.download.timeout_ms;

    Downloader downloader(http_, policy, session, config_.download.user_agent, sleep_);
    DownloadResult download = downloader.download(candidates, installer.stagingPath());
    outcome.attempts = download.attempts;

    if (download.state == DownloadState::LocalFailure)
    {
        error = download.attempts.back().detail;
        ErrorReporter::ReportFatal(ErrorCategory::Filesystem, "Cannot write the download into " +
                                                                  installer.installDir().string(),
                                   error);
        return fail(std::move(outcome), ExitCode::FilesystemError, error);
    }

    if (!download.succeeded())
    {
        const std::string& manualUrl = candidates.front().url;
        std::string message = "Automatic download failed after " + std::to_string(download.attempts.size()) +
                              " attempts; download " + manualUrl + " to " + installer.targetPath().string();
        ErrorReporter::ReportError(ErrorCategory::ManualCompletion, message);
        fallback_.run(manualUrl, installer.targetPath(), static_cast<int>(download.attempts.size()));
        return fail(std::move(outcome), ExitCode::ManualCompletionRequired, message);
    }

    if (!installer.install(download.stagedPath, error))
    {
        ErrorReporter::ReportFatal(ErrorCategory::Filesystem, error);
        return fail(std::move(outcome), ExitCode::FilesystemError, error);
    }
    outcome.installedPath = installer.targetPath();

    if (config_.install.modify_path)
    {
        PathRegistrar registrar(installer.installDir(), config_.install.startup_files);
        PathRegistration registration;
        if (!registrar.ensurePresent(registration, error))
        {
            ErrorReporter::ReportFatal(ErrorCategory::Filesystem, error);
            return fail(std::move(outcome), ExitCode::FilesystemError, error);
        }
        outcome.updatedStartupFiles = registration.updated;
    }
    else
    {
        PLOG_INFO << "Leaving shell startup files untouched";
    }

    outcome.code = ExitCode::Success;
    outcome.message = "Installed successfully. Run: " + config_.release.product;
    return outcome;
}

} // namespace installer
