#include "Downloader.hpp"

#include <plog/Log.h>

#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace installer
{

Downloader::Downloader(IHttpClient& http, RetryPolicy policy, SessionConfig session, std::string userAgent,
                       SleepFunction sleep)
    : http_(http)
    , policy_(policy)
    , session_(session)
    , userAgent_(std::move(userAgent))
    , sleep_(std::move(sleep))
{
    if (!sleep_)
    {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::string Downloader::formatSize(std::uintmax_t bytes)
{
    if (bytes < 1024)
        return std::to_string(bytes) + " B";
    if (bytes < 1024 * 1024)
        return std::to_string(bytes / 1024) + " KB";
    return std::to_string(bytes / (1024 * 1024)) + " MB";
}

int Downloader::attemptsFor(SourceKind kind) const
{
    return kind == SourceKind::Primary ? policy_.primaryAttempts : policy_.mirrorAttempts;
}

void Downloader::discard(const fs::path& stagingPath)
{
    std::error_code ec;
    fs::remove(stagingPath, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not remove rejected download " << stagingPath.string() << ": " << ec.message();
    }
}

DownloadAttempt Downloader::attempt(const SourceCandidate& candidate, int attemptNumber, const fs::path& stagingPath)
{
    DownloadAttempt record;
    record.candidate = candidate;
    record.attemptNumber = attemptNumber;

    discard(stagingPath);

    std::vector<Header> headers{ { "User-Agent", userAgent_ } };
    HttpResponse response = http_.download(candidate.url, stagingPath, headers, session_);

    if (!response.error.empty())
    {
        if (response.local_error)
            record.outcome = AttemptOutcome::LocalFailure;
        record.detail = response.error;
        discard(stagingPath);
        return record;
    }

    if (!response.ok())
    {
        record.detail = "HTTP " + std::to_string(response.status_code);
        discard(stagingPath);
        return record;
    }

    std::error_code ec;
    if (!fs::is_regular_file(stagingPath, ec))
    {
        record.detail = "no file was written";
        return record;
    }

    record.sizeBytes = fs::file_size(stagingPath, ec);
    if (ec)
    {
        record.outcome = AttemptOutcome::LocalFailure;
        record.detail = "cannot stat " + stagingPath.string() + ": " + ec.message();
        discard(stagingPath);
        return record;
    }

    if (record.sizeBytes < policy_.minArtifactBytes)
    {
        record.outcome = AttemptOutcome::RejectedSmallFile;
        record.detail = "received " + std::to_string(record.sizeBytes) + " bytes, expected at least " +
                        std::to_string(policy_.minArtifactBytes);
        discard(stagingPath);
        return record;
    }

    record.outcome = AttemptOutcome::Success;
    record.detail = "HTTP " + std::to_string(response.status_code);
    return record;
}

DownloadResult Downloader::download(const std::vector<SourceCandidate>& candidates, const fs::path& stagingPath)
{
    DownloadResult result;
    state_ = DownloadState::Idle;

    for (const auto& candidate : candidates)
    {
        const int budget = attemptsFor(candidate.kind);
        if (budget <= 0)
        {
            continue;
        }

        for (int n = 1; n <= budget; ++n)
        {
            state_ = DownloadState::Attempting;
            PLOG_INFO << "Downloading from " << toString(candidate.kind) << " source (attempt " << n << "/" << budget
                      << "): " << candidate.url;

            DownloadAttempt record = attempt(candidate, n, stagingPath);
            result.attempts.push_back(record);

            if (record.outcome == AttemptOutcome::Success)
            {
                state_ = DownloadState::Success;
                result.state = state_;
                result.stagedPath = stagingPath;
                result.source = candidate;
                PLOG_INFO << "Downloaded " << formatSize(record.sizeBytes) << " from " << candidate.url;
                return result;
            }

            if (record.outcome == AttemptOutcome::LocalFailure)
            {
                state_ = DownloadState::LocalFailure;
                result.state = state_;
                discard(stagingPath);
                return result;
            }

            PLOG_WARNING << "Attempt " << n << "/" << budget << " failed: " << toString(record.outcome) << " ("
                         << record.detail << ")";

            if (n < budget)
            {
                state_ = DownloadState::Retrying;
                PLOG_INFO << "Retrying in " << policy_.backoff.count() << " ms";
                sleep_(policy_.backoff);
            }
        }

        if (candidate.kind == SourceKind::Primary)
        {
            state_ = DownloadState::ExhaustedPrimary;
            PLOG_WARNING << "Release host failed after " << budget << " attempts, trying mirror";
        }
    }

    state_ = DownloadState::ExhaustedAll;
    result.state = state_;
    discard(stagingPath);
    PLOG_DEBUG << "All download sources exhausted after " << result.attempts.size() << " attempts";
    return result;
}

} // namespace installer
