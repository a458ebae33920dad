#pragma once

#include "HttpClient.hpp"
#include "InstallTypes.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace installer
{

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

struct RetryPolicy
{
    int primaryAttempts = 3;
    int mirrorAttempts = 1;
    std::chrono::milliseconds backoff{ 2000 };
    std::uintmax_t minArtifactBytes = 1000000; // smaller bodies are error pages or placeholders
};

struct DownloadResult
{
    DownloadState state = DownloadState::Idle;
    std::filesystem::path stagedPath; // valid only when state == Success
    SourceCandidate source; // the candidate that produced the file
    std::vector<DownloadAttempt> attempts;

    bool succeeded() const { return state == DownloadState::Success; }
};

// Fetches the artifact into a staging file, walking the candidate list with a
// fixed per-source attempt budget and a linear backoff between retries.
class Downloader
{
public:
    Downloader(IHttpClient& http, RetryPolicy policy, SessionConfig session, std::string userAgent,
               SleepFunction sleep = nullptr);

    // On failure no file is left at stagingPath. A local write failure ends
    // the walk at once with DownloadState::LocalFailure.
    DownloadResult download(const std::vector<SourceCandidate>& candidates, const std::filesystem::path& stagingPath);

    DownloadState state() const { return state_; }

    const RetryPolicy& policy() const { return policy_; }

    static std::string formatSize(std::uintmax_t bytes);

private:
    DownloadAttempt attempt(const SourceCandidate& candidate, int attemptNumber,
                            const std::filesystem::path& stagingPath);
    int attemptsFor(SourceKind kind) const;
    void discard(const std::filesystem::path& stagingPath);

    IHttpClient& http_;
    RetryPolicy policy_;
    SessionConfig session_;
    std::string userAgent_;
    SleepFunction sleep_;
    DownloadState state_ = DownloadState::Idle;
};

} // namespace installer
