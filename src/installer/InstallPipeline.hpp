#pragma once

#include "Downloader.hpp"
#include "HttpClient.hpp"
#include "InstallTypes.hpp"
#include "ManualFallback.hpp"
#include "config/InstallerConfig.hpp"
#include "platform/PlatformDetector.hpp"

namespace installer
{

// detect -> name -> version -> sources -> download -> install -> register
class InstallPipeline
{
public:
    InstallPipeline(const InstallerConfig& config, IHttpClient& http, ManualFallback& fallback,
                    SleepFunction sleep = nullptr);

    // Disable copy
    InstallPipeline(const InstallPipeline&) = delete;
    InstallPipeline& operator=(const InstallPipeline&) = delete;

    InstallOutcome run(const platform::HostInfo& host);

private:
    InstallOutcome fail(InstallOutcome outcome, ExitCode code, const std::string& message);

    const InstallerConfig& config_;
    IHttpClient& http_;
    ManualFallback& fallback_;
    SleepFunction sleep_;
};

} // namespace installer
