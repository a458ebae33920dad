#include "VersionResolver.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <utility>

using json = nlohmann::json;

namespace installer
{

VersionResolver::VersionResolver(IHttpClient& http, MetadataEndpoint endpoint)
    : http_(http)
    , endpoint_(std::move(endpoint))
{
}

std::string VersionResolver::latestReleaseUrl(const std::string& apiHost, const std::string& owner,
                                              const std::string& repo)
{
    std::string host = apiHost;
    while (!host.empty() && host.back() == '/')
    {
        host.pop_back();
    }
    return host + "/repos/" + owner + "/" + repo + "/releases/latest";
}

bool VersionResolver::parseMetadata(const std::string& body, std::string& outTag, std::string& outError)
{
    try
    {
        json metadata = json::parse(body);
        if (!metadata.is_object())
        {
            outError = "release metadata is not a JSON object";
            return false;
        }

        std::string tag;
        if (metadata.contains("tag_name") && metadata["tag_name"].is_string())
        {
            tag = metadata["tag_name"].get<std::string>();
        }
        else if (metadata.contains("version") && metadata["version"].is_string())
        {
            tag = metadata["version"].get<std::string>();
        }
        else
        {
            outError = "release metadata missing 'tag_name' field";
            return false;
        }

        if (tag.empty())
        {
            outError = "release metadata has an empty tag";
            return false;
        }

        outTag = tag;
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

VersionResolution VersionResolver::resolve(const ReleaseVersion& requested)
{
    VersionResolution result;

    if (!requested.latest)
    {
        result.resolved = true;
        result.tag = requested.tag;
        PLOG_INFO << "Using pinned version " << result.tag;
        return result;
    }

    PLOG_INFO << "Resolving latest release from " << endpoint_.url;

    SessionConfig cfg;
    cfg.connect_timeout_ms = endpoint_.timeoutMs;
    cfg.timeout_ms = endpoint_.timeoutMs;

    std::vector<Header> headers{ { "User-Agent", endpoint_.userAgent }, { "Accept", "application/json" } };
    HttpResponse response = http_.get(endpoint_.url, headers, cfg);

    if (!response.error.empty())
    {
        result.error = "Network error: " + response.error;
        PLOG_DEBUG << "Could not resolve latest version (" << result.error << ")";
        return result;
    }

    if (!response.ok())
    {
        result.error = "Release metadata returned status " + std::to_string(response.status_code);
        if (response.status_code == 404)
        {
            result.error += " (no published release)";
        }
        else if (response.status_code == 403)
        {
            result.error += " (rate limited)";
        }
        PLOG_DEBUG << "Could not resolve latest version (" << result.error << ")";
        return result;
    }

    std::string tag;
    if (!parseMetadata(response.text, tag, result.error))
    {
        PLOG_DEBUG << "Could not resolve latest version (" << result.error << ")";
        return result;
    }

    result.resolved = true;
    result.tag = tag;
    result.fromMetadata = true;
    PLOG_INFO << "Latest release is " << tag;
    return result;
}

} // namespace installer
