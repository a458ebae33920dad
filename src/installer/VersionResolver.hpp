#pragma once

#include "HttpClient.hpp"

#include <string>
#include <utility>

namespace installer
{

// Either "latest" or a caller-pinned tag
struct ReleaseVersion
{
    bool latest = true;
    std::string tag;

    static ReleaseVersion Latest() { return ReleaseVersion{}; }

    static ReleaseVersion Pinned(std::string tag) { return ReleaseVersion{ false, std::move(tag) }; }
};

struct VersionResolution
{
    bool resolved = false;
    std::string tag; // used verbatim in release URLs
    bool fromMetadata = false;
    std::string error; // why the tag is unknown
};

struct MetadataEndpoint
{
    std::string url;
    std::string userAgent;
    int timeoutMs = 5000;
};

// Resolves the release tag once per run
class VersionResolver
{
public:
    VersionResolver(IHttpClient& http, MetadataEndpoint endpoint);

    // Pinned versions never touch the network. Metadata failures come back
    // as an unresolved result, never as a guessed tag.
    VersionResolution resolve(const ReleaseVersion& requested);

    // <apiHost>/repos/<owner>/<repo>/releases/latest
    static std::string latestReleaseUrl(const std::string& apiHost, const std::string& owner, const std::string& repo);

    // Extracts "tag_name" (GitHub API) or "version" (static version.json)
    static bool parseMetadata(const std::string& body, std::string& outTag, std::string& outError);

private:
    IHttpClient& http_;
    MetadataEndpoint endpoint_;
};

} // namespace installer
