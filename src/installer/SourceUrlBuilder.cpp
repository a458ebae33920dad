#include "SourceUrlBuilder.hpp"

#include <plog/Log.h>

#include <utility>

namespace installer
{

namespace
{

std::string trimSlashes(std::string value)
{
    while (!value.empty() && value.back() == '/')
        value.pop_back();
    while (!value.empty() && value.front() == '/')
        value.erase(value.begin());
    return value;
}

} // namespace

bool parseMirrorScheme(const std::string& value, MirrorScheme& outScheme)
{
    if (value == "raw" || value == "github-raw")
    {
        outScheme = MirrorScheme::RawGitHub;
        return true;
    }
    if (value == "jsdelivr" || value == "cdn")
    {
        outScheme = MirrorScheme::JsDelivr;
        return true;
    }
    return false;
}

const char* toString(MirrorScheme scheme)
{
    switch (scheme)
    {
    case MirrorScheme::RawGitHub:
        return "raw";
    case MirrorScheme::JsDelivr:
        return "jsdelivr";
    }
    return "unknown";
}

SourceUrlBuilder::SourceUrlBuilder(SourceLayout layout)
    : layout_(std::move(layout))
{
    layout_.releaseHost = trimSlashes(layout_.releaseHost);
    layout_.mirrorDirectory = trimSlashes(layout_.mirrorDirectory);
}

std::string SourceUrlBuilder::primaryUrl(const std::string& artifactName, const std::string& tag) const
{
    return layout_.releaseHost + "/" + layout_.owner + "/" + layout_.repo + "/releases/download/" + tag + "/" +
           artifactName;
}

std::string SourceUrlBuilder::mirrorUrl(const std::string& artifactName) const
{
    std::string path = layout_.mirrorDirectory.empty() ? artifactName : layout_.mirrorDirectory + "/" + artifactName;

    switch (layout_.mirrorScheme)
    {
    case MirrorScheme::JsDelivr:
        // Branch reference, not a tag: @latest only works for npm packages
        return "https://cdn.jsdelivr.net/gh/" + layout_.owner + "/" + layout_.repo + "@" + layout_.mirrorBranch +
               "/" + path;
    case MirrorScheme::RawGitHub:
    default:
        return "https://raw.githubusercontent.com/" + layout_.owner + "/" + layout_.repo + "/" +
               layout_.mirrorBranch + "/" + path;
    }
}

std::vector<SourceCandidate> SourceUrlBuilder::build(const std::string& artifactName,
                                                     const std::optional<std::string>& resolvedTag) const
{
    std::vector<SourceCandidate> candidates;

    if (resolvedTag && !resolvedTag->empty())
    {
        candidates.push_back({ primaryUrl(artifactName, *resolvedTag), SourceKind::Primary });
    }
    else
    {
        PLOG_INFO << "Release version unknown, skipping release host";
    }

    candidates.push_back({ mirrorUrl(artifactName), SourceKind::Mirror });

    for (const auto& candidate : candidates)
    {
        PLOG_DEBUG << "Source candidate (" << toString(candidate.kind) << "): " << candidate.url;
    }
    return candidates;
}

} // namespace installer
