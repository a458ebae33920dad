#pragma once

#include "InstallTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace installer
{

enum class MirrorScheme
{
    RawGitHub, // raw.githubusercontent.com/<owner>/<repo>/<branch>/<dir>/<artifact>
    JsDelivr // cdn.jsdelivr.net/gh/<owner>/<repo>@<branch>/<dir>/<artifact>
};

bool parseMirrorScheme(const std::string& value, MirrorScheme& outScheme);
const char* toString(MirrorScheme scheme);

struct SourceLayout
{
    std::string releaseHost = "https://github.com";
    std::string owner;
    std::string repo;
    MirrorScheme mirrorScheme = MirrorScheme::RawGitHub;
    std::string mirrorBranch = "main";
    std::string mirrorDirectory = "dist";
};

class SourceUrlBuilder
{
public:
    explicit SourceUrlBuilder(SourceLayout layout);

    // Ordered candidates: the tagged release URL first (only when a tag is
    // known), then the branch-addressed mirror.
    std::vector<SourceCandidate> build(const std::string& artifactName,
                                       const std::optional<std::string>& resolvedTag) const;

    std::string primaryUrl(const std::string& artifactName, const std::string& tag) const;
    std::string mirrorUrl(const std::string& artifactName) const;

private:
    SourceLayout layout_;
};

} // namespace installer
