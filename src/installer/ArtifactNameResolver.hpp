#pragma once

#include "InstallTypes.hpp"

#include <string>

namespace installer
{

// Published artifact naming: <product>-<os>-<arch>[.exe]
class ArtifactNameResolver
{
public:
    explicit ArtifactNameResolver(std::string productName);

    std::string artifactName(const PlatformKey& key) const;

    // Name of the installed binary (no version or platform suffix)
    std::string binaryName(const PlatformKey& key) const;

    const std::string& productName() const { return productName_; }

private:
    std::string productName_;
};

} // namespace installer
