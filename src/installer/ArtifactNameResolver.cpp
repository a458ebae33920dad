#include "ArtifactNameResolver.hpp"

#include <array>
#include <utility>

namespace installer
{

namespace
{

struct NamingEntry
{
    OsKind os;
    const char* osLabel;
    const char* extension;
};

constexpr std::array<NamingEntry, 3> kNamingTable{ {
    { OsKind::Linux, "linux", "" },
    { OsKind::MacOS, "macos", "" },
    { OsKind::Windows, "windows", ".exe" },
} };

const NamingEntry& entryFor(OsKind os)
{
    for (const auto& entry : kNamingTable)
    {
        if (entry.os == os)
            return entry;
    }
    // Every OsKind has a row
    return kNamingTable.front();
}

} // namespace

ArtifactNameResolver::ArtifactNameResolver(std::string productName)
    : productName_(std::move(productName))
{
}

std::string ArtifactNameResolver::artifactName(const PlatformKey& key) const
{
    const auto& entry = entryFor(key.os);
    return productName_ + "-" + entry.osLabel + "-" + toString(key.arch) + entry.extension;
}

std::string ArtifactNameResolver::binaryName(const PlatformKey& key) const
{
    return productName_ + entryFor(key.os).extension;
}

} // namespace installer
