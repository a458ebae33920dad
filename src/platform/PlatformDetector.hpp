#pragma once

#include "installer/InstallTypes.hpp"

#include <optional>
#include <string>

namespace platform
{

// Raw identifiers as reported by the host (uname -s / uname -m)
struct HostInfo
{
    std::string kernelName;
    std::string machine;
};

/// Maps host identifiers onto the supported (os, arch) matrix
class PlatformDetector
{
public:
    /// Query the running host. Never fails; unknown fields are left empty.
    static HostInfo queryHost();

    /// Returns std::nullopt and fills outError for anything outside the matrix
    static std::optional<installer::PlatformKey> detect(const HostInfo& host, std::string& outError);

    static std::optional<installer::OsKind> parseKernelName(const std::string& kernelName);
    static std::optional<installer::ArchKind> parseMachine(const std::string& machine);
};

} // namespace platform
