#include "PlatformDetector.hpp"

#include <plog/Log.h>

#include <cstdlib>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <sys/utsname.h>
#endif

namespace platform
{

namespace
{

bool contains(const std::string& haystack, const char* needle) { return haystack.find(needle) != std::string::npos; }

#ifdef _WIN32
std::string windowsMachine()
{
    const char* arch = std::getenv("PROCESSOR_ARCHITEW6432");
    if (!arch)
        arch = std::getenv("PROCESSOR_ARCHITECTURE");
    if (!arch)
        return {};

    std::string value(arch);
    if (value == "AMD64")
        return "x86_64";
    if (value == "ARM64")
        return "arm64";
    return value;
}
#endif

} // namespace

HostInfo PlatformDetector::queryHost()
{
    HostInfo host;
#ifdef _WIN32
    // Same signature a MINGW/MSYS shell reports, so one matrix covers both
    host.kernelName = "MINGW64_NT-Windows";
    host.machine = windowsMachine();
#else
    struct utsname info;
    if (uname(&info) != 0)
    {
        PLOG_ERROR << "uname() failed: " << std::strerror(errno);
        return host;
    }
    host.kernelName = info.sysname;
    host.machine = info.machine;
#endif
    PLOG_DEBUG << "Host reports kernel='" << host.kernelName << "' machine='" << host.machine << "'";
    return host;
}

std::optional<installer::OsKind> PlatformDetector::parseKernelName(const std::string& kernelName)
{
    if (contains(kernelName, "Linux"))
        return installer::OsKind::Linux;
    if (contains(kernelName, "Darwin"))
        return installer::OsKind::MacOS;
    if (contains(kernelName, "MINGW") || contains(kernelName, "MSYS") || contains(kernelName, "CYGWIN"))
        return installer::OsKind::Windows;
    return std::nullopt;
}

std::optional<installer::ArchKind> PlatformDetector::parseMachine(const std::string& machine)
{
    if (machine == "x86_64")
        return installer::ArchKind::X86_64;
    // macOS reports arm64, Linux reports aarch64 for the same silicon family
    if (machine == "aarch64" || machine == "arm64")
        return installer::ArchKind::Arm64;
    return std::nullopt;
}

std::optional<installer::PlatformKey> PlatformDetector::detect(const HostInfo& host, std::string& outError)
{
    auto os = parseKernelName(host.kernelName);
    if (!os)
    {
        outError = "Unsupported platform: operating system '" + host.kernelName + "' is not supported";
        return std::nullopt;
    }

    auto arch = parseMachine(host.machine);
    if (!arch)
    {
        outError = "Unsupported platform: architecture '" + host.machine + "' is not supported on " +
                   installer::toString(*os);
        return std::nullopt;
    }

    installer::PlatformKey key;
    key.os = *os;
    key.arch = *arch;
    PLOG_INFO << "Detected platform: " << installer::toString(key.os) << "/" << installer::toString(key.arch);
    return key;
}

} // namespace platform
