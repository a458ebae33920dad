#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace installer
{

struct PathRegistration
{
    std::vector<std::filesystem::path> updated; // line appended this run
    std::vector<std::filesystem::path> alreadyPresent; // directory already mentioned
    std::vector<std::filesystem::path> skipped; // file does not exist
    bool processPathUpdated = false;
};

// Idempotent "ensure present" for the install directory on the search path
class PathRegistrar
{
public:
    PathRegistrar(std::filesystem::path installDir, std::vector<std::filesystem::path> startupFiles);

    // Fails only when an existing startup file cannot be read or appended to
    bool ensurePresent(PathRegistration& outResult, std::string& outError);

    // Read-check-append on a single startup file
    bool registerInFile(const std::filesystem::path& startupFile, PathRegistration& outResult,
                        std::string& outError);

    // Adds the directory to this process's PATH when missing
    bool ensureProcessPath();

    std::string exportLine() const;

    static bool pathListContains(const std::string& pathValue, const std::string& directory);

private:
    std::filesystem::path installDir_;
    std::vector<std::filesystem::path> startupFiles_;
};

} // namespace installer
