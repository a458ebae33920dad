#pragma once

#include "installer/SourceUrlBuilder.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct ReleaseSettings
{
    std::string product = "dymo-code";
    std::string owner = "TPEOficial";
    std::string repo = "dymo-code";
    std::string release_host = "https://github.com";
    std::string api_host = "https://api.github.com";
    std::string metadata_url; // empty = <api_host>/repos/<owner>/<repo>/releases/latest
    std::string version; // empty = latest
};

struct MirrorSettings
{
    installer::MirrorScheme scheme = installer::MirrorScheme::RawGitHub;
    std::string branch = "main";
    std::string directory = "dist";
};

struct DownloadSettings
{
    int primary_attempts = 3;
    int mirror_attempts = 1;
    int backoff_ms = 2000;
    std::int64_t min_artifact_bytes = 1000000;
    int connect_timeout_ms = 10000;
    int timeout_ms = 300000;
    int metadata_timeout_ms = 5000;
    std::string user_agent = "dymo-bootstrap";
};

struct InstallSettings
{
    std::filesystem::path directory;
    bool modify_path = true;
    std::vector<std::filesystem::path> startup_files;
    bool interactive = true;
};

struct LoggingSettings
{
    int level = 4; // plog::info
    std::string file;
};

struct InstallerConfig
{
    ReleaseSettings release;
    MirrorSettings mirror;
    DownloadSettings download;
    InstallSettings install;
    LoggingSettings logging;

    std::string metadataUrl() const;
    installer::SourceLayout sourceLayout() const;

    // Rejects combinations the pipeline cannot run with
    bool validate(std::string& outError) const;
};

// Builds an InstallerConfig from defaults, a TOML file and the environment
class ConfigLoader
{
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    explicit ConfigLoader(EnvLookup env = nullptr);

    // Home-relative defaults: ~/.local/bin, ~/.bashrc, ~/.zshrc
    bool applyDefaults(InstallerConfig& config);

    // Explicit files must exist; the implicit per-user file is optional
    bool loadFile(const std::filesystem::path& path, InstallerConfig& config, bool required);

    void applyEnvironment(InstallerConfig& config);

    std::optional<std::filesystem::path> homeDirectory() const;

    // Per-user config location (~/.config/dymo-bootstrap/config.toml)
    std::optional<std::filesystem::path> userConfigPath() const;

    std::filesystem::path expandHome(const std::string& value) const;

    const char* lastError() const { return last_error_.c_str(); }

private:
    std::optional<std::string> lookup(const std::string& name) const;

    EnvLookup env_;
    std::string last_error_;
};
