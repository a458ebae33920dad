#include "InstallerConfig.hpp"
#include "installer/VersionResolver.hpp"

#include <plog/Log.h>
#include <toml++/toml.h>

#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace
{

void readString(const toml::table& section, const char* key, std::string& out)
{
    if (auto value = section[key].value<std::string>())
        out = *value;
}

// Fails with outError set when the value does not fit in an int
bool readInt(const toml::table& section, const char* table, const char* key, int& out, std::string& outError)
{
    auto value = section[key].value<int64_t>();
    if (!value)
        return true;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
    {
        outError = std::string(table) + "." + key + " is out of range (" + std::to_string(*value) + ")";
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}

void readBool(const toml::table& section, const char* key, bool& out)
{
    if (auto value = section[key].value<bool>())
        out = *value;
}

bool isTruthy(const std::string& value) { return !value.empty() && value != "0" && value != "false"; }

} // namespace

std::string InstallerConfig::metadataUrl() const
{
    if (!release.metadata_url.empty())
        return release.metadata_url;

    return installer::VersionResolver::latestReleaseUrl(release.api_host, release.owner, release.repo);
}

installer::SourceLayout InstallerConfig::sourceLayout() const
{
    installer::SourceLayout layout;
    layout.releaseHost = release.release_host;
    layout.owner = release.owner;
    layout.repo = release.repo;
    layout.mirrorScheme = mirror.scheme;
    layout.mirrorBranch = mirror.branch;
    layout.mirrorDirectory = mirror.directory;
    return layout;
}

bool InstallerConfig::validate(std::string& outError) const
{
    if (release.product.empty() || release.owner.empty() || release.repo.empty())
    {
        outError = "release.product, release.owner and release.repo must not be empty";
        return false;
    }
    if (mirror.branch.empty())
    {
        outError = "mirror.branch must not be empty";
        return false;
    }
    if (download.primary_attempts < 1)
    {
        outError = "download.primary_attempts must be at least 1 (got " + std::to_string(download.primary_attempts) +
                   ")";
        return false;
    }
    if (download.mirror_attempts < 0)
    {
        outError = "download.mirror_attempts must not be negative";
        return false;
    }
    if (download.backoff_ms < 0)
    {
        outError = "download.backoff_ms must not be negative";
        return false;
    }
    if (download.min_artifact_bytes <= 0)
    {
        outError = "download.min_artifact_bytes must be positive";
        return false;
    }
    if (download.connect_timeout_ms <= 0 || download.timeout_ms <= 0 || download.metadata_timeout_ms <= 0)
    {
        outError = "download timeouts must be positive";
        return false;
    }
    if (install.directory.empty())
    {
        outError = "no install directory: set install.directory or DYMO_INSTALL_DIR (HOME is not set)";
        return false;
    }
    if (logging.level < 0 || logging.level > 6)
    {
        outError = "logging.level must be between 0 and 6";
        return false;
    }
    return true;
}

ConfigLoader::ConfigLoader(EnvLookup env)
    : env_(std::move(env))
{
    if (!env_)
    {
        env_ = [](const std::string& name) -> std::optional<std::string>
        {
            const char* value = std::getenv(name.c_str());
            if (!value)
                return std::nullopt;
            return std::string(value);
        };
    }
}

std::optional<std::string> ConfigLoader::lookup(const std::string& name) const
{
    auto value = env_(name);
    if (value && value->empty())
        return std::nullopt;
    return value;
}

std::optional<fs::path> ConfigLoader::homeDirectory() const
{
    if (auto home = lookup("HOME"))
        return fs::path(*home);
#ifdef _WIN32
    if (auto profile = lookup("USERPROFILE"))
        return fs::path(*profile);
#endif
    return std::nullopt;
}

std::optional<fs::path> ConfigLoader::userConfigPath() const
{
    if (auto xdg = lookup("XDG_CONFIG_HOME"))
        return fs::path(*xdg) / "dymo-bootstrap" / "config.toml";
    if (auto home = homeDirectory())
        return *home / ".config" / "dymo-bootstrap" / "config.toml";
    return std::nullopt;
}

fs::path ConfigLoader::expandHome(const std::string& value) const
{
    if (value == "~" || value.rfind("~/", 0) == 0)
    {
        if (auto home = homeDirectory())
        {
            return value.size() <= 2 ? *home : *home / value.substr(2);
        }
    }
    return fs::path(value);
}

bool ConfigLoader::applyDefaults(InstallerConfig& config)
{
    last_error_.clear();
    auto home = homeDirectory();
    if (!home)
    {
        // Directory may still come from DYMO_INSTALL_DIR or the config file
        PLOG_DEBUG << "HOME is not set; no default install directory";
        return true;
    }

    config.install.directory = *home / ".local" / "bin";
    config.install.startup_files = { *home / ".bashrc", *home / ".zshrc" };
    return true;
}

bool ConfigLoader::loadFile(const fs::path& path, InstallerConfig& config, bool required)
{
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (required)
        {
            last_error_ = "config file not found: " + path.string();
            return false;
        }
        return true;
    }

    try
    {
        toml::table root = toml::parse_file(path.string());

        if (auto release = root["release"].as_table())
        {
            readString(*release, "product", config.release.product);
            readString(*release, "owner", config.release.owner);
            readString(*release, "repo", config.release.repo);
            readString(*release, "release_host", config.release.release_host);
            readString(*release, "api_host", config.release.api_host);
            readString(*release, "metadata_url", config.release.metadata_url);
            readString(*release, "version", config.release.version);
        }

        if (auto mirror = root["mirror"].as_table())
        {
            if (auto scheme = (*mirror)["scheme"].value<std::string>())
            {
                if (!installer::parseMirrorScheme(*scheme, config.mirror.scheme))
                {
                    last_error_ = "unknown mirror.scheme '" + *scheme + "' (expected raw or jsdelivr)";
                    return false;
                }
            }
            readString(*mirror, "branch", config.mirror.branch);
            readString(*mirror, "directory", config.mirror.directory);
        }

        if (auto download = root["download"].as_table())
        {
            if (!readInt(*download, "download", "primary_attempts", config.download.primary_attempts, last_error_))
                return false;
            if (!readInt(*download, "download", "mirror_attempts", config.download.mirror_attempts, last_error_))
                return false;
            if (!readInt(*download, "download", "backoff_ms", config.download.backoff_ms, last_error_))
                return false;
            if (auto bytes = (*download)["min_artifact_bytes"].value<int64_t>())
                config.download.min_artifact_bytes = *bytes;
            if (!readInt(*download, "download", "connect_timeout_ms", config.download.connect_timeout_ms, last_error_))
                return false;
            if (!readInt(*download, "download", "timeout_ms", config.download.timeout_ms, last_error_))
                return false;
            if (!readInt(*download, "download", "metadata_timeout_ms", config.download.metadata_timeout_ms, last_error_))
                return false;
            readString(*download, "user_agent", config.download.user_agent);
        }

        if (auto install = root["install"].as_table())
        {
            if (auto dir = (*install)["directory"].value<std::string>())
                config.install.directory = expandHome(*dir);
            readBool(*install, "modify_path", config.install.modify_path);
            readBool(*install, "interactive", config.install.interactive);
            if (auto files = (*install)["startup_files"].as_array())
            {
                config.install.startup_files.clear();
                for (const auto& node : *files)
                {
                    if (auto file = node.value<std::string>())
                        config.install.startup_files.push_back(expandHome(*file));
                }
            }
        }

        if (auto logging = root["logging"].as_table())
        {
            if (!readInt(*logging, "logging", "level", config.logging.level, last_error_))
                return false;
            if (auto file = (*logging)["file"].value<std::string>())
                config.logging.file = expandHome(*file).string();
        }

        PLOG_DEBUG << "Loaded configuration from " << path.string();
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        if (pe.source().begin.line > 0)
        {
            last_error_ = "config parse error at " + path.string() + " line " +
                          std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            last_error_ = "config parse error in " + path.string() + ": " + std::string(pe.description());
        }
        return false;
    }
}

void ConfigLoader::applyEnvironment(InstallerConfig& config)
{
    if (auto version = lookup("DYMO_VERSION"))
    {
        config.release.version = *version;
    }
    if (auto dir = lookup("DYMO_INSTALL_DIR"))
    {
        config.install.directory = expandHome(*dir);
    }
    if (auto noModify = lookup("DYMO_NO_MODIFY_PATH"))
    {
        if (isTruthy(*noModify))
            config.install.modify_path = false;
    }
}
