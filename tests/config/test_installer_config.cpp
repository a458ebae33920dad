#include <catch2/catch_test_macros.hpp>
#include "config/InstallerConfig.hpp"
#include "../utils/temp_dir.hpp"

#include <map>
#include <optional>
#include <string>

using test_utils::TempDirectory;
using test_utils::writeFile;

namespace fs = std::filesystem;

namespace
{

ConfigLoader::EnvLookup fakeEnv(std::map<std::string, std::string> vars)
{
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string>
    {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST_CASE("Defaults derive from the home directory", "[config]")
{
    ConfigLoader loader(fakeEnv({ { "HOME", "/home/alice" } }));
    InstallerConfig config;

    REQUIRE(loader.applyDefaults(config));
    REQUIRE(config.install.directory == fs::path("/home/alice/.local/bin"));
    REQUIRE(config.install.startup_files.size() == 2);
    REQUIRE(config.install.startup_files[0] == fs::path("/home/alice/.bashrc"));
    REQUIRE(config.install.startup_files[1] == fs::path("/home/alice/.zshrc"));
    REQUIRE(config.metadataUrl() == "https://api.github.com/repos/TPEOficial/dymo-code/releases/latest");

    std::string error;
    REQUIRE(config.validate(error));
}

TEST_CASE("Without HOME there is no install directory", "[config]")
{
    ConfigLoader loader(fakeEnv({}));
    InstallerConfig config;

    REQUIRE(loader.applyDefaults(config));
    REQUIRE(config.install.directory.empty());

    std::string error;
    REQUIRE_FALSE(config.validate(error));
    REQUIRE(error.find("install directory") != std::string::npos);
}

TEST_CASE("TOML file overrides defaults", "[config]")
{
    TempDirectory dir;
    const fs::path file = dir / "config.toml";
    writeFile(file, R"(
[release]
owner = "example"
repo = "tool"
version = "v3.1.0"

[mirror]
scheme = "jsdelivr"
branch = "stable"

[download]
primary_attempts = 5
backoff_ms = 250
min_artifact_bytes = 4096

[install]
directory = "~/bin"
modify_path = false
startup_files = ["~/.profile"]

[logging]
level = 5
)");

    ConfigLoader loader(fakeEnv({ { "HOME", "/home/bob" } }));
    InstallerConfig config;
    REQUIRE(loader.applyDefaults(config));
    REQUIRE(loader.loadFile(file, config, true));

    REQUIRE(config.release.owner == "example");
    REQUIRE(config.release.repo == "tool");
    REQUIRE(config.release.product == "dymo-code");
    REQUIRE(config.release.version == "v3.1.0");
    REQUIRE(config.mirror.scheme == installer::MirrorScheme::JsDelivr);
    REQUIRE(config.mirror.branch == "stable");
    REQUIRE(config.mirror.directory == "dist");
    REQUIRE(config.download.primary_attempts == 5);
    REQUIRE(config.download.mirror_attempts == 1);
    REQUIRE(config.download.backoff_ms == 250);
    REQUIRE(config.download.min_artifact_bytes == 4096);
    REQUIRE(config.install.directory == fs::path("/home/bob/bin"));
    REQUIRE_FALSE(config.install.modify_path);
    REQUIRE(config.install.startup_files == std::vector<fs::path>{ fs::path("/home/bob/.profile") });
    REQUIRE(config.logging.level == 5);

    auto layout = config.sourceLayout();
    REQUIRE(layout.owner == "example");
    REQUIRE(layout.mirrorBranch == "stable");
    REQUIRE(config.metadataUrl() == "https://api.github.com/repos/example/tool/releases/latest");
}

TEST_CASE("Config file errors are reported with context", "[config]")
{
    TempDirectory dir;
    ConfigLoader loader(fakeEnv({ { "HOME", "/home/carol" } }));
    InstallerConfig config;

    SECTION("Syntax error names the line")
    {
        const fs::path file = dir / "broken.toml";
        writeFile(file, "[download]\nprimary_attempts = = 3\n");
        REQUIRE_FALSE(loader.loadFile(file, config, true));
        const std::string error = loader.lastError();
        REQUIRE(error.find("broken.toml") != std::string::npos);
        REQUIRE(error.find("line 2") != std::string::npos);
    }

    SECTION("Unknown mirror scheme")
    {
        const fs::path file = dir / "mirror.toml";
        writeFile(file, "[mirror]\nscheme = \"ftp\"\n");
        REQUIRE_FALSE(loader.loadFile(file, config, true));
        REQUIRE(std::string(loader.lastError()).find("ftp") != std::string::npos);
    }

    SECTION("Integer that does not fit names the key")
    {
        const fs::path file = dir / "huge.toml";
        writeFile(file, "[download]\nprimary_attempts = 4294967297\n");
        REQUIRE_FALSE(loader.loadFile(file, config, true));
        const std::string error = loader.lastError();
        REQUIRE(error.find("download.primary_attempts") != std::string::npos);
        REQUIRE(error.find("4294967297") != std::string::npos);
        REQUIRE(config.download.primary_attempts == 3);
    }

    SECTION("Negative overflow is rejected too")
    {
        const fs::path file = dir / "low.toml";
        writeFile(file, "[logging]\nlevel = -4294967296\n");
        REQUIRE_FALSE(loader.loadFile(file, config, true));
        REQUIRE(std::string(loader.lastError()).find("logging.level") != std::string::npos);
    }

    SECTION("Missing explicit file")
    {
        REQUIRE_FALSE(loader.loadFile(dir / "absent.toml", config, true));
        REQUIRE(std::string(loader.lastError()).find("not found") != std::string::npos);
    }

    SECTION("Missing optional file is fine")
    {
        REQUIRE(loader.loadFile(dir / "absent.toml", config, false));
    }
}

TEST_CASE("Environment overrides file settings", "[config]")
{
    ConfigLoader loader(fakeEnv({
        { "HOME", "/home/dave" },
        { "DYMO_VERSION", "v0.9.0" },
        { "DYMO_INSTALL_DIR", "~/tools" },
        { "DYMO_NO_MODIFY_PATH", "1" },
    }));
    InstallerConfig config;
    REQUIRE(loader.applyDefaults(config));
    loader.applyEnvironment(config);

    REQUIRE(config.release.version == "v0.9.0");
    REQUIRE(config.install.directory == fs::path("/home/dave/tools"));
    REQUIRE_FALSE(config.install.modify_path);
}

TEST_CASE("Empty or false environment values are ignored", "[config]")
{
    ConfigLoader loader(fakeEnv({
        { "HOME", "/home/erin" },
        { "DYMO_VERSION", "" },
        { "DYMO_NO_MODIFY_PATH", "0" },
    }));
    InstallerConfig config;
    REQUIRE(loader.applyDefaults(config));
    loader.applyEnvironment(config);

    REQUIRE(config.release.version.empty());
    REQUIRE(config.install.modify_path);
}

TEST_CASE("Per-user config location", "[config]")
{
    SECTION("XDG_CONFIG_HOME wins")
    {
        ConfigLoader loader(fakeEnv({ { "HOME", "/home/f" }, { "XDG_CONFIG_HOME", "/xdg" } }));
        REQUIRE(loader.userConfigPath() == fs::path("/xdg/dymo-bootstrap/config.toml"));
    }

    SECTION("Falls back to ~/.config")
    {
        ConfigLoader loader(fakeEnv({ { "HOME", "/home/f" } }));
        REQUIRE(loader.userConfigPath() == fs::path("/home/f/.config/dymo-bootstrap/config.toml"));
    }
}

TEST_CASE("Validation rejects unusable download settings", "[config]")
{
    InstallerConfig config;
    config.install.directory = "/tmp/bin";
    std::string error;
    REQUIRE(config.validate(error));

    SECTION("No release attempts")
    {
        config.download.primary_attempts = 0;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("primary_attempts") != std::string::npos);
    }

    SECTION("Mirror disabled is allowed")
    {
        config.download.mirror_attempts = 0;
        REQUIRE(config.validate(error));
    }

    SECTION("Zero size threshold")
    {
        config.download.min_artifact_bytes = 0;
        REQUIRE_FALSE(config.validate(error));
    }

    SECTION("Log level out of range")
    {
        config.logging.level = 9;
        REQUIRE_FALSE(config.validate(error));
    }

    SECTION("Empty mirror branch")
    {
        config.mirror.branch.clear();
        REQUIRE_FALSE(config.validate(error));
    }
}
