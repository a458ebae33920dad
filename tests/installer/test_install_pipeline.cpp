#include <catch2/catch_test_macros.hpp>
#include "installer/InstallPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/mock_http.hpp"
#include "../utils/temp_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace installer;
using test_utils::countOccurrences;
using test_utils::MockHttpClient;
using test_utils::MockResponses;
using test_utils::readFile;
using test_utils::TempDirectory;
using test_utils::writeFile;

namespace fs = std::filesystem;

namespace
{

const std::string kMetadataUrl = "https://api.github.com/repos/TPEOficial/dymo-code/releases/latest";
const std::string kPrimaryUrl =
    "https://github.com/TPEOficial/dymo-code/releases/download/v2.0.0/dymo-code-linux-x86_64";
const std::string kMirrorUrl =
    "https://raw.githubusercontent.com/TPEOficial/dymo-code/main/dist/dymo-code-linux-x86_64";

const platform::HostInfo kLinuxHost{ "Linux", "x86_64" };

// Everything the pipeline needs, rooted in a scratch home directory
struct PipelineFixture
{
    TempDirectory home;
    InstallerConfig config;
    MockHttpClient http;
    std::istringstream input;
    std::ostringstream output;
    std::vector<std::string> opened;
    std::vector<std::chrono::milliseconds> sleeps;
    ManualFallback fallback;
    std::string savedPath;

    PipelineFixture()
        : fallback(input, output,
                   [this](const std::string& url) {
                       opened.push_back(url);
                       return false;
                   },
                   false)
    {
        config.install.directory = home / ".local/bin";
        config.install.startup_files = { home / ".bashrc", home / ".zshrc" };
        const char* path = std::getenv("PATH");
        savedPath = path ? path : "";
        utils::ErrorReporter::ClearErrors();
    }

    ~PipelineFixture()
    {
#ifdef _WIN32
        _putenv_s("PATH", savedPath.c_str());
#else
        setenv("PATH", savedPath.c_str(), 1);
#endif
        utils::ErrorReporter::ClearErrors();
    }

    InstallOutcome run(const platform::HostInfo& host = kLinuxHost)
    {
        InstallPipeline pipeline(config, http, fallback, [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
        return pipeline.run(host);
    }

    fs::path target() const { return home / ".local/bin/dymo-code"; }
    fs::path staging() const { return home / ".local/bin/.dymo-code.download"; }
};

} // namespace

TEST_CASE("Unsupported host stops before any network request", "[pipeline]")
{
    PipelineFixture f;

    auto outcome = f.run(platform::HostInfo{ "Plan9", "mips" });

    REQUIRE(outcome.code == ExitCode::UnsupportedPlatform);
    REQUIRE(outcome.message.find("Plan9") != std::string::npos);
    REQUIRE(f.http.totalCalls() == 0);
    REQUIRE_FALSE(fs::exists(f.home / ".local"));
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Platform);
}

TEST_CASE("Release download installs and registers the binary", "[pipeline]")
{
    PipelineFixture f;
    writeFile(f.home / ".bashrc", "# bash\n");
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1200000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(outcome.artifactName == "dymo-code-linux-x86_64");
    REQUIRE(outcome.resolvedVersion == "v2.0.0");
    REQUIRE(outcome.installedPath == f.target());
    REQUIRE(outcome.message == "Installed successfully. Run: dymo-code");
    REQUIRE(fs::file_size(f.target()) == 1200000);
    REQUIRE_FALSE(fs::exists(f.staging()));
    REQUIRE(f.http.callCount(kMirrorUrl) == 0);

    REQUIRE(outcome.updatedStartupFiles == std::vector<fs::path>{ f.home / ".bashrc" });
    REQUIRE(countOccurrences(readFile(f.home / ".bashrc"), (f.home / ".local/bin").string()) == 1);
    REQUIRE_FALSE(fs::exists(f.home / ".zshrc"));
}

TEST_CASE("Running twice replaces the binary and keeps one PATH entry", "[pipeline]")
{
    PipelineFixture f;
    writeFile(f.home / ".bashrc", "");
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));

    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1000000, 'a'));
    REQUIRE(f.run().code == ExitCode::Success);

    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1100000, 'b'));
    auto second = f.run();
    REQUIRE(second.code == ExitCode::Success);
    REQUIRE(second.updatedStartupFiles.empty());

    const std::string installed = readFile(f.target());
    REQUIRE(installed.size() == 1100000);
    REQUIRE(installed.front() == 'b');

    const std::string exportLine = "export PATH=\"$PATH:" + (f.home / ".local/bin").string() + "\"";
    REQUIRE(countOccurrences(readFile(f.home / ".bashrc"), exportLine) == 1);
}

TEST_CASE("Undersized artifacts everywhere lead to manual completion", "[pipeline]")
{
    PipelineFixture f;
    writeFile(f.home / ".bashrc", "");
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(500000));
    f.http.setResponse(kMirrorUrl, MockResponses::binary(500000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::ManualCompletionRequired);
    REQUIRE(outcome.attempts.size() == 4);
    REQUIRE_FALSE(fs::exists(f.target()));
    REQUIRE_FALSE(fs::exists(f.staging()));
    REQUIRE(readFile(f.home / ".bashrc").empty());

    // User is pointed at the release URL and the exact destination
    REQUIRE(f.output.str().find(kPrimaryUrl) != std::string::npos);
    REQUIRE(f.output.str().find(f.target().string()) != std::string::npos);
    REQUIRE(f.opened == std::vector<std::string>{ kPrimaryUrl });
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::ManualCompletion);
}

TEST_CASE("Unknown latest version falls back to the mirror only", "[pipeline]")
{
    PipelineFixture f;
    f.http.setResponse(kMetadataUrl, MockResponses::http_error(403));
    f.http.setResponse(kMirrorUrl, MockResponses::binary(1000000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(outcome.resolvedVersion.empty());
    REQUIRE(f.http.callCount(kMirrorUrl) == 1);
    REQUIRE(f.http.totalCalls() == 2);
    for (const auto& url : f.http.requests())
    {
        REQUIRE(url.find("/releases/download/") == std::string::npos);
    }
    REQUIRE(f.sleeps.empty());
}

TEST_CASE("Pinned version skips the metadata request", "[pipeline]")
{
    PipelineFixture f;
    f.config.release.version = "v1.5.0";
    const std::string pinnedUrl =
        "https://github.com/TPEOficial/dymo-code/releases/download/v1.5.0/dymo-code-linux-x86_64";
    f.http.setResponse(pinnedUrl, MockResponses::binary(1000000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(outcome.resolvedVersion == "v1.5.0");
    REQUIRE(f.http.callCount(kMetadataUrl) == 0);
    REQUIRE(f.http.callCount(pinnedUrl) == 1);
}

TEST_CASE("Release host retries with backoff before the mirror", "[pipeline]")
{
    PipelineFixture f;
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::http_error(503));
    f.http.setResponse(kMirrorUrl, MockResponses::binary(1000000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(f.http.callCount(kPrimaryUrl) == 3);
    REQUIRE(f.http.callCount(kMirrorUrl) == 1);
    REQUIRE(f.sleeps.size() == 2);
    REQUIRE(outcome.attempts.back().candidate.kind == SourceKind::Mirror);
}

TEST_CASE("Filesystem problems map to their own exit status", "[pipeline]")
{
    PipelineFixture f;
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1000000));

    SECTION("Install directory blocked by a file")
    {
        fs::create_directories(f.home / ".local");
        writeFile(f.home / ".local/bin", "");

        auto outcome = f.run();
        REQUIRE(outcome.code == ExitCode::FilesystemError);
        REQUIRE(f.http.callCount(kPrimaryUrl) == 0);
    }

    SECTION("Target path occupied by a directory")
    {
        fs::create_directories(f.target() / "nested");

        auto outcome = f.run();
        REQUIRE(outcome.code == ExitCode::FilesystemError);
        REQUIRE(outcome.message.find(f.target().string()) != std::string::npos);
    }
}

TEST_CASE("Staging file that cannot be written is a filesystem error", "[pipeline]")
{
    PipelineFixture f;
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1000000));
    f.http.setResponse(kMirrorUrl, MockResponses::binary(1000000));

    // A non-empty directory occupies the staging name
    fs::create_directories(f.staging() / "leftover");

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::FilesystemError);
    REQUIRE(outcome.message.find(f.staging().string()) != std::string::npos);
    REQUIRE(f.http.callCount(kPrimaryUrl) == 1);
    REQUIRE(f.http.callCount(kMirrorUrl) == 0);
    REQUIRE(f.sleeps.empty());
    REQUIRE(f.output.str().empty());
    REQUIRE(f.opened.empty());
    REQUIRE_FALSE(fs::exists(f.target()));
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Filesystem);
}

TEST_CASE("No usable source is a configuration error", "[pipeline]")
{
    PipelineFixture f;
    f.config.download.mirror_attempts = 0;
    f.http.setResponse(kMetadataUrl, MockResponses::http_error(403));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::UsageError);
    REQUIRE(outcome.message.find("mirror_attempts") != std::string::npos);
    REQUIRE(outcome.attempts.empty());
    REQUIRE(f.http.totalCalls() == 1);
    REQUIRE(f.output.str().empty());
    REQUIRE_FALSE(fs::exists(f.home / ".local"));
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Configuration);
}

TEST_CASE("Disabled mirror is fine when the release tag is known", "[pipeline]")
{
    PipelineFixture f;
    f.config.download.mirror_attempts = 0;
    f.config.install.modify_path = false;
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1000000));

    REQUIRE(f.run().code == ExitCode::Success);
    REQUIRE(f.http.callCount(kMirrorUrl) == 0);
}

TEST_CASE("PATH registration can be turned off", "[pipeline]")
{
    PipelineFixture f;
    f.config.install.modify_path = false;
    writeFile(f.home / ".bashrc", "# untouched\n");
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setResponse(kPrimaryUrl, MockResponses::binary(1000000));

    auto outcome = f.run();

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(readFile(f.home / ".bashrc") == "# untouched\n");
}

TEST_CASE("Windows hosts get the .exe artifact", "[pipeline]")
{
    PipelineFixture f;
    f.config.install.modify_path = false;
    f.http.setResponse(kMetadataUrl, MockResponses::release_latest("v2.0.0"));
    f.http.setPatternResponse("dymo-code-windows-x86_64.exe", MockResponses::binary(1000000));

    auto outcome = f.run(platform::HostInfo{ "MINGW64_NT-10.0-19045", "x86_64" });

    REQUIRE(outcome.code == ExitCode::Success);
    REQUIRE(outcome.artifactName == "dymo-code-windows-x86_64.exe");
    REQUIRE(outcome.installedPath == f.home / ".local/bin/dymo-code.exe");
}
