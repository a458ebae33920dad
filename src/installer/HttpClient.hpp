#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace installer
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 300000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text; // body for get(); empty for download()
    std::string error; // non-empty on network/transport errors
    bool local_error = false; // error concerns the destination file, not the transfer

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Transport seam; tests substitute a scripted client
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;

    // Streams the response body into destPath (truncating it). The caller
    // decides what to do with the file when the response is not ok().
    virtual HttpResponse download(const std::string& url, const std::filesystem::path& destPath,
                                  const std::vector<Header>& headers, const SessionConfig& cfg) = 0;
};

// libcurl-backed client through cpr
class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;

    HttpResponse download(const std::string& url, const std::filesystem::path& destPath,
                          const std::vector<Header>& headers, const SessionConfig& cfg) override;
};

} // namespace installer
