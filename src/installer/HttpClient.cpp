#include "HttpClient.hpp"

#include <cpr/cpr.h>

#include <fstream>

namespace
{

inline void apply_common(cpr::Session& s, const installer::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    // Release assets are served through a redirect to the storage host
    s.SetRedirect(cpr::Redirect{ true });
}

inline cpr::Header make_header(const std::vector<installer::Header>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
    {
        h.emplace(kv.name, kv.value);
    }
    return h;
}

} // namespace

namespace installer
{

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

HttpResponse CprHttpClient::download(const std::string& url, const std::filesystem::path& destPath,
                                     const std::vector<Header>& headers, const SessionConfig& cfg)
{
    HttpResponse hr;

    std::ofstream outputFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outputFile.is_open())
    {
        hr.error = "Failed to create output file: " + destPath.string();
        hr.local_error = true;
        return hr;
    }

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    cpr::Response r = s.Download(outputFile);

    outputFile.close();
    if (outputFile.fail())
    {
        hr.error = "Failed to write output file: " + destPath.string();
        hr.local_error = true;
        return hr;
    }

    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }

    hr.status_code = static_cast<int>(r.status_code);
    return hr;
}

} // namespace installer
