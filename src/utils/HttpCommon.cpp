#include "HttpCommon.hpp"

#include <cpr/cpr.h>

namespace
{

inline cpr::ProgressCallback make_progress(const utils::SessionConfig& cfg, const utils::TransferProgressFn& onProgress)
{
    std::atomic<bool>* cancel = cfg.cancel_flag;
    return cpr::ProgressCallback(
        [cancel, onProgress](cpr::cpr_pf_arg_t downloadTotal, cpr::cpr_pf_arg_t downloadNow, cpr::cpr_pf_arg_t,
                             cpr::cpr_pf_arg_t, intptr_t) -> bool
        {
            if (cancel && cancel->load())
                return false;
            if (onProgress && downloadNow >= 0)
            {
                onProgress(static_cast<std::uint64_t>(downloadNow),
                           downloadTotal > 0 ? static_cast<std::uint64_t>(downloadTotal) : 0);
            }
            return true;
        });
}

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg, const utils::TransferProgressFn& onProgress)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.cancel_flag || onProgress)
    {
        s.SetProgressCallback(make_progress(cfg, onProgress));
    }
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers, const std::string& userAgent)
{
    cpr::Header h;
    for (auto& kv : headers)
        h.emplace(kv.name, kv.value);
    // cpr::Header compares keys case-insensitively
    if (!userAgent.empty() && h.find("User-Agent") == h.end())
        h.emplace("User-Agent", userAgent);
    return h;
}

utils::HttpResponse to_response(cpr::Response&& r)
{
    utils::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? "transport error" : r.error.message;
        hr.transport_error = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT ? utils::TransportError::Timeout
                                                                                 : utils::TransportError::Network;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace utils
{

CprHttpClient::CprHttpClient(std::string userAgent)
    : user_agent_(std::move(userAgent))
{
}

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, user_agent_));
    apply_common(s, cfg, nullptr);
    return to_response(s.Get());
}

HttpResponse CprHttpClient::getBinary(const std::string& url, const SessionConfig& cfg,
                                      const TransferProgressFn& onProgress)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header({}, user_agent_));
    apply_common(s, cfg, onProgress);
    return to_response(s.Get());
}

HttpResponse CprHttpClient::download(const std::string& url, std::ofstream& out, const SessionConfig& cfg,
                                     const TransferProgressFn& onProgress)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header({}, user_agent_));
    apply_common(s, cfg, onProgress);
    return to_response(s.Download(out));
}

} // namespace utils
