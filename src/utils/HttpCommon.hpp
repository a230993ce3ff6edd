#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 45000;
    std::atomic<bool>* cancel_flag = nullptr;
};

enum class TransportError
{
    None,
    Network,
    Timeout
};

struct HttpResponse
{
    int status_code = 0;
    std::string text; // Body; raw bytes for binary transfers
    std::string error; // non-empty on network/transport errors
    TransportError transport_error = TransportError::None;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    bool timedOut() const { return transport_error == TransportError::Timeout; }
};

// (bytesNow, bytesTotal); total is 0 while unknown
using TransferProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // Text GET
    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;

    // Binary GET, body buffered in memory
    virtual HttpResponse getBinary(const std::string& url, const SessionConfig& cfg,
                                   const TransferProgressFn& onProgress) = 0;

    // Binary GET streamed straight into out; response text stays empty
    virtual HttpResponse download(const std::string& url, std::ofstream& out, const SessionConfig& cfg,
                                  const TransferProgressFn& onProgress) = 0;
};

class CprHttpClient final : public IHttpClient
{
public:
    explicit CprHttpClient(std::string userAgent = {});

    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;
    HttpResponse getBinary(const std::string& url, const SessionConfig& cfg,
                           const TransferProgressFn& onProgress) override;
    HttpResponse download(const std::string& url, std::ofstream& out, const SessionConfig& cfg,
                          const TransferProgressFn& onProgress) override;

private:
    std::string user_agent_;
};

} // namespace utils
