#pragma once

#include <chrono>
#include <string>

namespace lldb_cognitrace
{

enum class TransportError
{
    None,
    ConnectionFailed, // refused, unresolved host, reset
    Timeout,
    Other
};

struct HttpResponse
{
    long status_code = 0;
    std::string text;
    TransportError error = TransportError::None;
    std::string error_message;

    bool Ok() const { return error == TransportError::None; }
};

// Blocking HTTP client used for the inference round-trip
class HttpTransport
{
  public:
    virtual ~HttpTransport() = default;

    // POST a JSON body. Transport failures are reported in the response, not thrown.
    virtual HttpResponse PostJson(const std::string& url, const std::string& body,
                                  std::chrono::milliseconds timeout) = 0;
};

// libcurl implementation
class CurlTransport : public HttpTransport
{
  public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse PostJson(const std::string& url, const std::string& body,
                          std::chrono::milliseconds timeout) override;
};

} // namespace lldb_cognitrace
