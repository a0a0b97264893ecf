#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace transport
{
    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct HttpResponse
    {
        long status = 0;
        std::string contentType;
        std::string body;
    };

    // "Send bytes with headers to a URL and get a status code + body back."
    // Implementations throw errors::TransportError when no HTTP response was
    // received at all; any status code, including errors, is returned.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse post(const std::string &url, const Headers &headers,
                                  const std::string &body, std::chrono::seconds timeout) = 0;
        virtual HttpResponse get(const std::string &url, const Headers &headers,
                                 std::chrono::seconds timeout) = 0;
    };

    // libcurl easy-handle transport, one handle per request.
    class CurlTransport : public HttpTransport
    {
    public:
        CurlTransport();

        HttpResponse post(const std::string &url, const Headers &headers,
                          const std::string &body, std::chrono::seconds timeout) override;
        HttpResponse get(const std::string &url, const Headers &headers,
                         std::chrono::seconds timeout) override;

    private:
        HttpResponse perform(const std::string &method, const std::string &url, const Headers &headers,
                             const std::string *body, std::chrono::seconds timeout);
    };
}
