#include "http_transport.hpp"
#include "common/errors/errors.hpp"
#include "logger/Mylogger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace transport
{
    namespace
    {
        std::once_flag g_curl_init;

        size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            std::string *s = static_cast<std::string *>(userp);
            size_t totalSize = size * nmemb;
            s->append(static_cast<char *>(contents), totalSize);
            return totalSize;
        }

        struct CurlDeleter
        {
            void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };
    }

    CurlTransport::CurlTransport()
    {
        std::call_once(g_curl_init, []
                       { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    HttpResponse CurlTransport::post(const std::string &url, const Headers &headers,
                                     const std::string &body, std::chrono::seconds timeout)
    {
        return perform("POST", url, headers, &body, timeout);
    }

    HttpResponse CurlTransport::get(const std::string &url, const Headers &headers,
                                    std::chrono::seconds timeout)
    {
        return perform("GET", url, headers, nullptr, timeout);
    }

    HttpResponse CurlTransport::perform(const std::string &method, const std::string &url, const Headers &headers,
                                        const std::string *body, std::chrono::seconds timeout)
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
        {
            throw errors::TransportError("Failed to initialize CURL");
        }

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

        curl_slist *raw_headers = nullptr;
        for (const auto &[name, value] : headers)
        {
            raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
        }
        if (method == "POST")
        {
            // Lets the receiver refuse a bad key before the chunk body goes out
            raw_headers = curl_slist_append(raw_headers, "Expect: 100-continue");
        }
        std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

        if (method == "POST")
        {
            curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        }
        else
        {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        }

        CURLcode curlRes = curl_easy_perform(curl.get());
        if (curlRes != CURLE_OK)
        {
            std::string err = curl_easy_strerror(curlRes);
            MyLogger::debug(method + " " + url + " failed: " + err);
            throw errors::TransportError(method + " " + url + " failed: " + err);
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        char *content_type = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type != nullptr)
        {
            response.contentType = content_type;
        }
        return response;
    }
}
