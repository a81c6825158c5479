#pragma once

#include <string>

struct HttpResponse {
    long status = 0;      // 0 when the request never completed
    std::string body;
    std::string error;    // Transport error message when status == 0

    bool transport_failed() const { return status == 0; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url, int timeout_ms) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "CoinLens/1.0");

    // Thread-safe: every call uses its own easy handle
    HttpResponse get(const std::string& url, int timeout_ms) override;

private:
    std::string user_agent_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
