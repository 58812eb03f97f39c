#pragma once

#include <string>
#include <utility>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Blocking libcurl transport. Every request uses its own easy handle, so one
// client may be shared across threads.
class HttpClient {
public:
    explicit HttpClient(int timeout_ms, std::string user_agent = "blockscope/1.0");

    HttpResponse get(const std::string& url, const QueryParams& params = {});
    HttpResponse post_json(const std::string& url, const std::string& body);

    int timeout_ms() const { return timeout_ms_; }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);

    int timeout_ms_;
    std::string user_agent_;
};
