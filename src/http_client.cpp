#include "http_client.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curl_init_flag;

CurlHandle make_handle() {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw NetworkError("Failed to initialize CURL");
    }
    return curl;
}

std::string escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw NetworkError("Failed to escape query parameter");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

} // namespace

HttpClient::HttpClient(int timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(std::move(user_agent))
{
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse HttpClient::get(const std::string& url, const QueryParams& params) {
    auto curl = make_handle();

    std::string full_url = url;
    char sep = full_url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        full_url += sep;
        full_url += escape(curl.get(), key) + "=" + escape(curl.get(), value);
        sep = '&';
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, full_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw NetworkError("GET " + url + " timed out after " + std::to_string(timeout_ms_) + "ms");
    }
    if (res != CURLE_OK) {
        throw NetworkError("GET " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body) {
    auto curl = make_handle();

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                       &curl_slist_free_all);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw NetworkError("POST " + url + " timed out after " + std::to_string(timeout_ms_) + "ms");
    }
    if (res != CURLE_OK) {
        spdlog::debug("POST {} failed: {}", url, curl_easy_strerror(res));
        throw NetworkError("POST " + url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
