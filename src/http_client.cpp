#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>

namespace rfpindex {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

// Owns the easy handle and header list for one request.
class CurlRequest {
public:
    CurlRequest() : curl_(curl_easy_init()) {
        if (!curl_) throw std::runtime_error("curl_easy_init failed");
    }
    ~CurlRequest() {
        if (headers_) curl_slist_free_all(headers_);
        curl_easy_cleanup(curl_);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    void add_header(const std::string& line) {
        struct curl_slist* next = curl_slist_append(headers_, line.c_str());
        if (!next) throw std::runtime_error("curl_slist_append failed");
        headers_ = next;
    }

    CURL* handle() const { return curl_; }
    struct curl_slist* headers() const { return headers_; }

private:
    CURL* curl_;
    struct curl_slist* headers_ = nullptr;
};

} // namespace

HttpResponse http_post_json(const std::string& url, const std::string& json_body,
                            const std::vector<std::string>& headers, long timeout_ms) {
    ensure_curl_global_init();

    CurlRequest request;
    request.add_header("Content-Type: application/json");
    for (const auto& h : headers) {
        request.add_header(h);
    }

    HttpResponse resp;
    std::string buf;

    CURL* curl = request.handle();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request.headers());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    resp.status = status;
    resp.body = std::move(buf);
    return resp;
}

} // namespace rfpindex
