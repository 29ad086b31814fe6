#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace http {

// Appends received bytes to the std::string passed as userdata.
inline size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// One per process, created in main() before any other thread starts.
class CurlGlobalGuard {
public:
    CurlGlobalGuard() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalGuard() { curl_global_cleanup(); }

    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

struct Response {
    long status = 0;
    std::string body;
};

inline bool is_success(long status) {
    return status >= 200 && status < 300;
}

// Runs a prepared handle, collecting the body. Does not clean up the handle.
inline std::expected<Response, std::string> perform(CURL* curl, long timeout_s) {
    Response resp;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

inline std::expected<Response, std::string>
post_json(const std::string& url, const std::string& body, long timeout_s) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    auto result = perform(curl, timeout_s);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return result;
}

// application/x-www-form-urlencoded POST.
inline std::expected<Response, std::string>
post_form(const std::string& url,
          const std::vector<std::pair<std::string, std::string>>& fields,
          long timeout_s) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string body;
    for (auto& [key, value] : fields) {
        char* k = curl_easy_escape(curl, key.c_str(), static_cast<int>(key.size()));
        char* v = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!body.empty()) body += '&';
        body += k ? k : "";
        body += '=';
        body += v ? v : "";
        curl_free(k);
        curl_free(v);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    auto result = perform(curl, timeout_s);

    curl_easy_cleanup(curl);
    return result;
}

} // namespace http
