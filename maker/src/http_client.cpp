#include "http_client.hpp"
#include <curl/curl.h>
#include <cstring>

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {}

HttpResponse HttpClient::get(const std::string& url,
                             const std::vector<std::string>& headers) const {
    return perform("GET", url, nullptr, headers);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers) const {
    return perform("POST", url, &body, headers);
}

HttpResponse HttpClient::del(const std::string& url,
                             const std::string& body,
                             const std::vector<std::string>& headers) const {
    return perform("DELETE", url, &body, headers);
}

HttpResponse HttpClient::perform(const char* method,
                                 const std::string& url,
                                 const std::string* body,
                                 const std::vector<std::string>& headers) const {
    HttpResponse out;

    CURL* curl = curl_easy_init();
    if (!curl) {
        out.error = "curl init failed";
        return out;
    }

    struct curl_slist* hdrs = nullptr;
    for (const auto& h : headers) hdrs = curl_slist_append(hdrs, h.c_str());
    if (body) hdrs = curl_slist_append(hdrs, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (std::strcmp(method, "GET") == 0) {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        if (std::strcmp(method, "POST") != 0)
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    // TLS verify ON
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);

    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        out.error = std::string(method) + " " + url + ": " + curl_easy_strerror(rc);
    }
    return out;
}
