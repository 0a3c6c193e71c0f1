#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;   // transport failure (DNS, TLS, timeout); empty on success

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// Blocking libcurl calls with TLS verification and a hard per-call timeout.
// Never throws; failures are reported in HttpResponse.
class HttpClient {
public:
    explicit HttpClient(long timeout_ms = 10000);

    HttpResponse get(const std::string& url,
                     const std::vector<std::string>& headers = {}) const;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers = {}) const;

    HttpResponse del(const std::string& url,
                     const std::string& body,
                     const std::vector<std::string>& headers = {}) const;

private:
    HttpResponse perform(const char* method,
                         const std::string& url,
                         const std::string* body,
                         const std::vector<std::string>& headers) const;

    long timeout_ms_;
};
