#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace engram {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure (DNS, connect, timeout, abort)
    std::string body;
    std::string error;      // curl's description of a transport failure

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// libcurl-backed client
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};

// HTTP POST. Never throws: failures come back as status_code 0 with
// `error` set, or as the server's status code.
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 30);

} // namespace engram
