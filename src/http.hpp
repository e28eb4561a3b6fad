#pragma once
#include <string>
#include <utility>
#include <vector>

namespace cronkit {

// Process-wide setup and teardown around all requests.
// No-ops for the socket client; global libcurl init elsewhere.
void http_init();
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 when the request never got a response
    std::string body;
    std::string error;      // transport failure description
};

// Injectable so the dispatcher can be tested without a network
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30,
                              bool verify_tls = true) = 0;
};

#ifdef __linux__

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      bool verify_tls = true) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      bool verify_tls = true) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// One blocking POST; transport errors land in HttpResponse::error
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 30,
                       bool verify_tls = true);

} // namespace cronkit
