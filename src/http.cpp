// libcurl client for platforms without the socket implementation.
#ifndef __linux__

#include "http.hpp"
#include "http_wire.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace cronkit {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

struct EasyDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

// curl_slist_append returns the list head, which only changes on the first append.
bool fill_headers(HeaderList& list, const std::vector<Header>& headers) {
    for (const auto& [name, value] : headers) {
        std::string line = name + ": " + value;
        curl_slist* head = curl_slist_append(list.get(), line.c_str());
        if (!head) return false;
        if (!list) list.reset(head);
    }
    return true;
}

} // namespace

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds,
                                  bool verify_tls) {
    return http_post(url, body, headers, timeout_seconds, verify_tls);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds,
                       bool verify_tls) {
    HttpResponse resp;
    EasyHandle curl(curl_easy_init());
    HeaderList header_list;
    if (!curl || !fill_headers(header_list, headers)) {
        resp.error = "Out of memory";
        return resp;
    }

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, "cronkit");
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, static_cast<long>(kMaxRedirects));
    curl_easy_setopt(h, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, verify_tls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, verify_tls ? 2L : 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.error = curl_easy_strerror(rc);
        resp.body.clear();
        return resp;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status_code);
    return resp;
}

} // namespace cronkit

#endif // !__linux__
