// HTTP client on POSIX sockets and OpenSSL, built on Linux in place of
// libcurl. One POST per connection (Connection: close); redirects are
// followed up to kMaxRedirects hops.
#ifdef __linux__

#include "http.hpp"
#include "http_wire.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace cronkit {

void http_init() {}
void http_cleanup() {}

namespace {

// Owns the socket and, for https, the TLS session on top of it.
class Stream {
public:
    Stream() = default;
    ~Stream() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    bool open(const Endpoint& ep, long timeout_secs, bool verify_tls) {
        if (!connect_tcp(ep, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        return !ep.https || start_tls(ep.host, verify_tls);
    }

    bool send_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            const char* p = data.data() + sent;
            size_t left = data.size() - sent;
            ssize_t n = ssl_ ? SSL_write(ssl_, p, static_cast<int>(left))
                             : ::send(fd_, p, left, MSG_NOSIGNAL);
            if (n <= 0) {
                if (!ssl_ && n < 0 && errno == EINTR) continue;
                error_ = "Failed sending data to the peer";
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    // Everything until the peer closes. False on a read error or timeout.
    bool read_all(std::string& out) {
        char buf[4096];
        for (;;) {
            ssize_t n = ssl_ ? SSL_read(ssl_, buf, sizeof(buf))
                             : ::recv(fd_, buf, sizeof(buf), 0);
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) return true;
            if (ssl_) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return true;
                if (err == SSL_ERROR_WANT_READ) continue;
            } else if (errno == EINTR) {
                continue;
            }
            error_ = (errno == EAGAIN || errno == EWOULDBLOCK)
                ? "Operation timed out"
                : "Failure when receiving data from the peer";
            return false;
        }
    }

    const std::string& error() const { return error_; }

private:
    bool connect_tcp(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* addrs = nullptr;
        int rc = getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &addrs);
        if (rc != 0) {
            error_ = "Could not resolve host: " + ep.host;
            return false;
        }

        std::string reason;
        for (auto* ai = addrs; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai, timeout_secs, reason)) {
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(addrs);

        if (fd_ < 0) {
            error_ = "Failed to connect to " + ep.host + " port " + ep.port +
                     (reason.empty() ? "" : ": " + reason);
            return false;
        }
        return true;
    }

    static bool connect_with_timeout(int fd, const struct addrinfo* ai,
                                     long timeout_secs, std::string& reason) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                reason = std::strerror(errno);
                return false;
            }
            struct pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
            if (ready == 0) {
                reason = "Connection timed out";
                return false;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (ready < 0 || so_error != 0) {
                reason = std::strerror(ready < 0 ? errno : so_error);
                return false;
            }
        }

        fcntl(fd, F_SETFL, flags);
        return true;
    }

    bool start_tls(const std::string& host, bool verify_tls) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            error_ = "TLS context could not be created";
            return false;
        }
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_verify(ctx_, verify_tls ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            error_ = "TLS session could not be created";
            return false;
        }
        SSL_set_fd(ssl_, fd_);
        // IPv6 literals get no SNI and are verified as addresses
        bool ip_literal = host.find(':') != std::string::npos;
        if (!ip_literal) SSL_set_tlsext_host_name(ssl_, host.c_str());
        if (verify_tls) {
            int ok = ip_literal
                ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), host.c_str())
                : SSL_set1_host(ssl_, host.c_str());
            if (ok != 1) {
                error_ = "TLS peer name could not be set: " + host;
                return false;
            }
        }

        if (SSL_connect(ssl_) != 1) {
            char buf[256];
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            error_ = std::string("TLS handshake failed: ") + buf;
            return false;
        }
        return true;
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    std::string error_;
};

// A single exchange on a fresh connection
bool exchange(const Endpoint& ep, const std::string& body,
              const std::vector<Header>& headers, long timeout_seconds,
              bool verify_tls, WireResponse& wire, std::string& error) {
    Stream stream;
    if (!stream.open(ep, timeout_seconds, verify_tls) ||
        !stream.send_all(build_post(ep, body, headers))) {
        error = stream.error();
        return false;
    }

    std::string raw;
    bool complete = stream.read_all(raw);
    if (!parse_response(raw, wire)) {
        error = complete ? "Empty reply from server" : stream.error();
        return false;
    }
    return true;
}

} // namespace

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds,
                       bool verify_tls) {
    HttpResponse resp;
    std::string current = url;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        Endpoint ep;
        if (!parse_endpoint(current, ep, resp.error)) return resp;

        WireResponse wire;
        if (!exchange(ep, body, headers, timeout_seconds, verify_tls, wire, resp.error)) {
            return resp;
        }
        if (is_redirect(wire.status_code) && !wire.location.empty()) {
            current = resolve_location(ep, wire.location);
            continue;
        }
        resp.status_code = wire.status_code;
        resp.body = std::move(wire.body);
        return resp;
    }
    resp.error = "Maximum (" + std::to_string(kMaxRedirects) + ") redirects followed";
    return resp;
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds,
                                    bool verify_tls) {
    return http_post(url, body, headers, timeout_seconds, verify_tls);
}

} // namespace cronkit

#endif // __linux__
