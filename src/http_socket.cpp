// Linux HTTP/HTTPS client on POSIX sockets + OpenSSL.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

namespace engram {

void http_init() {}
void http_cleanup() {}

namespace {

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query
};

std::optional<Endpoint> parse_endpoint(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    Endpoint ep;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https") ep.tls = true;
    else if (scheme != "http") return std::nullopt;

    size_t authority = scheme_end + 3;
    size_t slash = url.find('/', authority);
    std::string host_port = url.substr(authority, slash == std::string::npos
                                                      ? std::string::npos
                                                      : slash - authority);
    ep.target = slash == std::string::npos ? "/" : url.substr(slash);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        ep.host = host_port.substr(0, colon);
        ep.port = host_port.substr(colon + 1);
    } else {
        ep.host = host_port;
        ep.port = ep.tls ? "443" : "80";
    }
    if (ep.host.empty()) return std::nullopt;
    return ep;
}

// Owns the socket and, for https, the TLS session on top of it.
class Stream {
public:
    Stream() = default;
    ~Stream() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    bool open(const Endpoint& ep, long timeout_secs) {
        if (!connect_tcp(ep, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!ep.tls) return true;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, ep.host.c_str());
        SSL_set1_host(ssl_, ep.host.c_str());
        return SSL_connect(ssl_) == 1;
    }

    bool send_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = ssl_ ? SSL_write(ssl_, p, static_cast<int>(left))
                             : ::send(fd_, p, left, MSG_NOSIGNAL);
            if (n <= 0) return false;
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    // >0 bytes read, 0 on orderly close, -1 on error or timeout
    ssize_t recv_some(char* buf, size_t len) {
        if (ssl_) {
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            return SSL_get_error(ssl_, n) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
        }
        return ::recv(fd_, buf, len, 0);
    }

private:
    bool connect_tcp(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res) != 0) return false;

        for (auto* ai = res; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc != 0 && errno == EINPROGRESS) {
                struct pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000)) == 1) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    rc = err == 0 ? 0 : -1;
                }
            }
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(res);
        return fd_ >= 0;
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// Buffered reader over a Stream for line and fixed-size reads.
class Reader {
public:
    explicit Reader(Stream& s) : stream_(s) {}

    bool line(std::string& out) {
        for (;;) {
            size_t nl = buf_.find('\n');
            if (nl != std::string::npos) {
                out = buf_.substr(0, nl);
                buf_.erase(0, nl + 1);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                return true;
            }
            if (!fill()) return false;
        }
    }

    bool exactly(size_t n, std::string& out) {
        while (buf_.size() < n) {
            if (!fill()) return false;
        }
        out.append(buf_, 0, n);
        buf_.erase(0, n);
        return true;
    }

    void rest(std::string& out) {
        while (fill()) {}
        out += buf_;
        buf_.clear();
    }

private:
    bool fill() {
        char chunk[8192];
        ssize_t n = stream_.recv_some(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buf_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    Stream& stream_;
    std::string buf_;
};

std::string lower_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

HttpResponse read_response(Stream& stream) {
    Reader reader(stream);
    std::string status_line;
    if (!reader.line(status_line)) return {};

    // "HTTP/1.1 200 OK"
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || status_line.size() < sp + 4) return {};
    long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
    if (status <= 0) return {};

    bool chunked = false;
    std::optional<size_t> content_length;
    std::string header;
    while (reader.line(header) && !header.empty()) {
        size_t colon = header.find(':');
        if (colon == std::string::npos) continue;
        std::string name = lower_ascii(header.substr(0, colon));
        std::string value = lower_ascii(header.substr(colon + 1));
        value.erase(0, value.find_first_not_of(" \t"));
        if (name == "transfer-encoding") {
            chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            content_length = static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
        }
    }

    HttpResponse resp;
    resp.status_code = status;
    if (chunked) {
        std::string size_line;
        while (reader.line(size_line)) {
            size_t size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (size == 0) break;
            std::string crlf;
            if (!reader.exactly(size, resp.body) || !reader.exactly(2, crlf)) break;
        }
    } else if (content_length) {
        reader.exactly(*content_length, resp.body);
    } else {
        reader.rest(resp.body);
    }
    return resp;
}

} // namespace

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    auto ep = parse_endpoint(url);
    if (!ep) return {};

    Stream stream;
    if (!stream.open(*ep, timeout_seconds)) return {};

    std::string request = "POST " + ep->target + " HTTP/1.1\r\n";
    request += "Host: " + ep->host + "\r\n";
    for (const auto& h : headers) {
        request += h.first + ": " + h.second + "\r\n";
    }
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;

    if (!stream.send_all(request)) return {};
    return read_response(stream);
}

} // namespace engram

#endif // __linux__
