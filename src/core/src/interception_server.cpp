#include "ncf_interception_server.hpp"
#include "ncf_errors.hpp"
#include "ncf_logger.hpp"
#include "ncf_openssl.hpp"
#include "ncf_request_parser.hpp"
#include "ncf_thread_pool.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <set>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace ncf {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kLog = "server";
constexpr size_t kMaxHeadBytes = 8192;
constexpr int kAcceptPollMs = 200;
// TLS record header plus the largest plaintext record
constexpr size_t kMaxHelloBytes = 5 + 16384;
constexpr std::chrono::milliseconds kFallbackTimeout{1000};

int open_listener(const std::string& address, uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        throw ConfigurationError(std::string("socket: ") + std::strerror(errno));
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        throw ConfigurationError("invalid bind address " + address);
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw ConfigurationError("cannot bind " + address + ":" + std::to_string(port) +
                                 ": " + std::strerror(err));
    }
    if (listen(fd, SOMAXCONN) < 0) {
        int err = errno;
        close(fd);
        throw ConfigurationError(std::string("listen: ") + std::strerror(err));
    }
    return fd;
}

uint16_t bound_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

/// Milliseconds left until deadline, 0 once it has passed.
int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/// Wait for events on a non-blocking socket, never past deadline.
bool wait_io(int fd, short events, Clock::time_point deadline) {
    for (;;) {
        int left = remaining_ms(deadline);
        if (left == 0) return false;
        pollfd p{fd, events, 0};
        int rc = poll(&p, 1, left);
        if (rc < 0 && errno == EINTR) continue;
        return rc > 0;
    }
}

bool would_block() {
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

bool send_all(int fd, const std::string& data, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (would_block() && wait_io(fd, POLLOUT, deadline)) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool head_complete(const std::string& buf) {
    return buf.find("\r\n\r\n") != std::string::npos || buf.find("\n\n") != std::string::npos;
}

/// Read until the end of the request head, the size cap or the deadline.
std::string read_head(int fd, Clock::time_point deadline) {
    std::string buf;
    char chunk[2048];
    while (buf.size() < kMaxHeadBytes && !head_complete(buf)) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && would_block() && wait_io(fd, POLLIN, deadline)) continue;
        break;
    }
    return buf;
}

/**
 * @brief Peek at the first TLS record without consuming it
 *
 * SO_RCVLOWAT makes poll wait for the whole record rather than waking on
 * every byte the client trickles in. Returns what was buffered when the
 * record completed, the peer stopped sending, or the deadline passed.
 */
std::vector<uint8_t> peek_client_hello(int fd, Clock::time_point deadline) {
    std::vector<uint8_t> buf(kMaxHelloBytes);
    size_t want = 5;
    size_t have = 0;
    for (;;) {
        ssize_t n = recv(fd, buf.data(), buf.size(), MSG_PEEK);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && !would_block()) break;
        if (n == 0) break;
        if (n > 0) {
            have = static_cast<size_t>(n);
            if (have >= 5) {
                want = std::min(kMaxHelloBytes, 5 + ((static_cast<size_t>(buf[3]) << 8) | buf[4]));
            }
            if (have >= want) break;
        }

        int lowat = static_cast<int>(want);
        setsockopt(fd, SOL_SOCKET, SO_RCVLOWAT, &lowat, sizeof(lowat));
        pollfd p{fd, POLLIN | POLLRDHUP, 0};
        int left = remaining_ms(deadline);
        if (left == 0) break;
        int rc = poll(&p, 1, left);
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) break;
        if ((p.revents & (POLLRDHUP | POLLHUP | POLLERR)) && !(p.revents & POLLIN)) break;
        if (p.revents & POLLRDHUP) {
            // nothing more is coming; take one last look
            n = recv(fd, buf.data(), buf.size(), MSG_PEEK);
            if (n > 0) have = static_cast<size_t>(n);
            break;
        }
    }
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_RCVLOWAT, &one, sizeof(one));
    buf.resize(have);
    return buf;
}

/// Wait for whatever a non-blocking SSL call asked for.
bool ssl_retry(SSL* ssl, int rc, int fd, Clock::time_point deadline) {
    switch (SSL_get_error(ssl, rc)) {
    case SSL_ERROR_WANT_READ:
        return wait_io(fd, POLLIN, deadline);
    case SSL_ERROR_WANT_WRITE:
        return wait_io(fd, POLLOUT, deadline);
    default:
        return false;
    }
}

bool ssl_accept(SSL* ssl, int fd, Clock::time_point deadline) {
    int rc;
    while ((rc = SSL_accept(ssl)) != 1) {
        if (!ssl_retry(ssl, rc, fd, deadline)) return false;
    }
    return true;
}

std::string read_head(SSL* ssl, int fd, Clock::time_point deadline) {
    std::string buf;
    char chunk[2048];
    while (buf.size() < kMaxHeadBytes && !head_complete(buf)) {
        int n = SSL_read(ssl, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (!ssl_retry(ssl, n, fd, deadline)) break;
    }
    return buf;
}

bool ssl_write_all(SSL* ssl, int fd, const std::string& data, Clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        int n = SSL_write(ssl, data.data() + sent, static_cast<int>(data.size() - sent));
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (!ssl_retry(ssl, n, fd, deadline)) return false;
    }
    return true;
}

std::string peer_address(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

bool wait_readable(int fd, int timeout_ms) {
    pollfd p{fd, POLLIN, 0};
    int rc;
    do {
        rc = poll(&p, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);
    return rc > 0;
}

} // namespace

CertificateSelector make_cache_selector(std::shared_ptr<DomainCertificateCache> cache,
                                        std::string default_name) {
    return [cache, default_name](const std::string& server_name) {
        return cache->get(server_name.empty() ? default_name : server_name);
    };
}

// ==================== InterceptionServer::Impl ====================

struct InterceptionServer::Impl {
    ServerConfig config;
    CertificateSelector selector;

    std::atomic<bool> running{false};
    int http_fd = -1;
    int https_fd = -1;
    uint16_t http_bound = 0;
    uint16_t https_bound = 0;
    std::thread http_thread;
    std::thread https_thread;
    std::unique_ptr<ThreadPool> pool;
    SslCtxPtr ssl_ctx;

    mutable std::mutex policy_mtx;
    std::shared_ptr<const BlockRules> rules = std::make_shared<BlockRules>();
    AccessDecision access;

    mutable std::mutex stats_mtx;
    ServerStats stats;

    std::mutex conn_mtx;
    std::set<int> open_fds;

    template <typename F>
    void bump(F&& f) {
        std::lock_guard<std::mutex> lock(stats_mtx);
        f(stats);
    }

    void release(int fd, bool reset = false) {
        std::lock_guard<std::mutex> lock(conn_mtx);
        if (reset) {
            linger lg{1, 0};
            setsockopt(fd, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
        }
        open_fds.erase(fd);
        close(fd);
    }

    Clock::time_point deadline() const {
        return Clock::now() + config.connection_timeout;
    }

    // ---- TLS ----

    void init_tls() {
        if (!selector) return;
        ssl_ctx.reset(SSL_CTX_new(TLS_server_method()));
        if (!ssl_ctx) throw ConfigurationError("SSL_CTX_new failed: " + ossl::last_error());
        SSL_CTX_set_min_proto_version(ssl_ctx.get(), TLS1_2_VERSION);
        SSL_CTX_set_options(ssl_ctx.get(), SSL_OP_NO_COMPRESSION);
    }

    /// Install the certificate for server_name before the handshake starts.
    bool install_certificate(SSL* ssl, const std::string& server_name) {
        try {
            auto dc = selector(server_name);
            if (!dc || !dc->cert || !dc->key ||
                SSL_use_certificate(ssl, dc->cert.get()) != 1 ||
                SSL_use_PrivateKey(ssl, dc->key.get()) != 1) {
                throw CertificateError("cannot install certificate: " + ossl::last_error());
            }
            return true;
        } catch (const std::exception& e) {
            NCF_LOG_ERROR(kLog, "no certificate for '" + server_name + "': " + e.what());
            return false;
        }
    }

    void tls_failed(int fd) {
        bump([](ServerStats& s) { ++s.tls_failures; });
        release(fd, true);
    }

    // ---- request handling ----

    std::string respond(const std::string& host, const std::string& scheme,
                        const std::string& target, const std::string& client) {
        std::shared_ptr<const BlockRules> r;
        AccessDecision a;
        {
            std::lock_guard<std::mutex> lock(policy_mtx);
            r = rules;
            a = access;
        }
        BlockedRequestContext ctx = classifier::classify(host, scheme, *r, a);
        ctx.target = target.empty() || target[0] != '/' ? "/" : target;
        ctx.client_address = client;

        if (!ctx.blocked()) {
            bump([](ServerStats& s) { ++s.allowed; });
            NCF_LOG_DEBUG(kLog, client + " " + ctx.url() + " not blocked");
            return classifier::build_not_found_response();
        }
        bump([](ServerStats& s) { ++s.blocked; });
        NCF_LOG_INFO(kLog, client + " " + ctx.url() + " blocked (" + to_string(ctx.reason) +
                           ", " + ctx.category + ")");
        return classifier::build_block_response(ctx, config.block_page_url);
    }

    void handle_tls(int fd, const std::string& client, Clock::time_point until) {
        if (!ssl_ctx) {
            tls_failed(fd);
            return;
        }

        std::vector<uint8_t> hello = peek_client_hello(fd, until);
        if (!is_tls_client_hello(hello.data(), hello.size()) ||
            hello.size() < 5 + ((static_cast<size_t>(hello[3]) << 8) | hello[4])) {
            NCF_LOG_DEBUG(kLog, client + " sent no complete ClientHello");
            tls_failed(fd);
            return;
        }

        // A server_name that is present but not a host name is refused
        // before it can reach the certificate cache.
        std::string server_name;
        if (find_sni_hostname_offset(hello.data(), hello.size()) >= 0) {
            auto sni = extract_sni(hello.data(), hello.size());
            if (!sni) {
                NCF_LOG_WARN(kLog, client + " sent an invalid server name");
                tls_failed(fd);
                return;
            }
            server_name = *sni;
        }

        SslPtr ssl(SSL_new(ssl_ctx.get()));
        if (!ssl || SSL_set_fd(ssl.get(), fd) != 1 ||
            !install_certificate(ssl.get(), server_name)) {
            ssl.reset();
            tls_failed(fd);
            return;
        }
        if (!ssl_accept(ssl.get(), fd, until)) {
            NCF_LOG_DEBUG(kLog, client + " TLS handshake failed: " + ossl::last_error());
            ssl.reset();
            tls_failed(fd);
            return;
        }
        bump([](ServerStats& s) { ++s.tls_handshakes; });

        auto req = parse_http_request_head(read_head(ssl.get(), fd, until));
        std::string host = req && !req->host.empty() ? req->host : server_name;
        if (host.empty()) {
            bump([](ServerStats& s) { ++s.bad_requests; });
        } else {
            ssl_write_all(ssl.get(), fd, respond(host, "https", req ? req->target : "/", client),
                          until);
        }
        SSL_shutdown(ssl.get());
        ssl.reset();
        release(fd);
    }

    void handle_http(int fd, const std::string& client) {
        const Clock::time_point until = deadline();

        // A ClientHello redirected onto the plain port switches to TLS.
        uint8_t first = 0;
        ssize_t n;
        for (;;) {
            n = recv(fd, &first, 1, MSG_PEEK);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && would_block() && wait_io(fd, POLLIN, until)) continue;
            break;
        }
        if (n <= 0) {
            release(fd);
            return;
        }
        if (first == 0x16) {
            handle_tls(fd, client, until);
            return;
        }

        auto req = parse_http_request_head(read_head(fd, until));
        if (!req) {
            bump([](ServerStats& s) { ++s.bad_requests; });
            send_all(fd, "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n",
                     until);
            release(fd);
            return;
        }
        if (req->target == "/healthz" && (req->host.empty() || req->host == "localhost" ||
                                          req->host == "127.0.0.1")) {
            bump([](ServerStats& s) { ++s.health_checks; });
            send_all(fd, classifier::build_health_response(), until);
            release(fd);
            return;
        }
        std::string host = req->host.empty() ? "unknown" : req->host;
        send_all(fd, respond(host, "http", req->target, client), until);
        release(fd);
    }

    void accept_loop(int listen_fd, bool tls) {
        while (running.load()) {
            if (!wait_readable(listen_fd, kAcceptPollMs)) continue;

            sockaddr_in client_addr{};
            socklen_t addr_len = sizeof(client_addr);
            int fd = accept4(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &addr_len,
                             SOCK_CLOEXEC | SOCK_NONBLOCK);
            if (fd < 0) {
                if (!running.load()) break;
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(conn_mtx);
                open_fds.insert(fd);
            }
            bump([](ServerStats& s) { ++s.connections; });

            std::string client = peer_address(client_addr);
            bool queued = pool->try_post([this, fd, client, tls] {
                if (tls) handle_tls(fd, client, deadline());
                else handle_http(fd, client);
            });
            if (!queued) {
                bump([](ServerStats& s) { ++s.overflow_rejected; });
                NCF_LOG_WARN(kLog, "worker queue full, dropping " + client);
                release(fd);
            }
        }
    }
};

// ==================== InterceptionServer ====================

InterceptionServer::InterceptionServer(ServerConfig config, CertificateSelector selector)
    : impl_(std::make_unique<Impl>())
{
    impl_->config = std::move(config);
    impl_->selector = std::move(selector);
}

InterceptionServer::~InterceptionServer() {
    if (impl_->running.load()) stop(std::chrono::milliseconds(0));
}

void InterceptionServer::start() {
    if (impl_->running.load()) return;

    // Writes to a peer that went away must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    impl_->init_tls();
    impl_->http_fd = open_listener(impl_->config.bind_address, impl_->config.http_port);
    try {
        impl_->https_fd = open_listener(impl_->config.bind_address, impl_->config.https_port);
    } catch (...) {
        close(impl_->http_fd);
        impl_->http_fd = -1;
        throw;
    }
    impl_->http_bound = bound_port(impl_->http_fd);
    impl_->https_bound = bound_port(impl_->https_fd);

    impl_->pool = std::make_unique<ThreadPool>(impl_->config.workers, impl_->config.max_pending,
                                                 "server");
    impl_->running = true;
    impl_->http_thread = std::thread(&Impl::accept_loop, impl_.get(), impl_->http_fd, false);
    impl_->https_thread = std::thread(&Impl::accept_loop, impl_.get(), impl_->https_fd, true);

    NCF_LOG_INFO(kLog, "listening on " + impl_->config.bind_address + ":" +
                       std::to_string(impl_->http_bound) + " (http) and :" +
                       std::to_string(impl_->https_bound) + " (tls)");
}

void InterceptionServer::stop(std::chrono::milliseconds drain_timeout) {
    if (!impl_->running.exchange(false)) return;

    if (impl_->http_thread.joinable()) impl_->http_thread.join();
    if (impl_->https_thread.joinable()) impl_->https_thread.join();
    close(impl_->http_fd);
    close(impl_->https_fd);
    impl_->http_fd = impl_->https_fd = -1;

    if (!impl_->pool->wait_idle(drain_timeout)) {
        std::lock_guard<std::mutex> lock(impl_->conn_mtx);
        NCF_LOG_WARN(kLog, "drain timed out, closing " +
                           std::to_string(impl_->open_fds.size()) + " connections");
        for (int fd : impl_->open_fds) shutdown(fd, SHUT_RDWR);
    }
    impl_->pool->shutdown();
    impl_->pool.reset();
    impl_->ssl_ctx.reset();
    NCF_LOG_INFO(kLog, "stopped");
}

bool InterceptionServer::is_running() const {
    return impl_->running.load();
}

void InterceptionServer::set_block_rules(BlockRules rules) {
    auto snapshot = std::make_shared<const BlockRules>(std::move(rules));
    std::lock_guard<std::mutex> lock(impl_->policy_mtx);
    impl_->rules = std::move(snapshot);
}

void InterceptionServer::set_access(AccessDecision access) {
    std::lock_guard<std::mutex> lock(impl_->policy_mtx);
    impl_->access = std::move(access);
}

uint16_t InterceptionServer::http_port() const {
    return impl_->http_bound;
}

uint16_t InterceptionServer::https_port() const {
    return impl_->https_bound;
}

ServerStats InterceptionServer::stats() const {
    std::lock_guard<std::mutex> lock(impl_->stats_mtx);
    return impl_->stats;
}

// ==================== StaticResponder ====================

StaticResponder::StaticResponder(std::string bind_address, uint16_t port, Mode mode)
    : bind_address_(std::move(bind_address))
    , port_(port)
    , mode_(mode)
{
}

StaticResponder::~StaticResponder() {
    stop();
}

std::string StaticResponder::response() {
    const std::string body =
        "<!DOCTYPE html>\n<html>\n<head><title>Page Blocked</title></head>\n<body>\n"
        "<h1>Page Blocked</h1>\n<p>This page has been blocked by parental control.</p>\n"
        "</body>\n</html>\n";
    return "HTTP/1.1 403 Forbidden\r\nContent-Type: text/html; charset=utf-8\r\n"
           "Content-Length: " + std::to_string(body.size()) +
           "\r\nConnection: close\r\n\r\n" + body;
}

void StaticResponder::start() {
    if (running_.load()) return;
    std::signal(SIGPIPE, SIG_IGN);
    listen_fd_ = open_listener(bind_address_, port_);
    port_ = bound_port(listen_fd_);
    running_ = true;
    thread_ = std::thread(&StaticResponder::loop, this);
    NCF_LOG_WARN("fallback", std::string(mode_ == Mode::BlockPage ? "static responder serving"
                                                                   : "closing connections") +
                             " on port " + std::to_string(port_));
}

void StaticResponder::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    close(listen_fd_);
    listen_fd_ = -1;
}

void StaticResponder::loop() {
    const std::string reply = response();
    while (running_.load()) {
        if (!wait_readable(listen_fd_, kAcceptPollMs)) continue;
        int fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
        if (fd < 0) continue;
        if (mode_ == Mode::CloseOnly) {
            // a prompt reset instead of a handshake that hangs
            linger lg{1, 0};
            setsockopt(fd, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
        } else {
            const Clock::time_point until = Clock::now() + kFallbackTimeout;
            read_head(fd, until);
            send_all(fd, reply, until);
        }
        close(fd);
    }
}

// ==================== Health probe ====================

bool probe_http_health(const std::string& host, uint16_t port,
                       std::chrono::milliseconds timeout) {
    const Clock::time_point until = Clock::now() + timeout;
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, IPPROTO_TCP);
    if (fd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        return false;
    }

    int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        close(fd);
        return false;
    }
    if (rc < 0) {
        int err = 0;
        socklen_t len = sizeof(err);
        if (!wait_io(fd, POLLOUT, until) ||
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            close(fd);
            return false;
        }
    }

    bool healthy = false;
    if (send_all(fd, "GET /healthz HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n",
                 until)) {
        std::string reply = read_head(fd, until);
        healthy = reply.compare(0, 12, "HTTP/1.1 200") == 0;
    }
    close(fd);
    return healthy;
}

} // namespace ncf
